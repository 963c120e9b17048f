#pragma once

#include "digester.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace resplit {

// "<chunk>.<extension>", e.g. split_ab.sha1
std::string sidecar_path(const std::string& chunk_path, const std::string& extension);

// Reads the "<hex>  <filename>" sidecar. Missing or malformed records yield no value.
std::optional<std::string> read_digest_record(const std::string& sidecar, size_t hex_length);

// Writes the record under a temporary name and renames it into place.
// Throws IoError on failure.
void write_digest_record(const std::string& sidecar, const std::string& hex_digest,
                         const std::string& chunk_filename);

// Local chunk digests backed by the persisted sidecars. A sidecar, once written,
// is authoritative and is only recomputed when it is absent or malformed.
class DigestCache {
public:
    explicit DigestCache(Digester& digester);

    // Sidecar digest if there is one, else hash the chunk and persist a sidecar
    std::string local_digest(const std::string& chunk_path);

    // Hashes the chunk and overwrites its sidecar, for a chunk just written
    std::string refresh(const std::string& chunk_path);

    // Hashes the chunk without persisting anything
    std::string compute(const std::string& chunk_path);
    void store(const std::string& chunk_path, const std::string& digest);

    // Removes a sidecar left over from an earlier chunk at the same path.
    // Throws IoError if it exists and cannot be removed.
    void discard(const std::string& chunk_path);

    // Sidecar digest only, never touches the chunk itself
    std::optional<std::string> cached_digest(const std::string& chunk_path) const;

    std::string sidecar_for(const std::string& chunk_path) const;
    Digester& digester() { return digester_; }

private:
    Digester& digester_;
};

} // namespace resplit
