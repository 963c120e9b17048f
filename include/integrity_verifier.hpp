#pragma once

#include "byte_range_reader.hpp"
#include "chunk_inventory.hpp"
#include "chunk_layout.hpp"
#include "digest_record.hpp"
#include <optional>
#include <string>

namespace resplit {

// Checks the content of the boundary chunk (the highest present index) against
// the source. Lower chunks were the boundary of an earlier run and were checked then.
class IntegrityVerifier {
public:
    IntegrityVerifier(const ChunkLayout& layout, ByteRangeReader& source, DigestCache& cache);

    // Returns the verified digest, or no value when no chunk is present.
    // Throws IntegrityMismatchError if chunk and source range differ.
    std::optional<std::string> verify_boundary(const Inventory& inventory);

private:
    const ChunkLayout& layout_;
    ByteRangeReader& source_;
    DigestCache& cache_;
};

} // namespace resplit
