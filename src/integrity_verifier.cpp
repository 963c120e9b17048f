#include "integrity_verifier.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>

namespace resplit {

IntegrityVerifier::IntegrityVerifier(const ChunkLayout& layout, ByteRangeReader& source, DigestCache& cache)
    : layout_(layout), source_(source), cache_(cache) {}

std::optional<std::string> IntegrityVerifier::verify_boundary(const Inventory& inventory) {
    if (!inventory.last_index) {
        return std::nullopt;
    }

    const ChunkFile& boundary = inventory.present.at(*inventory.last_index);
    std::string filename = std::filesystem::path(boundary.path).filename().string();
    std::cout << "[Verifier] Verifying integrity of last chunk: " << filename << std::endl;

    // A digest of unverified content is not persisted, it would outlive a corrupt chunk
    std::optional<std::string> cached = cache_.cached_digest(boundary.path);
    std::string chunk_digest = cached ? *cached : cache_.compute(boundary.path);

    ChunkSpec spec = layout_.spec(boundary.index);
    std::string source_digest = digest_range(cache_.digester(), source_, spec.offset, spec.length,
                                             "source range of " + filename);

    if (chunk_digest != source_digest) {
        throw IntegrityMismatchError(boundary.path, chunk_digest, source_digest);
    }

    if (!cached) {
        cache_.store(boundary.path, chunk_digest);
    }
    std::cout << "[Verifier] Last chunk integrity verified successfully." << std::endl;
    return chunk_digest;
}

} // namespace resplit
