#pragma once

#include "byte_range_reader.hpp"
#include "chunk_layout.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

namespace resplit {

// Block size used when copying a byte range into a chunk
const size_t COPY_BLOCK_SIZE = 4 * 1024 * 1024;

// Extracts one byte range of the source into a new chunk file
class ChunkWriter {
public:
    ChunkWriter(const ChunkLayout& layout, ByteRangeReader& source);

    // Returns false when index lies past the end of the source (nothing to create).
    // Throws IoError if path already exists and CopyFailure if fewer than the
    // expected bytes end up in the file. A partial file is never cleaned up.
    bool write(uint64_t index, const std::string& path);

private:
    const ChunkLayout& layout_;
    ByteRangeReader& source_;
};

} // namespace resplit
