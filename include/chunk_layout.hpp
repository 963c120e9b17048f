#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace resplit {

struct SourceFile {
    std::string path;
    uint64_t size;
};

// Reads the source size once. Throws SourceUnavailable if it is not a regular file.
SourceFile scan_source(const std::string& path);

// One contiguous byte range of the source
struct ChunkSpec {
    uint64_t index;
    std::string suffix;
    uint64_t offset;
    uint64_t length;
};

// Maps chunk indices onto the byte ranges of a source of fixed size.
class ChunkLayout {
public:
    ChunkLayout(uint64_t source_size, uint64_t chunk_size);

    uint64_t source_size() const { return source_size_; }
    uint64_t chunk_size() const { return chunk_size_; }
    uint64_t total_chunks() const { return total_chunks_; }
    size_t suffix_width() const { return suffix_width_; }

    // chunk_size for every chunk but the last; 0 past the end of the source
    uint64_t expected_length(uint64_t index) const;

    // Throws std::out_of_range if index >= total_chunks()
    ChunkSpec spec(uint64_t index) const;

    std::string suffix(uint64_t index) const;
    std::string chunk_name(const std::string& prefix, uint64_t index) const;

private:
    uint64_t source_size_;
    uint64_t chunk_size_;
    uint64_t total_chunks_;
    size_t suffix_width_;
};

} // namespace resplit
