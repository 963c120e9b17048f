#include "chunk_layout.hpp"
#include "chunk_addressing.hpp"
#include "errors.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace resplit {

SourceFile scan_source(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw SourceUnavailable("Source file " + path + " not found!");
    }
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        throw SourceUnavailable("Could not determine size of " + path + ": " + ec.message());
    }
    return SourceFile{path, size};
}

ChunkLayout::ChunkLayout(uint64_t source_size, uint64_t chunk_size)
    : source_size_(source_size),
      chunk_size_(chunk_size),
      total_chunks_(0),
      suffix_width_(MIN_SUFFIX_WIDTH) {
    if (chunk_size_ == 0) {
        throw ConfigError("Chunk size must be a positive integer");
    }
    total_chunks_ = source_size_ / chunk_size_ + (source_size_ % chunk_size_ != 0 ? 1 : 0);
    suffix_width_ = suffix_width_for(total_chunks_);
}

uint64_t ChunkLayout::expected_length(uint64_t index) const {
    if (index >= total_chunks_) {
        return 0;
    }
    uint64_t remaining = source_size_ - index * chunk_size_;
    return remaining >= chunk_size_ ? chunk_size_ : remaining;
}

ChunkSpec ChunkLayout::spec(uint64_t index) const {
    if (index >= total_chunks_) {
        throw std::out_of_range("Chunk index " + std::to_string(index) + " is past the end of the source (" +
                                std::to_string(total_chunks_) + " chunks)");
    }
    return ChunkSpec{index, suffix(index), index * chunk_size_, expected_length(index)};
}

std::string ChunkLayout::suffix(uint64_t index) const {
    return suffix_for(index, suffix_width_);
}

std::string ChunkLayout::chunk_name(const std::string& prefix, uint64_t index) const {
    return prefix + suffix(index);
}

} // namespace resplit
