#include "chunk_addressing.hpp"
#include <limits>
#include <stdexcept>

namespace resplit {

namespace {
const uint64_t ALPHABET = 26;
// 26^13 still fits in 64 bits, 26^14 does not
const size_t MAX_EXACT_WIDTH = 13;
}

uint64_t suffix_capacity(size_t width) {
    if (width > MAX_EXACT_WIDTH) {
        return std::numeric_limits<uint64_t>::max();
    }
    uint64_t capacity = 1;
    for (size_t i = 0; i < width; ++i) {
        capacity *= ALPHABET;
    }
    return capacity;
}

size_t suffix_width_for(uint64_t total_chunks) {
    size_t width = MIN_SUFFIX_WIDTH;
    while (suffix_capacity(width) < total_chunks) {
        ++width;
    }
    return width;
}

std::string suffix_for(uint64_t index, size_t width) {
    if (width == 0 || index >= suffix_capacity(width)) {
        throw std::out_of_range("Chunk index " + std::to_string(index) +
                                " does not fit in a suffix of " + std::to_string(width) + " letters");
    }
    std::string suffix(width, 'a');
    for (size_t pos = width; pos-- > 0;) {
        suffix[pos] = static_cast<char>('a' + index % ALPHABET);
        index /= ALPHABET;
    }
    return suffix;
}

std::optional<uint64_t> index_for(const std::string& suffix) {
    if (suffix.empty() || suffix.length() > MAX_EXACT_WIDTH) {
        return std::nullopt;
    }
    uint64_t index = 0;
    for (char c : suffix) {
        if (c < 'a' || c > 'z') {
            return std::nullopt;
        }
        index = index * ALPHABET + static_cast<uint64_t>(c - 'a');
    }
    return index;
}

} // namespace resplit
