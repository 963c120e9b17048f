#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

namespace resplit {

// split(1) compatible suffixes: "aa", "ab", ..., "az", "ba", ...
const size_t MIN_SUFFIX_WIDTH = 2;

// Number of distinct suffixes of the given width (26^width, saturating).
uint64_t suffix_capacity(size_t width);

// Smallest width >= MIN_SUFFIX_WIDTH that can address total_chunks chunks.
size_t suffix_width_for(uint64_t total_chunks);

// Base-26 lowercase suffix, most significant letter first.
// Throws std::out_of_range if index does not fit in `width` letters.
std::string suffix_for(uint64_t index, size_t width = MIN_SUFFIX_WIDTH);

// Inverse of suffix_for(). Empty input or anything but 'a'..'z' yields no value.
std::optional<uint64_t> index_for(const std::string& suffix);

} // namespace resplit
