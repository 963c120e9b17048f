#include "chunk_inventory.hpp"
#include "chunk_addressing.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace resplit {

ChunkInventory::ChunkInventory(const std::string& output_dir, const std::string& prefix,
                               const ChunkLayout& layout)
    : output_dir_(output_dir), prefix_(prefix), layout_(layout) {}

std::string ChunkInventory::chunk_path(uint64_t index) const {
    return (fs::path(output_dir_) / layout_.chunk_name(prefix_, index)).string();
}

Inventory ChunkInventory::scan() const {
    Inventory inventory;

    std::error_code ec;
    fs::directory_iterator it(output_dir_, ec);
    if (ec) {
        throw SourceUnavailable("Output directory " + output_dir_ + " not readable: " + ec.message());
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, prefix_.size(), prefix_) != 0) {
            continue;
        }
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }

        std::string suffix = name.substr(prefix_.size());
        auto index = index_for(suffix);
        if (!index) {
            // sidecars, temp files, anything else sharing the prefix
            continue;
        }
        if (suffix.size() != layout_.suffix_width()) {
            std::cerr << "[Inventory] WARNING: ignoring " << name << ", suffix width differs from "
                      << layout_.suffix_width() << " used for this source" << std::endl;
            continue;
        }

        uint64_t size = entry.file_size(type_ec);
        if (type_ec) {
            throw IoError("Could not stat " + entry.path().string() + ": " + type_ec.message());
        }
        inventory.present[*index] = ChunkFile{*index, entry.path().string(), size};
    }

    if (!inventory.present.empty()) {
        inventory.last_index = inventory.present.rbegin()->first;
        for (uint64_t i = 0; i < *inventory.last_index; ++i) {
            if (inventory.present.count(i) == 0) {
                inventory.missing.push_back(i);
            }
        }
    }
    return inventory;
}

void ChunkInventory::validate(const Inventory& inventory) const {
    for (const auto& [index, chunk] : inventory.present) {
        // Past the end of the source no chunk is expected, not even an empty one
        if (index >= layout_.total_chunks()) {
            throw SizeMismatchError(chunk.path, 0, chunk.size);
        }
        uint64_t expected = layout_.expected_length(index);
        if (chunk.size != expected) {
            throw SizeMismatchError(chunk.path, expected, chunk.size);
        }
    }
}

} // namespace resplit
