#pragma once

#include "chunk_layout.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace resplit {

// A chunk file found in the output directory
struct ChunkFile {
    uint64_t index;
    std::string path;
    uint64_t size;
};

struct Inventory {
    std::map<uint64_t, ChunkFile> present;
    std::optional<uint64_t> last_index;
    // Absent indices below last_index (moved away to free space, or lost)
    std::vector<uint64_t> missing;

    uint64_t resume_index() const { return last_index ? *last_index + 1 : 0; }
};

// Discovers and structurally validates the chunks of one output directory
class ChunkInventory {
public:
    ChunkInventory(const std::string& output_dir, const std::string& prefix, const ChunkLayout& layout);

    // Lists "<prefix><suffix>" files whose suffix has the layout's width.
    // Sidecars and other files sharing the prefix are skipped.
    Inventory scan() const;

    // Throws SizeMismatchError for the first present chunk whose length
    // differs from what its position requires
    void validate(const Inventory& inventory) const;

    std::string chunk_path(uint64_t index) const;
    const std::string& output_dir() const { return output_dir_; }
    const std::string& prefix() const { return prefix_; }

private:
    std::string output_dir_;
    std::string prefix_;
    const ChunkLayout& layout_;
};

} // namespace resplit
