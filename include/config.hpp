#pragma once

#include "disk_space.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

namespace resplit {

struct RunConfiguration {
    std::string source_path;
    std::string output_dir;
    std::string prefix = "split_";
    uint64_t chunk_size_bytes = 8 * GIB;
    uint64_t safety_buffer_bytes = 2 * GIB;
    std::string digest = "sha1";

    // Remote sync
    bool sync = false;
    std::string bucket;
    std::string remote_prefix;
    std::string store_root = ".";
    size_t sync_workers = 1;

    bool show_help = false;

    // Throws ConfigError. Touches no files.
    void validate() const;
};

// Parses "8", "8G", "512M", "4096B", ... Bare numbers are in `default_unit` bytes.
uint64_t parse_size(const std::string& text, uint64_t default_unit);

// Digits only, unit suffixes are rejected
size_t parse_count(const std::string& text);

// Throws ConfigError for unknown options, missing values and extra arguments
RunConfiguration parse_arguments(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace resplit
