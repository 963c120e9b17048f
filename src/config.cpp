#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace resplit {

void RunConfiguration::validate() const {
    if (source_path.empty() || output_dir.empty()) {
        throw ConfigError("SOURCE_FILE and OUTPUT_DIR are required");
    }
    if (chunk_size_bytes == 0) {
        throw ConfigError("Chunk size must be a positive integer");
    }
    if (prefix.empty() || prefix.find('/') != std::string::npos) {
        throw ConfigError("Prefix must be non-empty and must not contain '/'");
    }
    if (sync) {
        if (bucket.empty()) {
            throw ConfigError("Bucket name is required when using --upload-b2");
        }
        if (remote_prefix.empty()) {
            throw ConfigError("Remote path is required when using --upload-b2");
        }
    }
    if (sync_workers == 0) {
        throw ConfigError("Sync worker count must be at least 1");
    }
}

uint64_t parse_size(const std::string& text, uint64_t default_unit) {
    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        throw ConfigError("Invalid size '" + text + "': expected a non-negative integer");
    }

    uint64_t unit = default_unit;
    std::string suffix = text.substr(digits);
    if (suffix == "B" || suffix == "b") {
        unit = 1;
    } else if (suffix == "K" || suffix == "k") {
        unit = 1024ULL;
    } else if (suffix == "M" || suffix == "m") {
        unit = 1024ULL * 1024;
    } else if (suffix == "G" || suffix == "g") {
        unit = GIB;
    } else if (suffix == "T" || suffix == "t") {
        unit = GIB * 1024;
    } else if (!suffix.empty()) {
        throw ConfigError("Invalid size unit in '" + text + "'");
    }

    uint64_t value = 0;
    try {
        value = std::stoull(text.substr(0, digits));
    } catch (const std::out_of_range&) {
        throw ConfigError("Size '" + text + "' is too large");
    }
    if (value != 0 && unit > std::numeric_limits<uint64_t>::max() / value) {
        throw ConfigError("Size '" + text + "' is too large");
    }
    return value * unit;
}

size_t parse_count(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigError("Invalid count '" + text + "': expected a plain non-negative integer");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError("Count '" + text + "' is too large");
    }
    if (value > std::numeric_limits<size_t>::max()) {
        throw ConfigError("Count '" + text + "' is too large");
    }
    return static_cast<size_t>(value);
}

RunConfiguration parse_arguments(int argc, char* argv[]) {
    RunConfiguration config;
    std::vector<std::string> positional;

    auto value_of = [&](int& i, const std::string& option) {
        if (i + 1 >= argc) {
            throw ConfigError("Option " + option + " requires a value");
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--prefix") {
            config.prefix = value_of(i, arg);
        } else if (arg == "-s" || arg == "--size") {
            config.chunk_size_bytes = parse_size(value_of(i, arg), GIB);
        } else if (arg == "-b" || arg == "--buffer") {
            config.safety_buffer_bytes = parse_size(value_of(i, arg), GIB);
        } else if (arg == "--upload-b2" || arg == "--sync") {
            config.sync = true;
            config.bucket = value_of(i, arg);
            config.remote_prefix = value_of(i, arg);
        } else if (arg == "--store-root") {
            config.store_root = value_of(i, arg);
        } else if (arg == "--digest") {
            config.digest = value_of(i, arg);
        } else if (arg == "--sync-workers") {
            config.sync_workers = parse_count(value_of(i, arg));
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ConfigError("Unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2) {
        throw ConfigError("Too many arguments");
    }
    if (positional.size() > 0) {
        config.source_path = positional[0];
    }
    if (positional.size() > 1) {
        config.output_dir = positional[1];
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [OPTIONS] SOURCE_FILE OUTPUT_DIR\n"
        << "\n"
        << "Split a large file into smaller chunks with resume capability.\n"
        << "\n"
        << "OPTIONS:\n"
        << "    -p, --prefix PREFIX              Prefix for chunk filenames (default: split_)\n"
        << "    -s, --size SIZE                  Chunk size, GiB unless suffixed B/K/M/G/T (default: 8)\n"
        << "    -b, --buffer SIZE                Safety buffer, same units (default: 2)\n"
        << "    --upload-b2 BUCKET REMOTE_PATH   Sync chunks to BUCKET under REMOTE_PATH, deleting\n"
        << "                                     local chunks once the remote copy is verified\n"
        << "    --store-root DIR                 Directory holding the bucket (default: .)\n"
        << "    --digest NAME                    Digest for sidecars and verification (default: sha1)\n"
        << "    --sync-workers N                 Verify/upload up to N chunks at once (default: 1)\n"
        << "    -h, --help                       Show this help message\n"
        << "\n"
        << "EXAMPLES:\n"
        << "    " << program << " /path/to/large.file /path/to/output/\n"
        << "    " << program << " -p backup_ -s 4 -b 1 /data/file.img /backup/chunks/\n"
        << "    " << program << " --upload-b2 my-bucket backups/ --store-root /mnt/b2 /file.img /chunks/\n";
    return out.str();
}

} // namespace resplit
