#pragma once

#include "digester.hpp"
#include "disk_space.hpp"
#include "errors.hpp"
#include "object_store.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

namespace resplit {
namespace test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed with everything in it
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("resplit_test_" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

// Deterministic, non-repeating-per-chunk content
inline std::string pattern_bytes(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 251 + 7) % 256);
    }
    return data;
}

inline void write_file(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string sha1_of(const std::string& data) {
    EvpDigester digester("sha1");
    digester.update(data.data(), data.size());
    return digester.hex_final();
}

class FakeSpaceProbe : public SpaceProbe {
public:
    explicit FakeSpaceProbe(uint64_t available) : available(available) {}

    uint64_t available_bytes(const std::string&) override {
        ++calls;
        return available;
    }

    uint64_t available;
    int calls = 0;
};

// In-memory object store keyed by name, hashing uploads with sha1
class FakeObjectStore : public ObjectStore {
public:
    void check_available() override {
        if (!reachable) {
            throw RemoteUnavailable("fake store unreachable");
        }
    }

    std::string digest_algorithm() const override { return algorithm; }

    std::optional<std::string> fetch_digest(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches;
        if (fail_fetch) {
            throw RemoteError("fetch failed for " + name);
        }
        auto it = objects.find(name);
        if (it == objects.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void upload(const std::string& local_path, const std::string& name) override {
        std::string data = read_file(local_path);
        std::lock_guard<std::mutex> lock(mutex_);
        ++uploads;
        if (fail_upload) {
            throw RemoteError("upload failed for " + name);
        }
        if (throw_unexpected) {
            throw std::runtime_error("transport crashed uploading " + name);
        }
        objects[name] = corrupt_uploads ? std::string(40, '0') : sha1_of(data);
    }

    std::map<std::string, std::string> objects;
    std::string algorithm = "sha1";
    bool reachable = true;
    bool fail_fetch = false;
    bool fail_upload = false;
    bool corrupt_uploads = false;
    // Raises something outside the Error hierarchy
    bool throw_unexpected = false;
    std::atomic<int> fetches{0};
    std::atomic<int> uploads{0};

private:
    std::mutex mutex_;
};

} // namespace test
} // namespace resplit
