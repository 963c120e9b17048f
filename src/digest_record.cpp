#include "digest_record.hpp"
#include "errors.hpp"
#include "resplit/hex_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace resplit {

std::string sidecar_path(const std::string& chunk_path, const std::string& extension) {
    return chunk_path + "." + extension;
}

std::optional<std::string> read_digest_record(const std::string& sidecar, size_t hex_length) {
    std::ifstream file(sidecar);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string line;
    std::getline(file, line);
    std::istringstream fields(line);
    std::string digest;
    fields >> digest;
    if (!hex::is_hex(digest, hex_length)) {
        return std::nullopt;
    }
    return hex::normalize(digest);
}

void write_digest_record(const std::string& sidecar, const std::string& hex_digest,
                         const std::string& chunk_filename) {
    std::string tmp_path = sidecar + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw IoError("Could not create digest record " + tmp_path);
        }
        file << hex_digest << "  " << chunk_filename << "\n";
        file.flush();
        if (!file) {
            throw IoError("Could not write digest record " + tmp_path);
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, sidecar, ec);
    if (ec) {
        throw IoError("Could not move digest record into place at " + sidecar + ": " + ec.message());
    }
}

DigestCache::DigestCache(Digester& digester) : digester_(digester) {}

std::string DigestCache::sidecar_for(const std::string& chunk_path) const {
    return sidecar_path(chunk_path, digester_.algorithm());
}

std::optional<std::string> DigestCache::cached_digest(const std::string& chunk_path) const {
    return read_digest_record(sidecar_for(chunk_path), digester_.hex_length());
}

std::string DigestCache::compute(const std::string& chunk_path) {
    std::cout << "[DigestCache] Computing " << digester_.algorithm() << " hash for "
              << fs::path(chunk_path).filename().string() << "..." << std::endl;
    return digest_file(digester_, chunk_path);
}

void DigestCache::store(const std::string& chunk_path, const std::string& digest) {
    // Never deleted afterwards, the sidecar outlives the chunk
    write_digest_record(sidecar_for(chunk_path), digest, fs::path(chunk_path).filename().string());
}

std::string DigestCache::local_digest(const std::string& chunk_path) {
    if (auto cached = cached_digest(chunk_path)) {
        return *cached;
    }
    return refresh(chunk_path);
}

std::string DigestCache::refresh(const std::string& chunk_path) {
    std::string digest = compute(chunk_path);
    store(chunk_path, digest);
    return digest;
}

void DigestCache::discard(const std::string& chunk_path) {
    std::error_code ec;
    fs::remove(sidecar_for(chunk_path), ec);
    if (ec) {
        throw IoError("Could not remove stale digest record " + sidecar_for(chunk_path) + ": " + ec.message());
    }
}

} // namespace resplit
