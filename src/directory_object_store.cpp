#include "directory_object_store.hpp"
#include "errors.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace resplit {

namespace {

const size_t UPLOAD_BLOCK_SIZE = 4 * 1024 * 1024;
const char* INFO_EXTENSION = ".objinfo";

bool is_safe_name(const std::string& name) {
    if (name.empty() || name.front() == '/') {
        return false;
    }
    for (const auto& part : fs::path(name)) {
        if (part.string() == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

DirectoryObjectStore::DirectoryObjectStore(const std::string& root, const std::string& bucket,
                                           const std::string& digest_name)
    : bucket_dir_(fs::path(root) / bucket),
      bucket_(bucket),
      digester_(make_digester(digest_name)) {}

std::string DirectoryObjectStore::digest_algorithm() const {
    return digester_->algorithm();
}

fs::path DirectoryObjectStore::object_path(const std::string& name) const {
    if (!is_safe_name(name)) {
        throw RemoteError("Invalid object name: " + name);
    }
    return bucket_dir_ / name;
}

fs::path DirectoryObjectStore::info_path(const std::string& name) const {
    fs::path path = object_path(name);
    path += INFO_EXTENSION;
    return path;
}

void DirectoryObjectStore::check_available() {
    if (bucket_.empty() || bucket_.find('/') != std::string::npos || bucket_ == "..") {
        throw RemoteUnavailable("Invalid bucket name: '" + bucket_ + "'");
    }
    std::error_code ec;
    if (!fs::is_directory(bucket_dir_, ec)) {
        throw RemoteUnavailable("Bucket " + bucket_ + " not found at " + bucket_dir_.string());
    }

    // Writable check, the store is useless for uploads otherwise
    fs::path probe = bucket_dir_ / ".resplit-probe";
    {
        std::ofstream out(probe);
        if (!out.is_open()) {
            throw RemoteUnavailable("Bucket " + bucket_ + " at " + bucket_dir_.string() + " is not writable");
        }
    }
    fs::remove(probe, ec);
    std::cout << "[ObjectStore] Bucket " << bucket_ << " is available at " << bucket_dir_.string() << std::endl;
}

std::optional<ObjectInfo> DirectoryObjectStore::load_info(const std::string& name) const {
    fs::path path = info_path(name);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    ObjectInfo info;
    if (!info.ParseFromIstream(&file)) {
        throw RemoteError("Corrupt object record " + path.string());
    }
    return info;
}

std::optional<std::string> DirectoryObjectStore::fetch_digest(const std::string& name) {
    auto info = load_info(name);
    if (!info) {
        return std::nullopt;
    }

    // An object without a usable digest counts as absent, it gets re-uploaded
    if (info->digest().empty() || info->digest_algorithm() != digester_->algorithm()) {
        return std::nullopt;
    }
    std::error_code ec;
    uint64_t size = fs::file_size(object_path(name), ec);
    if (ec || size != info->size()) {
        return std::nullopt;
    }
    return info->digest();
}

void DirectoryObjectStore::upload(const std::string& local_path, const std::string& name) {
    fs::path target = object_path(name);
    fs::path partial = target;
    partial += ".partial";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw RemoteError("Could not create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        throw RemoteError("Could not open " + local_path + " for upload");
    }
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw RemoteError("Could not create " + partial.string());
    }

    // The store hashes what it received, not what the client claims
    std::unique_ptr<Digester> digester = digester_->clone();
    std::vector<char> buffer(UPLOAD_BLOCK_SIZE);
    uint64_t size = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = in.gcount();
        if (count > 0) {
            out.write(buffer.data(), count);
            digester->update(buffer.data(), static_cast<size_t>(count));
            size += static_cast<uint64_t>(count);
        }
    }
    if (in.bad()) {
        throw RemoteError("Read error while uploading " + local_path);
    }
    out.close();
    if (out.fail()) {
        throw RemoteError("Write error while storing " + partial.string());
    }

    ObjectInfo info;
    info.set_name(name);
    info.set_size(size);
    info.set_digest(digester->hex_final());
    info.set_digest_algorithm(digester->algorithm());
    info.set_uploaded_at(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    fs::path info_target = info_path(name);
    fs::path info_partial = info_target;
    info_partial += ".partial";
    {
        std::ofstream info_file(info_partial, std::ios::binary | std::ios::trunc);
        if (!info.SerializeToOstream(&info_file)) {
            throw RemoteError("Failed to write object record " + info_partial.string());
        }
    }

    fs::rename(partial, target, ec);
    if (!ec) {
        fs::rename(info_partial, info_target, ec);
    }
    if (ec) {
        throw RemoteError("Could not publish object " + name + ": " + ec.message());
    }
}

} // namespace resplit
