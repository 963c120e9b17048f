#pragma once

#include "digester.hpp"
#include "object_store.hpp"
#include "resplit.pb.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace resplit {

// Object store whose bucket is a directory under `root` (a local disk, NAS or
// a mounted remote filesystem). Each object "<name>" sits beside an ObjectInfo
// record "<name>.objinfo" carrying the digest the store computed on upload.
class DirectoryObjectStore : public ObjectStore {
public:
    DirectoryObjectStore(const std::string& root, const std::string& bucket,
                         const std::string& digest_name = "sha1");

    void check_available() override;
    std::string digest_algorithm() const override;
    std::optional<std::string> fetch_digest(const std::string& name) override;
    void upload(const std::string& local_path, const std::string& name) override;

    std::filesystem::path object_path(const std::string& name) const;
    std::filesystem::path info_path(const std::string& name) const;

    // Reads an object's metadata record, no value if the record does not exist
    std::optional<ObjectInfo> load_info(const std::string& name) const;

private:
    std::filesystem::path bucket_dir_;
    std::string bucket_;
    std::unique_ptr<Digester> digester_;
};

} // namespace resplit
