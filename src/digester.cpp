#include "digester.hpp"
#include "errors.hpp"
#include "resplit/hex_utils.hpp"
#include <algorithm>
#include <vector>

namespace resplit {

namespace {
const size_t DIGEST_BLOCK_SIZE = 1024 * 1024;
}

EvpDigester::EvpDigester(const std::string& name)
    : name_(hex::normalize(name)),
      md_(EVP_get_digestbyname(name_.c_str())),
      mdctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    if (md_ == nullptr) {
        throw ConfigError("Unsupported digest algorithm: " + name);
    }
    if (!mdctx_) {
        throw Error("Failed to allocate digest context");
    }
    reset();
}

size_t EvpDigester::hex_length() const {
    return static_cast<size_t>(EVP_MD_size(md_)) * 2;
}

void EvpDigester::reset() {
    if (EVP_DigestInit_ex(mdctx_.get(), md_, nullptr) != 1) {
        throw Error("EVP_DigestInit_ex failed for " + name_);
    }
}

void EvpDigester::update(const char* data, size_t len) {
    if (EVP_DigestUpdate(mdctx_.get(), data, len) != 1) {
        throw Error("EVP_DigestUpdate failed for " + name_);
    }
}

std::string EvpDigester::hex_final() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx_.get(), hash, &hash_len) != 1) {
        throw Error("EVP_DigestFinal_ex failed for " + name_);
    }
    reset();
    return hex::to_hex(hash, hash_len);
}

std::unique_ptr<Digester> EvpDigester::clone() const {
    return std::make_unique<EvpDigester>(name_);
}

std::unique_ptr<Digester> make_digester(const std::string& name) {
    return std::make_unique<EvpDigester>(name);
}

std::string digest_range(Digester& digester, ByteRangeReader& reader, uint64_t offset,
                         uint64_t length, const std::string& label) {
    digester.reset();
    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(DIGEST_BLOCK_SIZE, std::max<uint64_t>(length, 1))));
    uint64_t done = 0;
    while (done < length) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), length - done));
        size_t got = reader.read(offset + done, buffer.data(), want);
        if (got == 0) {
            throw IoError("Short read while hashing " + label + ": got " + std::to_string(done) +
                          " of " + std::to_string(length) + " bytes");
        }
        digester.update(buffer.data(), got);
        done += got;
    }
    return digester.hex_final();
}

std::string digest_file(Digester& digester, const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Could not open file for hashing: " + path);
    }
    digester.reset();
    std::vector<char> buffer(DIGEST_BLOCK_SIZE);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0) {
            digester.update(buffer.data(), static_cast<size_t>(count));
        }
    }
    if (file.bad()) {
        throw IoError("Read error while hashing " + path);
    }
    return digester.hex_final();
}

} // namespace resplit
