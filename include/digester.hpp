#pragma once

#include "byte_range_reader.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>

namespace resplit {

// Helper for managing EVP_MD_CTX context
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Incremental content digest. One instance is not safe to share between threads,
// use clone() to get an independent one.
class Digester {
public:
    virtual ~Digester() = default;

    // Lowercase algorithm name, also used as the sidecar extension ("sha1")
    virtual std::string algorithm() const = 0;
    // Number of hex characters in a finished digest
    virtual size_t hex_length() const = 0;

    virtual void reset() = 0;
    virtual void update(const char* data, size_t len) = 0;
    // Finishes the running digest and returns it as lowercase hex
    virtual std::string hex_final() = 0;

    virtual std::unique_ptr<Digester> clone() const = 0;
};

// Any digest OpenSSL knows by name (sha1, sha256, md5, ...)
class EvpDigester : public Digester {
public:
    // Throws ConfigError for an unknown algorithm
    explicit EvpDigester(const std::string& name);

    std::string algorithm() const override { return name_; }
    size_t hex_length() const override;
    void reset() override;
    void update(const char* data, size_t len) override;
    std::string hex_final() override;
    std::unique_ptr<Digester> clone() const override;

private:
    std::string name_;
    const EVP_MD* md_;
    EVP_MD_CTX_ptr mdctx_;
};

std::unique_ptr<Digester> make_digester(const std::string& name);

// Digests `length` bytes of reader starting at offset.
// Throws IoError naming `label` if the reader runs dry before that.
std::string digest_range(Digester& digester, ByteRangeReader& reader, uint64_t offset,
                         uint64_t length, const std::string& label);

// Digest of a whole file
std::string digest_file(Digester& digester, const std::string& path);

} // namespace resplit
