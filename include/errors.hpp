#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace resplit {

// Base class of every error the splitter reports. main() catches this one.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Missing or invalid run parameters, raised before any I/O.
class ConfigError : public Error {
public:
    using Error::Error;
};

// Source file or output directory does not exist.
class SourceUnavailable : public Error {
public:
    using Error::Error;
};

// Read/write failure that is not a chunk copy (sidecars, directory listing...)
class IoError : public Error {
public:
    using Error::Error;
};

// Object store cannot be used at all. Raised before any chunk is processed.
class RemoteUnavailable : public Error {
public:
    using Error::Error;
};

// A single object store operation failed. The sync engine reports it per chunk.
class RemoteError : public Error {
public:
    using Error::Error;
};

// An existing chunk does not have the length its position requires.
class SizeMismatchError : public Error {
public:
    SizeMismatchError(const std::string& path, uint64_t expected, uint64_t actual);

    const std::string& path() const { return path_; }
    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

private:
    std::string path_;
    uint64_t expected_;
    uint64_t actual_;
};

// The boundary chunk's content differs from the matching range of the source.
class IntegrityMismatchError : public Error {
public:
    IntegrityMismatchError(const std::string& path, const std::string& chunk_digest,
                           const std::string& source_digest);

    const std::string& path() const { return path_; }
    const std::string& chunk_digest() const { return chunk_digest_; }
    const std::string& source_digest() const { return source_digest_; }

private:
    std::string path_;
    std::string chunk_digest_;
    std::string source_digest_;
};

// Extracting a byte range into a chunk file did not complete.
// The partial file is left on disk on purpose.
class CopyFailure : public Error {
public:
    CopyFailure(const std::string& path, const std::string& reason);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace resplit
