#pragma once

#include <cstdint>
#include <cstddef>
#include <fstream>
#include <string>

namespace resplit {

// Random access reads from a file-like byte source
class ByteRangeReader {
public:
    virtual ~ByteRangeReader() = default;

    // Reads up to len bytes starting at offset, returns how many were read.
    // A return value below len means the source ended (or failed) early.
    virtual size_t read(uint64_t offset, char* buffer, size_t len) = 0;
};

class FileRangeReader : public ByteRangeReader {
public:
    // Throws IoError if the file cannot be opened
    explicit FileRangeReader(const std::string& path);

    size_t read(uint64_t offset, char* buffer, size_t len) override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
};

} // namespace resplit
