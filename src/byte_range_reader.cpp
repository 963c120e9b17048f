#include "byte_range_reader.hpp"
#include "errors.hpp"

namespace resplit {

FileRangeReader::FileRangeReader(const std::string& path)
    : path_(path), file_(path, std::ios::binary) {
    if (!file_.is_open()) {
        throw IoError("Could not open file for reading: " + path);
    }
}

size_t FileRangeReader::read(uint64_t offset, char* buffer, size_t len) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    if (!file_) {
        return 0;
    }
    file_.read(buffer, static_cast<std::streamsize>(len));
    return static_cast<size_t>(file_.gcount());
}

} // namespace resplit
