#include "errors.hpp"
#include <sstream>

namespace resplit {

namespace {

std::string size_mismatch_message(const std::string& path, uint64_t expected, uint64_t actual) {
    std::ostringstream out;
    out << "Partial chunk detected!\n"
        << "File: " << path << "\n"
        << "Expected size: " << expected << " bytes (" << expected / 1024 / 1024 << " MB)\n"
        << "Actual size: " << actual << " bytes (" << actual / 1024 / 1024 << " MB)\n"
        << "This indicates an incomplete or corrupted chunk from a previous run.\n"
        << "Remove the chunk and run again. To remove: rm \"" << path << "\"";
    return out.str();
}

std::string integrity_message(const std::string& path, const std::string& chunk_digest,
                              const std::string& source_digest) {
    std::ostringstream out;
    out << "Last chunk integrity verification failed!\n"
        << "File: " << path << "\n"
        << "Chunk digest:  " << chunk_digest << "\n"
        << "Source digest: " << source_digest << "\n"
        << "The last chunk is corrupted or incomplete.\n"
        << "Remove the chunk and run again. To remove: rm \"" << path << "\"";
    return out.str();
}

} // namespace

SizeMismatchError::SizeMismatchError(const std::string& path, uint64_t expected, uint64_t actual)
    : Error(size_mismatch_message(path, expected, actual)),
      path_(path),
      expected_(expected),
      actual_(actual) {}

IntegrityMismatchError::IntegrityMismatchError(const std::string& path,
                                               const std::string& chunk_digest,
                                               const std::string& source_digest)
    : Error(integrity_message(path, chunk_digest, source_digest)),
      path_(path),
      chunk_digest_(chunk_digest),
      source_digest_(source_digest) {}

CopyFailure::CopyFailure(const std::string& path, const std::string& reason)
    : Error("Error creating chunk " + path + ": " + reason +
            "\nThe partial file is kept; the next run reports it. To remove: rm \"" + path + "\""),
      path_(path) {}

} // namespace resplit
