#include "chunk_writer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace resplit {

ChunkWriter::ChunkWriter(const ChunkLayout& layout, ByteRangeReader& source)
    : layout_(layout), source_(source) {}

bool ChunkWriter::write(uint64_t index, const std::string& path) {
    if (index >= layout_.total_chunks()) {
        return false;
    }
    ChunkSpec spec = layout_.spec(index);

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        throw IoError("Refusing to overwrite existing chunk " + path);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw CopyFailure(path, "could not create file");
    }

    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(COPY_BLOCK_SIZE, spec.length)));
    uint64_t copied = 0;
    while (copied < spec.length) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), spec.length - copied));
        size_t got = source_.read(spec.offset + copied, buffer.data(), want);
        if (got == 0) {
            throw CopyFailure(path, "source ended after " + std::to_string(copied) + " of " +
                                        std::to_string(spec.length) + " bytes");
        }
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!out) {
            throw CopyFailure(path, "write failed after " + std::to_string(copied) + " of " +
                                        std::to_string(spec.length) + " bytes");
        }
        copied += got;
    }

    out.flush();
    out.close();
    if (out.fail()) {
        throw CopyFailure(path, "could not flush chunk to disk");
    }
    return true;
}

} // namespace resplit
