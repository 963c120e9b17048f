#include "byte_range_reader.hpp"
#include "chunk_writer.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <utility>

using namespace resplit;
using namespace resplit::test;

namespace {

// Serves the first `limit` bytes of `data`, as if the source was truncated
class TruncatedReader : public ByteRangeReader {
public:
    TruncatedReader(std::string data, uint64_t limit) : data_(std::move(data)), limit_(limit) {}

    size_t read(uint64_t offset, char* buffer, size_t len) override {
        if (offset >= limit_) {
            return 0;
        }
        size_t count = static_cast<size_t>(std::min<uint64_t>(len, limit_ - offset));
        std::memcpy(buffer, data_.data() + offset, count);
        return count;
    }

private:
    std::string data_;
    uint64_t limit_;
};

} // namespace

TEST(ChunkWriter, CopiesExactByteRanges) {
    TempDir dir;
    std::string data = pattern_bytes(1000);
    write_file(dir.file("source.bin"), data);
    FileRangeReader reader(dir.file("source.bin"));
    ChunkLayout layout(1000, 400);
    ChunkWriter writer(layout, reader);

    ASSERT_TRUE(writer.write(0, dir.file("split_aa")));
    ASSERT_TRUE(writer.write(1, dir.file("split_ab")));
    ASSERT_TRUE(writer.write(2, dir.file("split_ac")));
    EXPECT_EQ(read_file(dir.file("split_aa")), data.substr(0, 400));
    EXPECT_EQ(read_file(dir.file("split_ab")), data.substr(400, 400));
    EXPECT_EQ(read_file(dir.file("split_ac")), data.substr(800, 200));
}

TEST(ChunkWriter, NothingToWritePastTheEnd) {
    TempDir dir;
    write_file(dir.file("source.bin"), pattern_bytes(800));
    FileRangeReader reader(dir.file("source.bin"));
    ChunkLayout layout(800, 400);
    ChunkWriter writer(layout, reader);

    EXPECT_FALSE(writer.write(2, dir.file("split_ac")));
    EXPECT_FALSE(fs::exists(dir.file("split_ac")));
}

TEST(ChunkWriter, RefusesToOverwrite) {
    TempDir dir;
    write_file(dir.file("source.bin"), pattern_bytes(800));
    write_file(dir.file("split_aa"), "keep me");
    FileRangeReader reader(dir.file("source.bin"));
    ChunkLayout layout(800, 400);
    ChunkWriter writer(layout, reader);

    EXPECT_THROW(writer.write(0, dir.file("split_aa")), IoError);
    EXPECT_EQ(read_file(dir.file("split_aa")), "keep me");
}

TEST(ChunkWriter, ShortSourceLeavesPartialFile) {
    TempDir dir;
    TruncatedReader reader(pattern_bytes(1000), 550);
    ChunkLayout layout(1000, 400);
    ChunkWriter writer(layout, reader);

    EXPECT_TRUE(writer.write(0, dir.file("split_aa")));
    EXPECT_THROW(writer.write(1, dir.file("split_ab")), CopyFailure);

    // Kept on purpose so the next run reports a size mismatch
    ASSERT_TRUE(fs::exists(dir.file("split_ab")));
    EXPECT_EQ(fs::file_size(dir.file("split_ab")), 150u);
}
