#include "disk_space.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace resplit;
using namespace resplit::test;

TEST(DiskSpaceGovernor, AdmitsWhenChunkAndBufferFit) {
    FakeSpaceProbe probe(500);
    DiskSpaceGovernor governor(probe, "/out", 400, 100);
    SpaceCheck check = governor.check();
    EXPECT_TRUE(check.admitted);
    EXPECT_EQ(check.available, 500u);
    EXPECT_EQ(check.required, 500u);
}

TEST(DiskSpaceGovernor, RefusesOneByteShort) {
    FakeSpaceProbe probe(499);
    DiskSpaceGovernor governor(probe, "/out", 400, 100);
    EXPECT_FALSE(governor.check().admitted);
}

TEST(DiskSpaceGovernor, ReadsFreshValueEveryCheck) {
    FakeSpaceProbe probe(1000);
    DiskSpaceGovernor governor(probe, "/out", 400, 0);
    EXPECT_TRUE(governor.check().admitted);
    probe.available = 10;
    EXPECT_FALSE(governor.check().admitted);
    EXPECT_EQ(probe.calls, 2);
}

TEST(DiskSpaceGovernor, HugeBufferSaturates) {
    FakeSpaceProbe probe(std::numeric_limits<uint64_t>::max() - 1);
    DiskSpaceGovernor governor(probe, "/out", 400, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(governor.required(), std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(governor.check().admitted);
}

TEST(FilesystemSpaceProbe, QueriesRealFilesystem) {
    TempDir dir;
    FilesystemSpaceProbe probe;
    EXPECT_GT(probe.available_bytes(dir.str()), 0u);
    EXPECT_THROW(probe.available_bytes(dir.file("missing/deeper")), IoError);
}
