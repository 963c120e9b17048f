#include "directory_object_store.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace resplit;
using namespace resplit::test;

TEST(DirectoryObjectStore, MissingBucketIsUnavailable) {
    TempDir root;
    DirectoryObjectStore store(root.str(), "bucket");
    EXPECT_THROW(store.check_available(), RemoteUnavailable);

    DirectoryObjectStore bad_name(root.str(), "a/b");
    EXPECT_THROW(bad_name.check_available(), RemoteUnavailable);
}

TEST(DirectoryObjectStore, UploadRecordsNativeDigest) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");
    ASSERT_NO_THROW(store.check_available());
    EXPECT_EQ(store.digest_algorithm(), "sha1");

    EXPECT_FALSE(store.fetch_digest("backups/split_aa").has_value());

    std::string data = pattern_bytes(700);
    write_file(root.file("split_aa"), data);
    store.upload(root.file("split_aa"), "backups/split_aa");

    EXPECT_EQ(read_file(store.object_path("backups/split_aa").string()), data);
    auto digest = store.fetch_digest("backups/split_aa");
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, sha1_of(data));

    auto info = store.load_info("backups/split_aa");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name(), "backups/split_aa");
    EXPECT_EQ(info->size(), 700u);
    EXPECT_EQ(info->digest_algorithm(), "sha1");
    EXPECT_GT(info->uploaded_at(), 0);
}

TEST(DirectoryObjectStore, ReuploadReplacesObject) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");

    write_file(root.file("chunk"), "first");
    store.upload(root.file("chunk"), "split_aa");
    write_file(root.file("chunk"), "second version");
    store.upload(root.file("chunk"), "split_aa");

    EXPECT_EQ(*store.fetch_digest("split_aa"), sha1_of("second version"));
}

TEST(DirectoryObjectStore, TamperedObjectCountsAsAbsent) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");
    write_file(root.file("chunk"), pattern_bytes(100));
    store.upload(root.file("chunk"), "split_aa");

    write_file(store.object_path("split_aa").string(), pattern_bytes(50));
    EXPECT_FALSE(store.fetch_digest("split_aa").has_value());
}

TEST(DirectoryObjectStore, CorruptRecordIsRemoteError) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");
    write_file(store.info_path("split_aa").string(), "\xff\xff\xff not protobuf");
    EXPECT_THROW(store.fetch_digest("split_aa"), RemoteError);
}

TEST(DirectoryObjectStore, RejectsEscapingNames) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");
    write_file(root.file("chunk"), "x");
    EXPECT_THROW(store.upload(root.file("chunk"), "../outside"), RemoteError);
    EXPECT_THROW(store.fetch_digest("/etc/passwd"), RemoteError);
}

TEST(DirectoryObjectStore, MissingLocalFileIsRemoteError) {
    TempDir root;
    fs::create_directories(root.path() / "bucket");
    DirectoryObjectStore store(root.str(), "bucket");
    EXPECT_THROW(store.upload(root.file("nope"), "split_aa"), RemoteError);
}
