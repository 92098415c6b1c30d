#include <gtest/gtest.h>

#include <filesystem>

#include "storage/local_storage.hpp"
#include "storage/path_guard.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace codeexec::storage {
namespace {

namespace fs = std::filesystem;

class LocalStorageTest : public ::testing::Test {
protected:
    LocalStorageTest()
        : dir_("local-storage-test")
        , storage_(dir_.Path() / "root") {
        storage_.CreatePrefix("s1");
    }

    sandbox::ScopedTempDir dir_;
    LocalStorage storage_;
};

TEST_F(LocalStorageTest, PutGetRoundTrip) {
    const std::string binary("\x00\x01\xff payload", 11);
    storage_.Put("s1", "nested/dir/data.bin", binary);
    const auto data = storage_.Get("s1", "nested/dir/data.bin");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, binary);
    EXPECT_TRUE(storage_.Exists("s1", "nested/dir/data.bin"));
    EXPECT_FALSE(storage_.Get("s1", "missing.txt").has_value());
}

TEST_F(LocalStorageTest, PutLeavesNoTempFiles) {
    storage_.Put("s1", "a.txt", "one");
    storage_.Put("s1", "a.txt", "two");
    int count = 0;
    for (const auto& entry : fs::directory_iterator(storage_.Root() / "s1")) {
        EXPECT_EQ(entry.path().filename().string().rfind(kTempFilePrefix, 0), std::string::npos);
        ++count;
    }
    EXPECT_EQ(count, 1);
    EXPECT_EQ(*storage_.Get("s1", "a.txt"), "two");
}

TEST_F(LocalStorageTest, ListIsSortedAndSkipsSymlinks) {
    storage_.Put("s1", "b.txt", "bb");
    storage_.Put("s1", "a/c.txt", "c");
    fs::create_symlink("/etc/hostname", storage_.Root() / "s1" / "link");
    const auto entries = storage_.List("s1");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, "a/c.txt");
    EXPECT_EQ(entries[0].size, 1u);
    EXPECT_EQ(entries[1].path, "b.txt");
    EXPECT_EQ(entries[1].size, 2u);
}

TEST_F(LocalStorageTest, SymlinkedFileIsNotFollowed) {
    const auto secret = dir_.Path() / "secret.txt";
    codeexec::testing::WriteFile(secret, "host secret");
    fs::create_symlink(secret, storage_.Root() / "s1" / "leak.txt");
    EXPECT_FALSE(storage_.Get("s1", "leak.txt").has_value());
    EXPECT_FALSE(storage_.Exists("s1", "leak.txt"));
}

TEST_F(LocalStorageTest, SymlinkedDirectoryEscapeIsRejected) {
    const auto outside = dir_.Path() / "outside";
    fs::create_directories(outside);
    codeexec::testing::WriteFile(outside / "target.txt", "outside");
    fs::create_directory_symlink(outside, storage_.Root() / "s1" / "escape");
    try {
        storage_.Get("s1", "escape/target.txt");
        FAIL() << "expected ServiceError";
    } catch (const utils::ServiceError& ex) {
        EXPECT_EQ(ex.Code(), utils::ErrorCode::kInvalidPath);
    }
    EXPECT_THROW(storage_.Put("s1", "escape/new.txt", "x"), utils::ServiceError);
    EXPECT_FALSE(fs::exists(outside / "new.txt"));
}

TEST_F(LocalStorageTest, PutReplacesPlantedSymlink) {
    const auto secret = dir_.Path() / "victim.txt";
    codeexec::testing::WriteFile(secret, "untouched");
    fs::create_symlink(secret, storage_.Root() / "s1" / "file.txt");
    storage_.Put("s1", "file.txt", "replaced");
    EXPECT_EQ(codeexec::testing::ReadFile(secret), "untouched");
    EXPECT_EQ(*storage_.Get("s1", "file.txt"), "replaced");
}

TEST_F(LocalStorageTest, InvalidPrefixIsRejected) {
    EXPECT_THROW(storage_.Put("../s1", "a.txt", "x"), utils::ServiceError);
    EXPECT_THROW(storage_.List("a/b"), utils::ServiceError);
}

TEST_F(LocalStorageTest, RemoveAndRemovePrefix) {
    storage_.Put("s1", "a.txt", "x");
    EXPECT_TRUE(storage_.Remove("s1", "a.txt"));
    EXPECT_FALSE(storage_.Remove("s1", "a.txt"));
    storage_.Put("s1", "b/c.txt", "y");
    EXPECT_TRUE(storage_.RemovePrefix("s1"));
    EXPECT_FALSE(fs::exists(storage_.Root() / "s1"));
    EXPECT_FALSE(storage_.RemovePrefix("s1"));
}

TEST_F(LocalStorageTest, CheckoutWorksInPlace) {
    auto workspace = storage_.Checkout("s1");
    EXPECT_EQ(workspace->Directory(), storage_.Root() / "s1");
    codeexec::testing::WriteFile(workspace->Directory() / "made.txt", "by code");
    workspace->Commit();
    EXPECT_EQ(*storage_.Get("s1", "made.txt"), "by code");
}

}  // namespace
}  // namespace codeexec::storage
