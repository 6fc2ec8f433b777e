/**
 * @file atomic_file_test.cpp
 * @brief Tests for temp-file-then-rename writes
 */

#include "storage/atomic_file.h"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

using namespace graphvault::storage;
using graphvault::utils::ErrorCode;

namespace fs = std::filesystem;

class AtomicFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("graphvault_atomic_file_test_" + std::to_string(getpid()) + "_" +
                                             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(test_dir_);
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  static std::string Slurp(const fs::path& path) {
    std::ifstream ifs(path);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  }

  fs::path test_dir_;
};

TEST_F(AtomicFileTest, WritesContent) {
  auto path = test_dir_ / "snapshot.json";
  ASSERT_TRUE(WriteFileAtomically(path, "{\"a\":1}"));
  EXPECT_EQ(Slurp(path), "{\"a\":1}");
}

TEST_F(AtomicFileTest, LeavesNoTemporaryFile) {
  auto path = test_dir_ / "snapshot.json";
  ASSERT_TRUE(WriteFileAtomically(path, "content"));
  EXPECT_FALSE(fs::exists(test_dir_ / "snapshot.json.tmp"));
}

TEST_F(AtomicFileTest, CreatesMissingParentDirectories) {
  auto path = test_dir_ / "nested" / "deeper" / "snapshot.json";
  ASSERT_TRUE(WriteFileAtomically(path, "x"));
  EXPECT_TRUE(fs::is_regular_file(path));
}

TEST_F(AtomicFileTest, ReplacesExistingFile) {
  auto path = test_dir_ / "index.json";
  ASSERT_TRUE(WriteFileAtomically(path, "old"));
  ASSERT_TRUE(WriteFileAtomically(path, "new"));
  EXPECT_EQ(Slurp(path), "new");
}

TEST_F(AtomicFileTest, FileIsOwnerReadWriteOnly) {
  auto path = test_dir_ / "snapshot.json";
  ASSERT_TRUE(WriteFileAtomically(path, "secret"));

  struct stat info {};
  ASSERT_EQ(stat(path.c_str(), &info), 0);
  EXPECT_EQ(info.st_mode & 0777, 0600);
}

TEST_F(AtomicFileTest, RefusesSymlinkTarget) {
  auto real = test_dir_ / "elsewhere.txt";
  {
    std::ofstream out(real);
    out << "untouched";
  }
  auto link = test_dir_ / "snapshot.json";
  fs::create_symlink(real, link);

  auto result = WriteFileAtomically(link, "attack");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kSnapshotUnsafePath);
  EXPECT_EQ(Slurp(real), "untouched");
}

TEST_F(AtomicFileTest, RefusesSymlinkedTemporaryPath) {
  auto real = test_dir_ / "elsewhere.txt";
  {
    std::ofstream out(real);
    out << "untouched";
  }
  fs::create_symlink(real, test_dir_ / "snapshot.json.tmp");

  auto result = WriteFileAtomically(test_dir_ / "snapshot.json", "attack");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kSnapshotUnsafePath);
  EXPECT_EQ(Slurp(real), "untouched");
}

TEST_F(AtomicFileTest, RefusesSymlinkedDirectory) {
  auto real_dir = test_dir_ / "real";
  fs::create_directories(real_dir);
  auto link_dir = test_dir_ / "linked";
  fs::create_directory_symlink(real_dir, link_dir);

  auto result = WriteFileAtomically(link_dir / "snapshot.json", "x");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kSnapshotUnsafePath);
  EXPECT_FALSE(fs::exists(real_dir / "snapshot.json"));
}

TEST_F(AtomicFileTest, ReadWholeFileReturnsContent) {
  auto path = test_dir_ / "data.json";
  {
    std::ofstream out(path);
    out << "line1\nline2\n";
  }
  auto content = ReadWholeFile(path);
  ASSERT_TRUE(content);
  EXPECT_EQ(*content, "line1\nline2\n");
}

TEST_F(AtomicFileTest, ReadMissingFileIsNotFound) {
  auto content = ReadWholeFile(test_dir_ / "missing.json");
  ASSERT_FALSE(content);
  EXPECT_EQ(content.error().code(), ErrorCode::kSnapshotNotFound);
}
