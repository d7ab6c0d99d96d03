#include <gtest/gtest.h>

#include <algorithm>

#include "test_utils/Fakes.h"
#include "vidguard/Errors.h"
#include "vidguard/session/VideoStore.h"

namespace vidguard {
namespace {

using testing::TempDir;
namespace fs = std::filesystem;

class VideoStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cfg_ = testing::testConfig(root_.path());
    store_ = std::make_unique<VideoStore>(cfg_);
    ASSERT_TRUE(store_->prepareDirectories());
  }

  TempDir root_{"store"};
  TempDir sources_{"sources"};
  ServerConfig cfg_;
  std::unique_ptr<VideoStore> store_;
};

TEST_F(VideoStoreTest, PrepareCreatesBothRoots) {
  EXPECT_TRUE(fs::is_directory(store_->uploadDir()));
  EXPECT_TRUE(fs::is_directory(store_->tempDir()));
}

TEST_F(VideoStoreTest, LocateFindsSupportedExtensionOnly) {
  EXPECT_FALSE(store_->locate("abc").has_value());
  EXPECT_FALSE(store_->locate("").has_value());

  std::ofstream(store_->uploadDir() / "abc.txt") << "x";
  EXPECT_FALSE(store_->locate("abc").has_value());

  std::ofstream(store_->uploadDir() / "abc.webm") << "x";
  auto found = store_->locate("abc");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), "abc.webm");
}

TEST_F(VideoStoreTest, ImportCopiesUnderSessionId) {
  const auto src = sources_.writeFile("clip.MP4", "0123456789");
  const auto stored = store_->import("sid-1", src);

  EXPECT_EQ(stored, store_->uploadDir() / "sid-1.mp4");
  EXPECT_TRUE(fs::exists(stored));
  EXPECT_TRUE(fs::exists(src)) << "source must be left in place";
  EXPECT_EQ(fs::file_size(stored), 10u);
  ASSERT_TRUE(store_->locate("sid-1").has_value());
  EXPECT_EQ(*store_->locate("sid-1"), stored);
}

TEST_F(VideoStoreTest, ImportRejectsUnsupportedExtension) {
  const auto src = sources_.writeFile("notes.txt");
  try {
    store_->import("sid-2", src);
    FAIL() << "expected UnsupportedFormat";
  } catch (const ScanException& e) {
    EXPECT_EQ(e.code(), ScanError::UnsupportedFormat);
  }
  EXPECT_FALSE(store_->locate("sid-2").has_value());
}

TEST_F(VideoStoreTest, ImportRejectsOversizedFile) {
  cfg_.max_upload_mb = 0;
  VideoStore tiny(cfg_);
  const auto src = sources_.writeFile("clip.avi", "payload");
  try {
    tiny.import("sid-3", src);
    FAIL() << "expected FileTooLarge";
  } catch (const ScanException& e) {
    EXPECT_EQ(e.code(), ScanError::FileTooLarge);
  }
  EXPECT_FALSE(fs::exists(tiny.uploadDir() / "sid-3.avi"));
}

TEST_F(VideoStoreTest, ImportOfMissingSourceFails) {
  try {
    store_->import("sid-4", sources_.path() / "nope.mp4");
    FAIL() << "expected ImportFailed";
  } catch (const ScanException& e) {
    EXPECT_EQ(e.code(), ScanError::ImportFailed);
  }
}

TEST_F(VideoStoreTest, CleanupAllRemovesEveryFile) {
  std::ofstream(store_->uploadDir() / "a.mp4") << "x";
  std::ofstream(store_->uploadDir() / "b.mov") << "x";
  std::ofstream(store_->tempDir() / "scratch.bin") << "x";

  auto removed = store_->cleanupAll();
  std::sort(removed.begin(), removed.end());
  EXPECT_EQ(removed, (std::vector<std::string>{"a.mp4", "b.mov", "scratch.bin"}));
  EXPECT_TRUE(fs::is_empty(store_->uploadDir()));
  EXPECT_TRUE(fs::is_empty(store_->tempDir()));

  EXPECT_TRUE(store_->cleanupAll().empty());
}

}  // namespace
}  // namespace vidguard
