#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "app/gallery_scanner.hpp"
#include "support/gallery_test_fixation.hpp"
#include "type/errors.hpp"

namespace imxup {
class GalleryScannerTests : public QueueStoreTestFixation {};

TEST(GalleryScannerStaticTest, EligibleExtensionsIgnoreCase) {
  EXPECT_TRUE(GalleryScanner::IsEligible("a.jpg"));
  EXPECT_TRUE(GalleryScanner::IsEligible("a.JPEG"));
  EXPECT_TRUE(GalleryScanner::IsEligible("a.Png"));
  EXPECT_TRUE(GalleryScanner::IsEligible("a.gif"));
  EXPECT_FALSE(GalleryScanner::IsEligible("a.webp"));
  EXPECT_FALSE(GalleryScanner::IsEligible("a.txt"));
  EXPECT_FALSE(GalleryScanner::IsEligible("jpg"));
}

TEST(GalleryScannerStaticTest, StatsSkipUnknownDimensions) {
  std::vector<ScannedImage> images = {
      {"a.jpg", 1, 800, 600}, {"b.jpg", 1, 0, 0}, {"c.jpg", 1, 1200, 900}};
  auto stats = GalleryScanner::ComputeStats(images);
  EXPECT_EQ(stats.sampled_, 2u);
  EXPECT_EQ(stats.min_width_, 800u);
  EXPECT_EQ(stats.max_width_, 1200u);
  EXPECT_EQ(stats.min_height_, 600u);
  EXPECT_EQ(stats.max_height_, 900u);
  EXPECT_DOUBLE_EQ(stats.avg_width_, 1000.0);
  EXPECT_DOUBLE_EQ(stats.avg_height_, 750.0);

  auto none = GalleryScanner::ComputeStats({{"b.jpg", 1, 0, 0}});
  EXPECT_EQ(none.sampled_, 0u);
  EXPECT_EQ(none.min_width_, 0u);
}

TEST_F(GalleryScannerTests, ListsImagesInNaturalOrder) {
  auto folder = root_ / "mixed";
  std::filesystem::create_directories(folder / "sub");
  for (const char* name : {"img10.jpg", "img2.jpg", "img1.png", "notes.txt", "sub/img3.jpg"}) {
    WriteFile(folder / name, 16);
  }

  auto names = GalleryScanner::ListImages(folder);
  EXPECT_EQ(names, (std::vector<std::string>{"img1.png", "img2.jpg", "img10.jpg"}));
  EXPECT_THROW(GalleryScanner::ListImages(root_ / "missing"), ValidationError);
}

TEST_F(GalleryScannerTests, ReadsPixelSize) {
  WritePng(root_ / "tiny.png");
  WriteFile(root_ / "broken.jpg", 32);

  EXPECT_EQ(GalleryScanner::ReadDimensions(root_ / "tiny.png"), std::make_pair(4u, 3u));
  EXPECT_EQ(GalleryScanner::ReadDimensions(root_ / "broken.jpg"), std::make_pair(0u, 0u));
  EXPECT_EQ(GalleryScanner::ReadDimensions(root_ / "nope.png"), std::make_pair(0u, 0u));
}

TEST_F(GalleryScannerTests, OversizedFilesAreLeftOut) {
  auto folder = MakeGallery("big", 3, 1024);
  WriteFile(folder / "img_002.jpg", 2 * 1024 * 1024);

  GalleryScanner scanner(1, false);
  auto           result = scanner.Scan(folder);
  ASSERT_EQ(result.images_.size(), 2u);
  EXPECT_EQ(result.images_[0].file_name_, "img_001.jpg");
  EXPECT_EQ(result.images_[1].file_name_, "img_003.jpg");
  EXPECT_EQ(result.oversized_, std::vector<std::string>{"img_002.jpg"});
  EXPECT_EQ(result.total_size_, 2048u);
}

TEST_F(GalleryScannerTests, FolderWithoutImagesIsRejected) {
  auto folder = root_ / "docs";
  std::filesystem::create_directories(folder);
  WriteFile(folder / "readme.txt", 8);
  EXPECT_THROW(GalleryScanner().Scan(folder), ValidationError);
}

TEST_F(GalleryScannerTests, ScanIntoStorePersistsImagesAndStats) {
  auto folder = MakeGallery("Holiday", 2, 100);
  WritePng(folder / "img_003.png");
  store_->BulkUpsert({NewGallery(folder.string(), GalleryStatus::VALIDATING)});

  auto item = GalleryScanner().ScanIntoStore(*store_, folder.string());

  EXPECT_EQ(item.status_, GalleryStatus::READY);
  EXPECT_TRUE(item.scan_complete_);
  EXPECT_EQ(item.total_images_, 3u);
  EXPECT_EQ(item.total_size_, 200u + kTinyPng.size());
  EXPECT_EQ(item.dimensions_.sampled_, 1u);
  EXPECT_EQ(item.dimensions_.max_width_, 4u);

  auto images = store_->LoadImages(folder.string());
  ASSERT_EQ(images.size(), 3u);
  EXPECT_EQ(images[2].file_name_, "img_003.png");
  EXPECT_EQ(images[2].order_index_, 2);
  EXPECT_EQ(images[2].width_, 4u);
  EXPECT_EQ(images[2].height_, 3u);
}

TEST_F(GalleryScannerTests, VanishedFolderFailsTheGallery) {
  auto path = (root_ / "gone").string();
  store_->BulkUpsert({NewGallery(path, GalleryStatus::VALIDATING)});

  auto item = GalleryScanner().ScanIntoStore(*store_, path);
  EXPECT_EQ(item.status_, GalleryStatus::FAILED);
  EXPECT_EQ(item.error_message_, "Folder not found");

  EXPECT_THROW(GalleryScanner().ScanIntoStore(*store_, (root_ / "unknown").string()),
               ValidationError);
}
}  // namespace imxup
