#pragma once

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <string>

#include "storage/controller/db_controller.hpp"
#include "storage/controller/queue/queue_store.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
// 4x3 RGB PNG
inline constexpr std::array<unsigned char, 73> kTinyPng = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44,
    0x52, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x03, 0x08, 0x02, 0x00, 0x00, 0x00, 0x3B,
    0x96, 0x39, 0x91, 0x00, 0x00, 0x00, 0x10, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9C, 0x63, 0x68,
    0x70, 0x50, 0x80, 0x23, 0x06, 0x9C, 0x1C, 0x00, 0xD1, 0x67, 0x0A, 0x81, 0x65, 0xA6, 0x07,
    0x18, 0x00, 0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82};

/**
 * @brief Gives every test its own scratch directory, and builds gallery folders of fake images
 * in it.
 */
class GalleryFolderTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_            = std::filesystem::temp_directory_path() /
            std::format("imxup_{}_{}", info->test_suite_name(), info->name());
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  // count files named img_001.jpg, img_002.jpg, ... of size bytes each
  auto MakeGallery(const std::string& name, int count, size_t size = 1024)
      -> std::filesystem::path {
    auto folder = root_ / name;
    std::filesystem::create_directories(folder);
    for (int i = 1; i <= count; ++i) {
      WriteFile(folder / std::format("img_{:03}.jpg", i), size);
    }
    return folder;
  }

  static void WriteFile(const std::filesystem::path& path, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, 'x');
  }

  static void WritePng(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(kTinyPng.data()), kTinyPng.size());
  }
};

/**
 * @brief GalleryFolderTests with a fresh queue database in the scratch directory.
 */
class QueueStoreTestFixation : public GalleryFolderTests {
 protected:
  std::filesystem::path       db_path_;
  std::shared_ptr<QueueStore> store_;

  void                        SetUp() override {
    GalleryFolderTests::SetUp();
    db_path_ = root_ / "queue.db";
    store_   = std::make_shared<QueueStore>(std::make_shared<DBController>(db_path_));
  }

  void TearDown() override {
    store_.reset();
    GalleryFolderTests::TearDown();
  }

  auto NewGallery(const std::string& path, GalleryStatus status = GalleryStatus::READY,
                  const std::string& tab = kDefaultTabName) -> GalleryItem {
    GalleryItem item;
    item.path_     = path;
    item.name_     = std::filesystem::path(path).filename().string();
    item.status_   = status;
    item.tab_name_ = tab;
    return item;
  }
};
}  // namespace imxup
