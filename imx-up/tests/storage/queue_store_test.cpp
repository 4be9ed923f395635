#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "storage/controller/queue/queue_store.hpp"
#include "support/gallery_test_fixation.hpp"
#include "type/errors.hpp"

namespace imxup {
class QueueStoreTests : public QueueStoreTestFixation {
 protected:
  auto Paths() -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (const auto& item : store_->LoadAll()) paths.push_back(item.path_);
    return paths;
  }
};

TEST_F(QueueStoreTests, DefaultTabExistsOnFreshDatabase) {
  auto tabs = store_->LoadTabs();
  ASSERT_EQ(tabs.size(), 1u);
  EXPECT_EQ(tabs[0].name_, kDefaultTabName);
  EXPECT_TRUE(tabs[0].is_default_);

  // Reopening the same file does not add a second one
  store_.reset();
  store_ = std::make_shared<QueueStore>(std::make_shared<DBController>(db_path_));
  EXPECT_EQ(store_->LoadTabs().size(), 1u);
}

TEST_F(QueueStoreTests, UpsertKeepsOrderOfKnownGalleries) {
  store_->BulkUpsert({NewGallery("/g/a"), NewGallery("/g/b")});
  auto b_before = store_->Get("/g/b").value();

  auto changed  = NewGallery("/g/a");
  changed.name_ = "Renamed";
  store_->BulkUpsert({NewGallery("/g/c"), changed});

  auto all = store_->LoadAll();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].path_, "/g/a");
  EXPECT_EQ(all[0].name_, "Renamed");
  EXPECT_EQ(all[1].insertion_order_, b_before.insertion_order_);
  EXPECT_EQ(all[2].path_, "/g/c");
  EXPECT_GT(all[2].insertion_order_, all[1].insertion_order_);
  EXPECT_GT(all[0].added_ts_, 0);
}

TEST_F(QueueStoreTests, UpsertIntoUnknownTabChangesNothing) {
  store_->BulkUpsert({NewGallery("/g/a")});
  EXPECT_THROW(store_->BulkUpsert({NewGallery("/g/b"), NewGallery("/g/c", GalleryStatus::READY,
                                                                  "Missing")}),
               ValidationError);
  EXPECT_EQ(Paths(), std::vector<std::string>{"/g/a"});
  EXPECT_THROW(store_->BulkUpsert({NewGallery("")}), ValidationError);
}

TEST_F(QueueStoreTests, ReorderIsAllOrNothing) {
  store_->BulkUpsert({NewGallery("/g/a"), NewGallery("/g/b"), NewGallery("/g/c")});

  store_->UpdateInsertionOrders({"/g/c", "/g/a", "/g/b"});
  EXPECT_EQ(Paths(), (std::vector<std::string>{"/g/c", "/g/a", "/g/b"}));

  try {
    store_->UpdateInsertionOrders({"/g/b", "/g/missing", "/g/c"});
    FAIL() << "expected StorageError";
  } catch (const StorageError& e) {
    EXPECT_FALSE(e.UnappliedKeys().empty());
  }
  EXPECT_EQ(Paths(), (std::vector<std::string>{"/g/c", "/g/a", "/g/b"}));
}

TEST_F(QueueStoreTests, StatusChangesFollowTheLifecycle) {
  store_->BulkUpsert({NewGallery("/g/a")});

  store_->UpdateStatus("/g/a", GalleryStatus::QUEUED);
  EXPECT_THROW(store_->UpdateStatus("/g/a", GalleryStatus::COMPLETED), ValidationError);
  EXPECT_EQ(store_->Get("/g/a")->status_, GalleryStatus::QUEUED);

  ASSERT_TRUE(store_->ClaimGallery("/g/a"));
  store_->UpdateStatus("/g/a", GalleryStatus::FAILED, "boom");
  auto failed = store_->Get("/g/a").value();
  EXPECT_EQ(failed.error_message_, "boom");
  EXPECT_GT(failed.finished_ts_, 0);

  store_->UpdateStatus("/g/a", GalleryStatus::QUEUED);
  EXPECT_EQ(store_->Get("/g/a")->finished_ts_, 0);

  EXPECT_THROW(store_->UpdateStatus("/g/none", GalleryStatus::QUEUED), StorageError);
}

TEST_F(QueueStoreTests, ConditionalStatusChangeLosesToAClaim) {
  store_->BulkUpsert({NewGallery("/g/a", GalleryStatus::QUEUED),
                      NewGallery("/g/b", GalleryStatus::QUEUED)});

  ASSERT_TRUE(store_->ClaimGallery("/g/a"));
  EXPECT_FALSE(store_->SetStatusIf("/g/a", GalleryStatus::QUEUED, GalleryStatus::PAUSED));
  EXPECT_EQ(store_->Get("/g/a")->status_, GalleryStatus::UPLOADING);

  EXPECT_TRUE(store_->SetStatusIf("/g/b", GalleryStatus::QUEUED, GalleryStatus::PAUSED));
  EXPECT_EQ(store_->Get("/g/b")->status_, GalleryStatus::PAUSED);
  EXPECT_FALSE(store_->SetStatusIf("/g/none", GalleryStatus::QUEUED, GalleryStatus::PAUSED));
  EXPECT_THROW(store_->SetStatusIf("/g/b", GalleryStatus::QUEUED, GalleryStatus::COMPLETED),
               ValidationError);
}

TEST_F(QueueStoreTests, UploadingGalleriesAreNotDeleted) {
  store_->BulkUpsert({NewGallery("/g/a", GalleryStatus::QUEUED), NewGallery("/g/b")});
  ASSERT_TRUE(store_->ClaimGallery("/g/a"));

  EXPECT_EQ(store_->DeleteByPaths({"/g/a", "/g/b"}), 1u);
  EXPECT_EQ(store_->Get("/g/a")->status_, GalleryStatus::UPLOADING);
  EXPECT_FALSE(store_->Get("/g/b").has_value());
}

TEST_F(QueueStoreTests, EveryQueuedGalleryIsClaimedOnce) {
  std::vector<GalleryItem> items;
  for (int i = 0; i < 20; ++i) {
    items.push_back(NewGallery("/g/" + std::to_string(i), GalleryStatus::QUEUED));
  }
  store_->BulkUpsert(items);

  std::mutex               mtx;
  std::vector<std::string> claimed;
  std::vector<std::thread> workers;
  for (int t = 0; t < 6; ++t) {
    workers.emplace_back([&] {
      while (auto item = store_->ClaimNextQueued()) {
        EXPECT_EQ(item->status_, GalleryStatus::UPLOADING);
        std::lock_guard<std::mutex> lock(mtx);
        claimed.push_back(item->path_);
      }
    });
  }
  for (auto& worker : workers) worker.join();

  EXPECT_EQ(claimed.size(), 20u);
  EXPECT_EQ(std::set<std::string>(claimed.begin(), claimed.end()).size(), 20u);
  EXPECT_FALSE(store_->ClaimNextQueued().has_value());
  EXPECT_FALSE(store_->ClaimGallery("/g/0"));
}

TEST_F(QueueStoreTests, ClaimFollowsInsertionOrder) {
  store_->BulkUpsert({NewGallery("/g/a", GalleryStatus::QUEUED),
                      NewGallery("/g/b", GalleryStatus::QUEUED)});
  store_->UpdateInsertionOrders({"/g/b", "/g/a"});
  EXPECT_EQ(store_->ClaimNextQueued()->path_, "/g/b");
  EXPECT_EQ(store_->ClaimNextQueued()->path_, "/g/a");
}

TEST_F(QueueStoreTests, InterruptedGalleriesBecomeIncomplete) {
  store_->BulkUpsert({NewGallery("/g/a", GalleryStatus::UPLOADING),
                      NewGallery("/g/b", GalleryStatus::QUEUED)});
  EXPECT_EQ(store_->RecoverInterrupted(), 1u);
  EXPECT_EQ(store_->Get("/g/a")->status_, GalleryStatus::INCOMPLETE);
  EXPECT_EQ(store_->Get("/g/b")->status_, GalleryStatus::QUEUED);
  EXPECT_EQ(store_->RecoverInterrupted(), 0u);
}

TEST_F(QueueStoreTests, ImagesTrackUploads) {
  store_->BulkUpsert({NewGallery("/g/a")});
  store_->ReplaceImages("/g/a", {ImageRecord{"", "1.jpg", 10, 4, 3, 0},
                                 ImageRecord{"", "2.jpg", 20, 0, 0, 1}});
  store_->MarkImageUploaded("/g/a", "2.jpg", "R2", "https://imx.test/i/R2", "https://t/R2");

  auto images = store_->LoadImages("/g/a");
  ASSERT_EQ(images.size(), 2u);
  EXPECT_EQ(images[0].gallery_path_, "/g/a");
  EXPECT_FALSE(images[0].uploaded_);
  EXPECT_TRUE(images[1].uploaded_);
  EXPECT_EQ(images[1].image_url_, "https://imx.test/i/R2");
  EXPECT_EQ(store_->LoadUploadedFileNames("/g/a"), std::vector<std::string>{"2.jpg"});

  EXPECT_EQ(store_->DeleteByPaths({"/g/a", "/g/none"}), 1u);
  EXPECT_TRUE(store_->LoadImages("/g/a").empty());
}

TEST_F(QueueStoreTests, FailedFilesAndCustomFieldsSurviveReload) {
  auto item              = NewGallery("/g/a");
  item.failed_files_     = {FailedImage{"x.jpg", "Server error", 4}};
  item.custom_fields_[2] = "c3";
  item.dimensions_       = DimensionStats{100, 200, 150.0, 50, 80, 65.0, 2};
  store_->BulkUpsert({item});

  auto loaded = store_->Get("/g/a").value();
  ASSERT_EQ(loaded.failed_files_.size(), 1u);
  EXPECT_EQ(loaded.failed_files_[0].reason_, "Server error");
  EXPECT_EQ(loaded.failed_files_[0].attempts_, 4u);
  EXPECT_EQ(loaded.custom_fields_[2], "c3");
  EXPECT_EQ(loaded.dimensions_.max_width_, 200u);
  EXPECT_DOUBLE_EQ(loaded.dimensions_.avg_height_, 65.0);
}

TEST_F(QueueStoreTests, TabsCanBeManaged) {
  auto work = store_->CreateTab("  Work ");
  EXPECT_EQ(work.name_, "Work");
  EXPECT_FALSE(work.is_default_);
  EXPECT_THROW(store_->CreateTab("Work"), StorageError);
  EXPECT_THROW(store_->CreateTab("   "), ValidationError);

  store_->BulkUpsert({NewGallery("/g/a", GalleryStatus::READY, "Work"), NewGallery("/g/b")});
  store_->RenameTab("Work", "Jobs");
  ASSERT_EQ(store_->LoadByTab("Jobs").size(), 1u);
  EXPECT_TRUE(store_->LoadByTab("Work").empty());

  EXPECT_THROW(store_->RenameTab(kDefaultTabName, "Other"), ValidationError);
  EXPECT_THROW(store_->DeleteTab(kDefaultTabName), ValidationError);
  EXPECT_THROW(store_->DeleteTab("Nope"), ValidationError);

  EXPECT_EQ(store_->MoveToTab({"/g/b"}, "Jobs"), 1u);
  EXPECT_THROW(store_->MoveToTab({"/g/b"}, "Nope"), ValidationError);

  EXPECT_EQ(store_->DeleteTab("Jobs"), 2u);
  EXPECT_EQ(store_->LoadByTab(kDefaultTabName).size(), 2u);
  EXPECT_EQ(store_->LoadTabs().size(), 1u);
}

TEST_F(QueueStoreTests, HostUploadLifecycle) {
  auto record = store_->AddHostUpload("/g/a", "rapid");
  EXPECT_EQ(record.status_, HostUploadStatus::PENDING);
  EXPECT_EQ(store_->AddHostUpload("/g/a", "rapid").id_, record.id_);
  auto other = store_->AddHostUpload("/g/a", "keep");
  EXPECT_NE(other.id_, record.id_);
  EXPECT_EQ(store_->GetPendingHostUploads().size(), 2u);

  HostUploadUpdate start;
  start.status_      = HostUploadStatus::UPLOADING;
  start.total_bytes_ = 1000;
  auto running       = store_->UpdateHostUpload(record.id_, start);
  EXPECT_GT(running.started_ts_, 0);

  HostUploadUpdate back;
  back.status_ = HostUploadStatus::PENDING;
  EXPECT_THROW(store_->UpdateHostUpload(record.id_, back), ValidationError);

  HostUploadUpdate fail;
  fail.status_         = HostUploadStatus::FAILED;
  fail.uploaded_bytes_ = 400;
  fail.error_message_  = "Timed out";
  store_->UpdateHostUpload(record.id_, fail);

  auto retried = store_->UpdateHostUpload(record.id_, back);
  EXPECT_EQ(retried.retry_count_, 1);
  EXPECT_EQ(retried.uploaded_bytes_, 0u);
  EXPECT_TRUE(retried.error_message_.empty());

  EXPECT_THROW(store_->UpdateHostUpload(9999, back), StorageError);

  auto batch = store_->GetAllHostUploadsBatch();
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch.at("/g/a").size(), 2u);

  EXPECT_TRUE(store_->DeleteHostUpload(other.id_));
  EXPECT_FALSE(store_->DeleteHostUpload(other.id_));
}

TEST_F(QueueStoreTests, ConditionalHostUploadUpdateLosesToAClaim) {
  auto record = store_->AddHostUpload("/g/a", "rapid");

  HostUploadUpdate start;
  start.status_ = HostUploadStatus::UPLOADING;
  auto claimed  = store_->UpdateHostUploadIf(record.id_, HostUploadStatus::PENDING, start);
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->status_, HostUploadStatus::UPLOADING);
  EXPECT_GT(claimed->started_ts_, 0);

  HostUploadUpdate cancel;
  cancel.status_ = HostUploadStatus::CANCELLED;
  EXPECT_FALSE(
      store_->UpdateHostUploadIf(record.id_, HostUploadStatus::PENDING, cancel).has_value());
  EXPECT_EQ(store_->GetHostUpload(record.id_)->status_, HostUploadStatus::UPLOADING);
  EXPECT_FALSE(store_->UpdateHostUploadIf(9999, HostUploadStatus::PENDING, cancel).has_value());
}

TEST_F(QueueStoreTests, HostUploadIdsContinueAfterReopen) {
  auto first = store_->AddHostUpload("/g/a", "rapid");
  store_.reset();
  store_      = std::make_shared<QueueStore>(std::make_shared<DBController>(db_path_));
  auto second = store_->AddHostUpload("/g/b", "rapid");
  EXPECT_GT(second.id_, first.id_);
}

TEST_F(QueueStoreTests, InterruptedHostUploadsFail) {
  auto             record = store_->AddHostUpload("/g/a", "rapid");
  HostUploadUpdate start;
  start.status_ = HostUploadStatus::UPLOADING;
  store_->UpdateHostUpload(record.id_, start);

  EXPECT_EQ(store_->RecoverInterruptedHostUploads(), 1u);
  auto failed = store_->GetHostUpload(record.id_).value();
  EXPECT_EQ(failed.status_, HostUploadStatus::FAILED);
  EXPECT_EQ(failed.error_message_, "Interrupted before completion");
}

TEST_F(QueueStoreTests, DeletingGalleryKeepsHostUploads) {
  store_->BulkUpsert({NewGallery("/g/a")});
  store_->AddHostUpload("/g/a", "rapid");
  store_->DeleteByPaths({"/g/a"});
  EXPECT_EQ(store_->GetHostUploads("/g/a").size(), 1u);
}

TEST_F(QueueStoreTests, UnnamedGalleriesAndSettings) {
  store_->AddUnnamedGallery(UnnamedGallery{"G1", "Trip", "/g/a", 0, 0});
  store_->BumpUnnamedAttempts("G1");
  auto pending = store_->LoadUnnamedGalleries();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].attempts_, 1);
  EXPECT_GT(pending[0].queued_ts_, 0);
  store_->RemoveUnnamedGallery("G1");
  EXPECT_TRUE(store_->LoadUnnamedGalleries().empty());

  EXPECT_FALSE(store_->GetSetting("ui").has_value());
  store_->SetSetting("ui", {{"columns", {"name", "status"}}, {"width", 640}});
  store_->SetSetting("ui", {{"width", 800}});
  EXPECT_EQ(store_->GetSetting("ui").value()["width"], 800);
}

TEST_F(QueueStoreTests, StatsCountByStatus) {
  auto a           = NewGallery("/g/a", GalleryStatus::COMPLETED);
  a.total_images_  = 10;
  a.total_size_    = 1000;
  a.uploaded_size_ = 1000;
  store_->BulkUpsert({a, NewGallery("/g/b", GalleryStatus::QUEUED),
                      NewGallery("/g/c", GalleryStatus::QUEUED)});

  auto stats = store_->GetStats();
  EXPECT_EQ(stats.total_galleries_, 3u);
  EXPECT_EQ(stats.by_status_[GalleryStatus::QUEUED], 2u);
  EXPECT_EQ(stats.total_images_, 10u);
  EXPECT_EQ(stats.uploaded_bytes_, 1000u);

  EXPECT_EQ(store_->ClearByStatus({GalleryStatus::COMPLETED}), 1u);
  EXPECT_EQ(store_->GetStats().total_galleries_, 2u);
}
}  // namespace imxup
