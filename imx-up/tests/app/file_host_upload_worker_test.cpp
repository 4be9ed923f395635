#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "app/event_bus.hpp"
#include "app/file_host_upload_worker.hpp"
#include "concurrency/atomic_counter.hpp"
#include "support/fake_hosts.hpp"
#include "support/gallery_test_fixation.hpp"

namespace imxup {
class FileHostUploadWorkerTests : public QueueStoreTestFixation {
 protected:
  std::shared_ptr<EventBus>            bus_          = std::make_shared<EventBus>();
  std::shared_ptr<AtomicCounter>       global_bytes_ = std::make_shared<AtomicCounter>();
  std::shared_ptr<FakeArchiveProvider> archives_;
  file_path_t                          archive_;

  void SetUp() override {
    QueueStoreTestFixation::SetUp();
    archive_ = root_ / "gallery.zip";
    WriteFile(archive_, 8192);
    archives_ = std::make_shared<FakeArchiveProvider>(archive_);
  }

  static auto FastOptions() -> FileHostWorkerOptions {
    FileHostWorkerOptions options;
    options.retry_delay_       = std::chrono::milliseconds(0);
    options.poll_interval_     = std::chrono::milliseconds(20);
    options.progress_interval_ = std::chrono::milliseconds(0);
    return options;
  }

  auto Worker(std::shared_ptr<HostClient> client) -> std::unique_ptr<FileHostUploadWorker> {
    return std::make_unique<FileHostUploadWorker>(
        store_,
        [client](const std::string& host_id) -> std::shared_ptr<HostClient> {
          return client && client->Config().id_ == host_id ? client : nullptr;
        },
        archives_, bus_, global_bytes_, FastOptions());
  }

  auto Status(host_upload_id_t id) -> HostUploadStatus {
    return store_->GetHostUpload(id).value().status_;
  }
};

TEST_F(FileHostUploadWorkerTests, CompletesPendingRecord) {
  auto host         = std::make_shared<FakeFileHost>(FileHostConfig("rapid"));
  auto subscription = bus_->Subscribe();
  auto record       = store_->AddHostUpload("/g/trip", "rapid");

  auto worker = Worker(host);
  EXPECT_EQ(worker->ProcessPending(), 1u);

  auto done = store_->GetHostUpload(record.id_).value();
  EXPECT_EQ(done.status_, HostUploadStatus::COMPLETED);
  EXPECT_EQ(done.download_url_, "https://rapid.test/d/gallery.zip");
  EXPECT_EQ(done.file_id_, "F1");
  EXPECT_EQ(done.total_bytes_, 8192u);
  EXPECT_EQ(done.uploaded_bytes_, 8192u);
  EXPECT_GT(done.finished_ts_, 0);
  EXPECT_EQ(global_bytes_->Get(), 8192u);
  EXPECT_EQ(archives_->Released(), 1);

  HostUploadStatus last = HostUploadStatus::PENDING;
  while (auto event = subscription->TryNext()) {
    ASSERT_TRUE(std::holds_alternative<HostUploadChanged>(*event));
    last = std::get<HostUploadChanged>(*event).record_.status_;
  }
  EXPECT_EQ(last, HostUploadStatus::COMPLETED);

  // Nothing left to do
  EXPECT_EQ(worker->ProcessPending(), 0u);
  EXPECT_EQ(host->Uploads(), 1);
}

TEST_F(FileHostUploadWorkerTests, TransientFailuresAreRetried) {
  std::atomic<int> calls{0};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid", 2, true, 2),
      [&calls](const file_path_t&, const UploadProgressCallback&, const CancellationToken*) {
        if (++calls < 3) throw NetworkError("Connection reset");
        return FileUploadResult{FileUploadStatus::SUCCESS, "https://rapid.test/d/x", "X", {}};
      });
  auto record = store_->AddHostUpload("/g/trip", "rapid");

  Worker(host)->ProcessPending();

  EXPECT_EQ(calls.load(), 3);
  EXPECT_EQ(Status(record.id_), HostUploadStatus::COMPLETED);
}

TEST_F(FileHostUploadWorkerTests, GivesUpAfterMaxRetriesAndCanBeRetriedByHand) {
  std::atomic<int>  calls{0};
  std::atomic<bool> healthy{false};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid", 2, true, 1),
      [&](const file_path_t&, const UploadProgressCallback&, const CancellationToken*) {
        ++calls;
        if (!healthy.load()) throw UploadError("Upload failed with status 500", {}, 500);
        return FileUploadResult{FileUploadStatus::SUCCESS, "https://rapid.test/d/x", "X", {}};
      });
  auto record = store_->AddHostUpload("/g/trip", "rapid");
  auto worker = Worker(host);

  worker->ProcessPending();
  auto failed = store_->GetHostUpload(record.id_).value();
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(failed.status_, HostUploadStatus::FAILED);
  EXPECT_EQ(failed.error_message_, "Upload failed with status 500");

  healthy = true;
  auto retried = worker->Retry(record.id_);
  EXPECT_EQ(retried.status_, HostUploadStatus::PENDING);
  EXPECT_EQ(retried.retry_count_, 1);
  EXPECT_TRUE(retried.error_message_.empty());

  worker->ProcessPending();
  EXPECT_EQ(Status(record.id_), HostUploadStatus::COMPLETED);

  // Completed records cannot be retried
  EXPECT_THROW(worker->Retry(record.id_), ValidationError);
}

TEST_F(FileHostUploadWorkerTests, NoAutoRetryMeansOneAttempt) {
  std::atomic<int> calls{0};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid", 2, false, 5),
      [&calls](const file_path_t&, const UploadProgressCallback&,
               const CancellationToken*) -> FileUploadResult {
        ++calls;
        throw NetworkError("Timed out");
      });
  auto record = store_->AddHostUpload("/g/trip", "rapid");

  Worker(host)->ProcessPending();
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(Status(record.id_), HostUploadStatus::FAILED);
}

TEST_F(FileHostUploadWorkerTests, AuthenticationFailureIsNotRetried) {
  std::atomic<int> calls{0};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid"),
      [&calls](const file_path_t&, const UploadProgressCallback&,
               const CancellationToken*) -> FileUploadResult {
        ++calls;
        throw AuthenticationError("Login failed: Wrong password");
      });
  auto record = store_->AddHostUpload("/g/trip", "rapid");

  Worker(host)->ProcessPending();
  EXPECT_EQ(calls.load(), 1);
  auto failed = store_->GetHostUpload(record.id_).value();
  EXPECT_EQ(failed.status_, HostUploadStatus::FAILED);
  EXPECT_EQ(failed.error_message_, "Login failed: Wrong password");
}

TEST_F(FileHostUploadWorkerTests, RunningUploadCanBeCancelled) {
  std::atomic<bool> started{false};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid"),
      [&started](const file_path_t&, const UploadProgressCallback&,
                 const CancellationToken* cancel) -> FileUploadResult {
        started = true;
        while (!IsCancelled(cancel)) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        throw CancelledError("Transfer aborted", "REMOTE1");
      });
  auto record = store_->AddHostUpload("/g/trip", "rapid");
  auto worker = Worker(host);

  std::thread runner([&worker] { worker->ProcessPending(); });
  while (!started.load()) std::this_thread::sleep_for(std::chrono::milliseconds(2));
  EXPECT_TRUE(worker->Cancel(record.id_));
  runner.join();

  auto cancelled = store_->GetHostUpload(record.id_).value();
  EXPECT_EQ(cancelled.status_, HostUploadStatus::CANCELLED);
  EXPECT_EQ(cancelled.orphaned_file_id_, "REMOTE1");
}

TEST_F(FileHostUploadWorkerTests, PendingRecordIsCancelledRightAway) {
  auto host   = std::make_shared<FakeFileHost>(FileHostConfig("rapid"));
  auto record = store_->AddHostUpload("/g/trip", "rapid");
  auto worker = Worker(host);

  EXPECT_TRUE(worker->Cancel(record.id_));
  EXPECT_EQ(Status(record.id_), HostUploadStatus::CANCELLED);
  EXPECT_FALSE(worker->Cancel(record.id_));
  EXPECT_EQ(worker->ProcessPending(), 0u);
  EXPECT_EQ(host->Uploads(), 0);
}

TEST_F(FileHostUploadWorkerTests, CancelLeavesARecordClaimedElsewhere) {
  auto host   = std::make_shared<FakeFileHost>(FileHostConfig("rapid"));
  auto record = store_->AddHostUpload("/g/trip", "rapid");
  auto worker = Worker(host);

  HostUploadUpdate start;
  start.status_ = HostUploadStatus::UPLOADING;
  ASSERT_TRUE(
      store_->UpdateHostUploadIf(record.id_, HostUploadStatus::PENDING, start).has_value());

  EXPECT_FALSE(worker->Cancel(record.id_));
  EXPECT_EQ(Status(record.id_), HostUploadStatus::UPLOADING);
  EXPECT_EQ(worker->ProcessPending(), 0u);
  EXPECT_EQ(host->Uploads(), 0);
}

TEST_F(FileHostUploadWorkerTests, MissingArchiveOrHostFailsTheRecord) {
  archives_   = std::make_shared<FakeArchiveProvider>(file_path_t{});
  auto host   = std::make_shared<FakeFileHost>(FileHostConfig("rapid"));
  auto first  = store_->AddHostUpload("/g/trip", "rapid");
  auto second = store_->AddHostUpload("/g/trip", "unknown");

  Worker(host)->ProcessPending();

  auto no_archive = store_->GetHostUpload(first.id_).value();
  EXPECT_EQ(no_archive.status_, HostUploadStatus::FAILED);
  EXPECT_EQ(no_archive.error_message_, "No archive for /g/trip");
  auto no_host = store_->GetHostUpload(second.id_).value();
  EXPECT_EQ(no_host.status_, HostUploadStatus::FAILED);
  EXPECT_EQ(no_host.error_message_, "Host not configured");
  EXPECT_EQ(host->Uploads(), 0);
}

TEST_F(FileHostUploadWorkerTests, HostConnectionLimitIsHonored) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  auto host = std::make_shared<FakeFileHost>(
      FileHostConfig("rapid", 2),
      [&](const file_path_t&, const UploadProgressCallback&, const CancellationToken*) {
        int now = ++running;
        for (int seen = peak.load(); now > seen && !peak.compare_exchange_weak(seen, now);) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --running;
        return FileUploadResult{FileUploadStatus::SUCCESS, "https://rapid.test/d/x", "X", {}};
      });
  for (int i = 0; i < 6; ++i) store_->AddHostUpload("/g/" + std::to_string(i), "rapid");

  EXPECT_EQ(Worker(host)->ProcessPending(), 6u);
  EXPECT_LE(peak.load(), 2);
  EXPECT_EQ(host->Uploads(), 6);
}

TEST_F(FileHostUploadWorkerTests, BackgroundThreadPicksUpNewRecords) {
  auto host   = std::make_shared<FakeFileHost>(FileHostConfig("rapid"));
  auto worker = Worker(host);
  worker->Start();

  auto record = store_->AddHostUpload("/g/trip", "rapid");
  worker->Notify();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (Status(record.id_) != HostUploadStatus::COMPLETED &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker->Stop();
  EXPECT_EQ(Status(record.id_), HostUploadStatus::COMPLETED);
}

TEST_F(FileHostUploadWorkerTests, SiblingArchiveIsFoundNextToFolder) {
  auto folder = MakeGallery("Trip", 1);
  WriteFile(root_ / "Trip.7z", 10);

  SiblingArchiveProvider provider;
  EXPECT_EQ(provider.PrepareArchive(folder.string(), "rapid"), root_ / "Trip.7z");
  WriteFile(root_ / "Trip.zip", 10);
  EXPECT_EQ(provider.PrepareArchive(folder.string(), "rapid"), root_ / "Trip.zip");
  EXPECT_THROW(provider.PrepareArchive((root_ / "Other").string(), "rapid"), ValidationError);
}
}  // namespace imxup
