#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/completion_worker.hpp"
#include "support/fake_hosts.hpp"
#include "support/gallery_test_fixation.hpp"

namespace imxup {
namespace {
class RecordingProcessor : public PostProcessor {
 public:
  explicit RecordingProcessor(bool fail = false) : fail_(fail) {}

  auto Name() const -> std::string override { return "recording"; }
  void Process(const CompletionJob& job) override {
    std::lock_guard<std::mutex> lock(mtx_);
    seen_.push_back(job.gallery_.path_);
    if (fail_) throw std::runtime_error("processor exploded");
  }

  auto Seen() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_;
  }

 private:
  bool                     fail_;
  std::mutex               mtx_;
  std::vector<std::string> seen_;
};

auto Job(const std::string& path, const std::string& name = "Trip") -> CompletionJob {
  CompletionJob job;
  job.gallery_.path_            = path;
  job.gallery_.name_            = name;
  job.gallery_.status_          = GalleryStatus::COMPLETED;
  job.result_.gallery_name_     = name;
  job.result_.gallery_id_       = "G1";
  job.result_.gallery_url_      = "https://imx.test/g/G1";
  job.result_.total_images_     = 2;
  job.result_.successful_count_ = 2;
  job.result_.images_.push_back(UploadedImage{"a.jpg", "a", "https://imx.test/i/a", {}, 10, 4, 3});
  job.result_.images_.push_back(UploadedImage{"b.jpg", "b", "https://imx.test/i/b", {}, 20, 4, 3});
  return job;
}
}  // namespace

class CompletionWorkerTests : public QueueStoreTestFixation {};

TEST(CompletionWorkerTest, RunsJobsInSubmissionOrder) {
  auto             recorder = std::make_shared<RecordingProcessor>();
  CompletionWorker worker;
  worker.AddProcessor(recorder);
  worker.Start();
  for (int i = 0; i < 20; ++i) worker.Submit(Job("/g/" + std::to_string(i)));
  worker.Stop();

  auto seen = recorder->Seen();
  ASSERT_EQ(seen.size(), 20u);
  for (int i = 0; i < 20; ++i) EXPECT_EQ(seen[i], "/g/" + std::to_string(i));
  EXPECT_EQ(worker.Processed(), 20u);
}

TEST(CompletionWorkerTest, FailingProcessorDoesNotStopTheOthers) {
  auto             failing  = std::make_shared<RecordingProcessor>(true);
  auto             recorder = std::make_shared<RecordingProcessor>();
  CompletionWorker worker;
  worker.AddProcessor(failing);
  worker.AddProcessor(recorder);

  EXPECT_NO_THROW(worker.ProcessNow(Job("/g/a")));
  EXPECT_EQ(failing->Seen().size(), 1u);
  EXPECT_EQ(recorder->Seen().size(), 1u);
}

TEST(CompletionWorkerTest, StopWithoutStartDrainsOnCaller) {
  auto             recorder = std::make_shared<RecordingProcessor>();
  CompletionWorker worker;
  worker.AddProcessor(recorder);
  worker.Submit(Job("/g/a"));
  worker.Submit(Job("/g/b"));
  worker.Stop();
  EXPECT_EQ(recorder->Seen(), (std::vector<std::string>{"/g/a", "/g/b"}));
}

TEST_F(CompletionWorkerTests, ArtifactWriterWritesSummary) {
  ArtifactWriter writer(root_ / "artifacts");
  auto           job = Job("/g/trip", "Trip: Day 1/2");

  auto path = writer.ArtifactPath(job);
  EXPECT_EQ(path.filename().string(), "Trip_ Day 1_2_G1.json");

  writer.Process(job);
  std::ifstream in(path);
  ASSERT_TRUE(in.is_open());
  auto doc = nlohmann::json::parse(in);
  EXPECT_EQ(doc["gallery_name"], "Trip: Day 1/2");
  EXPECT_EQ(doc["gallery_url"], "https://imx.test/g/G1");
  EXPECT_EQ(doc["status"], GalleryStatusToString(GalleryStatus::COMPLETED));
  EXPECT_EQ(doc["successful_count"], 2);
  ASSERT_EQ(doc["images"].size(), 2u);
  EXPECT_EQ(doc["images"][1]["image_url"], "https://imx.test/i/b");
  EXPECT_TRUE(doc["failed_details"].empty());
}

TEST_F(CompletionWorkerTests, RenameRetriesUntilAttemptsRunOut) {
  auto host = std::make_shared<FakeImageHost>();
  host->FailRename(2);
  store_->AddUnnamedGallery(UnnamedGallery{"G1", "Summer", "/g/summer", 0, 0});

  RenamePostProcessor renamer(store_, host, 2);
  EXPECT_EQ(renamer.RetryPending(), 0u);
  EXPECT_EQ(renamer.RetryPending(), 0u);
  auto pending = store_->LoadUnnamedGalleries();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].attempts_, 2);

  // Out of attempts: never tried again
  EXPECT_EQ(renamer.RetryPending(), 0u);
  EXPECT_TRUE(host->Renames().empty());

  RenamePostProcessor patient(store_, host, 5);
  EXPECT_EQ(patient.RetryPending(), 1u);
  EXPECT_TRUE(store_->LoadUnnamedGalleries().empty());
  EXPECT_EQ(host->Renames().at("G1"), "Summer");
}
}  // namespace imxup
