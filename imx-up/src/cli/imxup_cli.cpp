//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.


#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "app/completion_worker.hpp"
#include "app/event_bus.hpp"
#include "app/file_host_upload_worker.hpp"
#include "app/host_client_factory.hpp"
#include "app/queue_manager.hpp"
#include "config/app_config.hpp"
#include "host/host_config.hpp"
#include "host/http_transport.hpp"
#include "host/token_cache.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/controller/queue/queue_store.hpp"
#include "type/errors.hpp"
#include "utils/log/logger.hpp"

using namespace imxup;

namespace {
constexpr const char* kUsage =
    "usage: imxup_cli [--config FILE] <command> [args]\n"
    "\n"
    "commands:\n"
    "  add <folder>... [--tab T] [--name N]   add folders to the queue and scan them\n"
    "  list [--tab T]                         show the queue\n"
    "  start                                  queue every ready gallery\n"
    "  run                                    upload queued galleries until none is left\n"
    "  retry <folder>                         queue a failed, incomplete or paused gallery\n"
    "  remove <folder>...                     remove galleries from the queue\n"
    "  tabs [create N | rename OLD NEW | delete N [--to T]]\n"
    "  test-host <host_id> [--upload]         check credentials of a host\n";

struct Arguments {
  std::optional<std::string>                 config_file_;
  std::string                                command_;
  std::vector<std::string>                   positional_;
  std::map<std::string, std::string>         options_;
  std::map<std::string, bool>                flags_;
};

auto ParseArguments(int argc, char** argv) -> Arguments {
  static const std::map<std::string, bool> kTakesValue = {
      {"--config", true}, {"--tab", true}, {"--name", true}, {"--to", true}, {"--upload", false}};

  Arguments args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.starts_with("--")) {
      auto it = kTakesValue.find(arg);
      if (it == kTakesValue.end()) {
        throw ValidationError("Unknown option " + arg);
      }
      if (!it->second) {
        args.flags_[arg] = true;
        continue;
      }
      if (i + 1 >= argc) {
        throw ValidationError("Option " + arg + " needs a value");
      }
      if (arg == "--config") {
        args.config_file_ = argv[++i];
      } else {
        args.options_[arg] = argv[++i];
      }
    } else if (args.command_.empty()) {
      args.command_ = arg;
    } else {
      args.positional_.push_back(arg);
    }
  }
  return args;
}

auto Option(const Arguments& args, const std::string& name) -> std::optional<std::string> {
  auto it = args.options_.find(name);
  if (it == args.options_.end()) return std::nullopt;
  return it->second;
}

auto LoadConfig(const Arguments& args) -> AppConfig {
  if (args.config_file_.has_value()) return AppConfig::LoadFile(*args.config_file_);
  if (std::filesystem::exists("imxup.json")) return AppConfig::LoadFile("imxup.json");
  return AppConfig{};
}

auto FormatBytes(uint64_t bytes) -> std::string {
  static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double             value    = static_cast<double>(bytes);
  size_t             unit     = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  return unit == 0 ? std::format("{} B", bytes) : std::format("{:.1f} {}", value, kUnits[unit]);
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void PrintEvent(const Event& event) {
  std::visit(
      Overloaded{
          [](const GalleryStarted& e) {
            std::cout << std::format("[start] {} ({} images)\n", e.name_, e.total_images_);
          },
          [](const ProgressUpdated& e) {
            std::cout << std::format("[{:3}%] {}/{} {}\n", e.percent_, e.completed_, e.total_,
                                     e.current_file_);
          },
          [](const GalleryCompleted& e) {
            std::cout << std::format("[{}] {} ({} ok, {} failed) {}\n",
                                     GalleryStatusToString(e.status_), e.path_, e.successful_,
                                     e.failed_, e.gallery_url_);
          },
          [](const GalleryFailed& e) {
            std::cout << std::format("[failed] {}: {}\n", e.path_, e.reason_);
          },
          [](const GalleryPaused& e) {
            std::cout << std::format("[paused] {} ({}/{})\n", e.path_, e.uploaded_, e.total_);
          },
          [](const HostUploadChanged& e) {
            if (e.record_.status_ == HostUploadStatus::UPLOADING) return;
            std::cout << std::format("[{}] {} {}\n", e.record_.host_name_,
                                     HostUploadStatusToString(e.record_.status_),
                                     e.record_.download_url_.empty() ? e.record_.error_message_
                                                                     : e.record_.download_url_);
          },
          [](const auto&) {},
      },
      event);
  std::cout.flush();
}

/**
 * @brief Everything a command may need, wired the same way for every command.
 */
struct Application {
  AppConfig                             config_;
  HostConfigRegistry                    registry_;
  std::shared_ptr<QueueStore>           store_;
  std::shared_ptr<EventBus>             bus_;
  std::shared_ptr<HostClientFactory>    factory_;
  std::shared_ptr<CompletionWorker>     completion_;
  std::shared_ptr<FileHostUploadWorker> file_hosts_;
  std::unique_ptr<QueueManager>         queue_;

  explicit Application(AppConfig config) : config_(std::move(config)) {
    registry_.LoadDirectory(config_.hosts_directory_);
    store_   = std::make_shared<QueueStore>(std::make_shared<DBController>(config_.database_path_));
    bus_     = std::make_shared<EventBus>(config_.queue_.event_capacity_);
    factory_ = std::make_shared<HostClientFactory>(
        registry_, std::make_shared<CurlTransport>(),
        std::make_shared<TokenCache>(config_.token_cache_path_),
        std::make_shared<EnvCredentialVault>());
    completion_ = std::make_shared<CompletionWorker>();
    completion_->AddProcessor(std::make_shared<ArtifactWriter>(config_.artifacts_directory_));

    auto                  global_bytes = std::make_shared<AtomicCounter>();
    FileHostWorkerOptions worker_options;
    worker_options.retry_delay_ = config_.engine_.retry_delay_;
    file_hosts_                 = std::make_shared<FileHostUploadWorker>(
        store_,
        [factory = factory_](const std::string& id) -> std::shared_ptr<HostClient> {
          return factory->FileHost(id);
        },
        std::make_shared<SiblingArchiveProvider>(), bus_, global_bytes, worker_options);

    QueueManagerOptions options;
    options.worker_count_          = config_.queue_.worker_count_;
    options.image_host_id_         = config_.image_host_id_;
    options.template_name_         = config_.engine_.template_name_;
    options.thumbnail_size_        = config_.engine_.thumbnail_size_;
    options.thumbnail_format_      = config_.engine_.thumbnail_format_;
    options.max_retries_           = config_.engine_.max_retries_;
    options.parallel_batch_size_   = config_.engine_.parallel_batch_size_;
    options.retry_delay_           = config_.engine_.retry_delay_;
    options.auto_start_file_hosts_ = config_.queue_.auto_start_file_hosts_;
    options.bandwidth_             = config_.bandwidth_;
    queue_ = std::make_unique<QueueManager>(
        store_,
        [factory = factory_](const std::string& id) -> std::shared_ptr<ImageHostClient> {
          return factory->ImageHost(id);
        },
        &registry_, bus_, completion_, file_hosts_, global_bytes, options);
  }
};

auto CmdAdd(Application& app, const Arguments& args) -> int {
  if (args.positional_.empty()) {
    std::cerr << "add: no folder given\n";
    return 2;
  }
  std::vector<folder_path_t> folders(args.positional_.begin(), args.positional_.end());
  auto added = app.queue_->AddFolders(folders, Option(args, "--tab").value_or(kDefaultTabName),
                                      Option(args, "--name"));
  for (const auto& item : added) {
    std::cout << std::format("{:<10} {} ({} images, {})", GalleryStatusToString(item.status_),
                             item.name_, item.total_images_, FormatBytes(item.total_size_));
    if (!item.error_message_.empty()) std::cout << ": " << item.error_message_;
    std::cout << "\n";
  }
  return 0;
}

auto CmdList(Application& app, const Arguments& args) -> int {
  auto tab   = Option(args, "--tab");
  auto items = tab.has_value() ? app.store_->LoadByTab(*tab) : app.store_->LoadAll();
  for (const auto& item : items) {
    std::cout << std::format("{:>4} {:<10} {:<8} {:>4}/{:<4} {:>10}  {}", item.insertion_order_,
                             GalleryStatusToString(item.status_), item.tab_name_,
                             item.uploaded_images_, item.total_images_,
                             FormatBytes(item.total_size_), item.path_);
    if (!item.gallery_url_.empty()) std::cout << "  " << item.gallery_url_;
    if (!item.error_message_.empty()) std::cout << "  (" << item.error_message_ << ")";
    std::cout << "\n";
    for (const auto& upload : app.store_->GetHostUploads(item.path_)) {
      std::cout << std::format("       #{} {} {} {}/{}\n", upload.id_, upload.host_name_,
                               HostUploadStatusToString(upload.status_),
                               FormatBytes(upload.uploaded_bytes_),
                               FormatBytes(upload.total_bytes_));
    }
  }
  auto stats = app.store_->GetStats();
  std::cout << std::format("{} galleries, {} images, {}\n", stats.total_galleries_,
                           stats.total_images_, FormatBytes(stats.total_bytes_));
  return 0;
}

auto CmdRun(Application& app) -> int {
  auto image_host = app.factory_->ImageHost(app.config_.image_host_id_);
  app.completion_->AddProcessor(std::make_shared<RenamePostProcessor>(app.store_, image_host));
  app.completion_->Start();

  auto              subscription = app.bus_->Subscribe();
  std::atomic<bool> done{false};
  std::thread       printer([&] {
    while (!done.load() || subscription->Pending() > 0) {
      if (auto event = subscription->Next(std::chrono::milliseconds(200))) PrintEvent(*event);
    }
  });

  auto   processed = app.queue_->RunUntilEmpty();
  size_t transfers =
      app.config_.queue_.auto_start_file_hosts_ ? app.file_hosts_->ProcessPending() : 0;
  app.completion_->Stop();

  done.store(true);
  printer.join();
  std::cout << std::format("Processed {} galleries and {} file host uploads\n", processed,
                           transfers);
  return 0;
}

auto CmdTabs(Application& app, const Arguments& args) -> int {
  const auto& pos = args.positional_;
  if (!pos.empty()) {
    if (pos[0] == "create" && pos.size() == 2) {
      app.store_->CreateTab(pos[1]);
    } else if (pos[0] == "rename" && pos.size() == 3) {
      app.store_->RenameTab(pos[1], pos[2]);
    } else if (pos[0] == "delete" && pos.size() == 2) {
      auto moved = app.store_->DeleteTab(pos[1], Option(args, "--to").value_or(kDefaultTabName));
      std::cout << std::format("Moved {} galleries\n", moved);
    } else {
      std::cerr << kUsage;
      return 2;
    }
  }
  for (const auto& tab : app.store_->LoadTabs()) {
    std::cout << std::format("{:>3} {}{}  ({} galleries)\n", tab.display_order_, tab.name_,
                             tab.is_default_ ? " [default]" : "",
                             app.store_->LoadByTab(tab.name_).size());
  }
  return 0;
}

auto CmdTestHost(Application& app, const Arguments& args) -> int {
  if (args.positional_.size() != 1) {
    std::cerr << "test-host: expected one host id\n";
    return 2;
  }
  const auto& id     = args.positional_[0];
  const auto* config = app.registry_.Get(id);
  if (config == nullptr) {
    std::cerr << "Unknown host " << id << "\n";
    return 1;
  }

  if (config->kind_ == HostKind::IMAGE_HOST) {
    app.factory_->ImageHost(id)->Session().EnsureAuthenticated();
    std::cout << std::format("{}: credentials accepted\n", config->name_);
    return 0;
  }

  auto client = app.factory_->FileHost(id);
  auto result = client->TestCredentials();
  std::cout << std::format("{}: {}\n", config->name_, result.message_);
  if (result.storage_.has_value() && result.storage_->left_bytes_.has_value()) {
    std::cout << std::format("  storage left: {}\n", FormatBytes(*result.storage_->left_bytes_));
  }
  if (!result.success_) return 1;

  if (args.flags_.contains("--upload")) {
    auto upload = client->TestUpload();
    std::cout << std::format("  test upload: {}\n", upload.message_);
    if (!upload.success_) return 1;
  }
  return 0;
}

auto Dispatch(Application& app, const Arguments& args) -> int {
  const auto& cmd = args.command_;
  if (cmd == "add") return CmdAdd(app, args);
  if (cmd == "list") return CmdList(app, args);
  if (cmd == "start") {
    std::cout << std::format("Queued {} galleries\n", app.queue_->StartAll());
    return 0;
  }
  if (cmd == "run") return CmdRun(app);
  if (cmd == "retry") {
    if (args.positional_.size() != 1) {
      std::cerr << "retry: expected one folder\n";
      return 2;
    }
    auto path = QueueManager::NormalizePath(args.positional_[0]);
    auto item = app.queue_->Retry(path);
    std::cout << std::format("{} is {}\n", item.name_, GalleryStatusToString(item.status_));
    return 0;
  }
  if (cmd == "remove") {
    std::vector<gallery_key_t> paths;
    for (const auto& folder : args.positional_) {
      paths.push_back(QueueManager::NormalizePath(folder));
    }
    std::cout << std::format("Removed {} galleries\n", app.queue_->Remove(paths));
    return 0;
  }
  if (cmd == "tabs") return CmdTabs(app, args);
  if (cmd == "test-host") return CmdTestHost(app, args);

  std::cerr << kUsage;
  return 2;
}
}  // namespace

auto main(int argc, char** argv) -> int {
  try {
    auto args = ParseArguments(argc, argv);
    if (args.command_.empty()) {
      std::cerr << kUsage;
      return 2;
    }
    auto config = LoadConfig(args);
    Logger::Init(config.log_);

    Application app(std::move(config));
    int         code = Dispatch(app, args);
    Logger::Shutdown();
    return code;
  } catch (const ImxupError& e) {
    std::cerr << "error: " << e.Reason();
    if (!e.Details().empty()) std::cerr << " (" << e.Details() << ")";
    std::cerr << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
