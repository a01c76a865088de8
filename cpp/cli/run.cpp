#include "cli/run.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "cli/manifest.hpp"
#include "core/concurrency_controller.hpp"
#include "core/coordinator.hpp"
#include "core/errors.hpp"
#include "core/local_source.hpp"
#include "core/rate_governor.hpp"
#include "core/scheduler.hpp"
#include "core/transfer_manager.hpp"
#include "core/transfer_state_store.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace cli {

namespace {
// Prints one line per finished task on stdout.
class PrintingSink : public core::StatusSink {
 public:
  void Project(const core::TaskOutcome& outcome) override {
    std::lock_guard<std::mutex> lck(mutex_);
    std::cout << core::ToString(outcome.status) << " " << outcome.id;
    if (outcome.status == core::TaskStatus::DONE) {
      std::cout << " " << outcome.final_path;
    } else if (outcome.reason != core::FailureReason::NONE) {
      std::cout << " " << core::ToString(outcome.reason) << ": "
                << outcome.message;
    }
    std::cout << std::endl;
  }

 private:
  std::mutex mutex_;
};

bool CheckDependencies(const std::vector<core::Task>& tasks,
                       std::string* error) {
  std::set<std::string> ids;
  for (const auto& task : tasks) ids.insert(task.id);
  for (const auto& task : tasks) {
    for (const auto& dep : task.depends_on) {
      if (ids.count(dep)) continue;
      *error = "Task " + task.id + " depends on unknown task " + dep;
      return false;
    }
  }
  return true;
}
}  // namespace

kj::MainBuilder::Validity RunMain::Run() {
  if (Flags::manifest.empty()) {
    return "You need to specify a manifest!";
  }
  if (Flags::max_concurrent <= 0) {
    return "The number of concurrent downloads must be positive!";
  }
  if (Flags::chunk_size_kb == 0) {
    return "The chunk size must be positive!";
  }
  if (Flags::max_attempts <= 0) {
    return "The number of attempts must be positive!";
  }
  util::LogManager log_manager(context);

  std::vector<core::Task> tasks;
  std::string error;
  if (!LoadManifest(Flags::manifest, &tasks, &error) ||
      !CheckDependencies(tasks, &error)) {
    return kj::heapString(error.c_str());
  }

  core::SchedulerConfig scheduler_config;
  scheduler_config.allow_priority_updates = Flags::allow_priority_updates;
  core::ConcurrencyConfig concurrency_config;
  concurrency_config.max_concurrent = Flags::max_concurrent;
  concurrency_config.resource_ceiling = Flags::resource_ceiling;
  core::RateGovernorConfig rate_config;
  rate_config.initial_rate = Flags::rate;
  rate_config.burst_capacity = Flags::burst;
  rate_config.min_rate = Flags::min_rate;
  rate_config.max_rate = std::max(Flags::max_rate, Flags::rate);
  core::TransferConfig transfer_config;
  transfer_config.download_directory = Flags::download_directory;
  transfer_config.chunk_size = static_cast<uint64_t>(Flags::chunk_size_kb) * 1024;
  transfer_config.verify_on_resume = !Flags::skip_resume_verification;
  core::CoordinatorConfig coordinator_config;
  coordinator_config.max_attempts = Flags::max_attempts;

  core::TransferStateStore store(Flags::state_directory);
  core::Scheduler scheduler(scheduler_config);
  core::ConcurrencyController controller(concurrency_config);
  core::RateGovernor governor(rate_config);
  core::TransferManager transfers(transfer_config, &store);
  core::LocalFileSource source(Flags::source_directory);
  PrintingSink sink;
  core::Coordinator coordinator(coordinator_config, &scheduler, &controller,
                                &governor, &store, &transfers, &source, &sink);

  bool ok = true;
  std::vector<std::shared_future<core::TaskOutcome>> outcomes;
  std::map<std::string, std::set<std::string>> enqueued;
  std::set<std::string> rejected;
  for (auto& task : tasks) {
    std::string id = task.id;
    std::set<std::string> deps = task.depends_on;
    try {
      coordinator.Enqueue(std::move(task));
      outcomes.push_back(coordinator.Subscribe(id));
      enqueued.emplace(id, std::move(deps));
    } catch (core::DuplicateTaskError& exc) {
      KJ_LOG(ERROR, "Skipping task", id, exc.what());
      ok = false;
    } catch (core::DependencyCycleError& exc) {
      KJ_LOG(ERROR, "Skipping task", id, exc.what());
      rejected.insert(id);
      ok = false;
    } catch (kj::Exception& exc) {
      KJ_LOG(ERROR, "Skipping task", id, exc.getDescription());
      rejected.insert(id);
      ok = false;
    }
  }
  // Nothing would ever complete the dependencies of these.
  for (const auto& kv : enqueued) {
    for (const auto& dep : kv.second) {
      if (!rejected.count(dep)) continue;
      KJ_LOG(ERROR, "Cancelling task, its dependency was skipped", kv.first,
             dep);
      coordinator.Cancel(kv.first);
      break;
    }
  }

  coordinator.Start();
  for (auto& outcome : outcomes) {
    if (outcome.get().status != core::TaskStatus::DONE) ok = false;
  }
  coordinator.Stop();

  if (!ok) return "Some downloads did not complete";
  return true;
}

kj::MainFunc RunMain::getMain() {
  return kj::MainBuilder(context, util::version_banner,
                         "Downloads the tasks listed in a manifest")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'m', "manifest"}, util::setString(&Flags::manifest),
                        "<FILE>", "Manifest listing the tasks to download")
      .addOptionWithArg({'S', "state-dir"},
                        util::setString(&Flags::state_directory), "<DIR>",
                        "Path where the transfer checkpoints are stored")
      .addOptionWithArg({'D', "download-dir"},
                        util::setString(&Flags::download_directory), "<DIR>",
                        "Path where the downloaded files are stored")
      .addOptionWithArg({"source-dir"},
                        util::setString(&Flags::source_directory), "<DIR>",
                        "Directory relative sources are resolved against")
      .addOptionWithArg({'j', "max-concurrent"},
                        util::setInt(&Flags::max_concurrent), "<N>",
                        "Maximum number of concurrent downloads")
      .addOptionWithArg(
          {'r', "resource-ceiling"}, util::setUint64(&Flags::resource_ceiling),
          "<N>",
          "Maximum total resource of concurrent downloads. 0 means unlimited")
      .addOptionWithArg({"rate"}, util::setDouble(&Flags::rate), "<R>",
                        "Initial request rate, per second")
      .addOptionWithArg({"burst"}, util::setDouble(&Flags::burst), "<B>",
                        "Maximum burst of requests")
      .addOptionWithArg({"min-rate"}, util::setDouble(&Flags::min_rate), "<R>",
                        "Lowest rate reached under backpressure")
      .addOptionWithArg({"max-rate"}, util::setDouble(&Flags::max_rate), "<R>",
                        "Highest rate reached while recovering")
      .addOptionWithArg({"chunk-size"}, util::setUint(&Flags::chunk_size_kb),
                        "<KB>", "Size of a checkpointed chunk, in kilobytes")
      .addOptionWithArg({"max-attempts"}, util::setInt(&Flags::max_attempts),
                        "<N>", "Attempts before a download is given up")
      .addOption({"allow-priority-updates"},
                 util::setBool(&Flags::allow_priority_updates),
                 "Allow changing priorities of queued tasks")
      .addOption({"skip-resume-verification"},
                 util::setBool(&Flags::skip_resume_verification),
                 "Trust partial files without re-hashing them")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace cli
