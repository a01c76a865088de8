#include "cli/status.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

#include "core/transfer_state_store.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace cli {

kj::MainBuilder::Validity StatusMain::Run() {
  util::LogManager log_manager(context);
  core::TransferStateStore store(Flags::state_directory);
  std::vector<core::TransferState> states = store.List();
  std::sort(states.begin(), states.end(),
            [](const core::TransferState& a, const core::TransferState& b) {
              return a.task_id < b.task_id;
            });
  if (states.empty()) {
    std::cout << "No unfinished transfers" << std::endl;
    return true;
  }
  for (const auto& state : states) {
    std::cout << std::left << std::setw(24) << state.task_id << " "
              << std::right << std::setw(12) << state.bytes_confirmed;
    if (state.total_size > 0) {
      double percent = 100.0 * state.bytes_confirmed / state.total_size;
      std::cout << " / " << std::setw(12) << state.total_size << " "
                << std::fixed << std::setprecision(1) << std::setw(5)
                << percent << "%";
    }
    std::cout << " " << state.chunks.size() << " chunks";
    if (state.invalidated) {
      std::cout << " INVALIDATED " << state.last_error;
    }
    std::cout << std::endl;
  }
  return true;
}

kj::MainFunc StatusMain::getMain() {
  return kj::MainBuilder(context, util::version_banner,
                         "Shows the checkpoints of unfinished downloads")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'S', "state-dir"},
                        util::setString(&Flags::state_directory), "<DIR>",
                        "Path where the transfer checkpoints are stored")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace cli
