#include "cli/run.hpp"
#include "cli/status.hpp"
#include "util/version.hpp"

class AudioFetchMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit AudioFetchMain(kj::ProcessContext& context)
      : context(context), rm(&context), sm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, util::version_banner,
                           "Schedules and resumes audio downloads")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "download the tasks of a manifest")
        .addSubCommand("status", KJ_BIND_METHOD(sm, getMain),
                       "show unfinished downloads")
        .build();
  }

 private:
  kj::ProcessContext& context;
  cli::RunMain rm;
  cli::StatusMain sm;
};

KJ_MAIN(AudioFetchMain);
