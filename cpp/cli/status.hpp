#ifndef CLI_STATUS_HPP
#define CLI_STATUS_HPP
#include <kj/main.h>

namespace cli {

// Lists the checkpoints of unfinished transfers.
class StatusMain {
 public:
  explicit StatusMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace cli
#endif
