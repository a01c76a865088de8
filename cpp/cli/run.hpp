#ifndef CLI_RUN_HPP
#define CLI_RUN_HPP
#include <kj/main.h>

namespace cli {

// Downloads every task of a manifest, resuming interrupted transfers.
class RunMain {
 public:
  explicit RunMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace cli
#endif
