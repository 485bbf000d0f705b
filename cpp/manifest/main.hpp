#ifndef MANIFEST_MAIN_HPP
#define MANIFEST_MAIN_HPP
#include <kj/main.h>

namespace manifest {

// The "manifest" subcommand: prints the pyproject.toml that "run" would
// send for the same flags.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace manifest
#endif
