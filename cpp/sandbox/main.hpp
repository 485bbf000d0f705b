#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>
#include <string>

#include "sandbox/remote_sandbox.hpp"

namespace sandbox {

// The "run" subcommand: runs a script in a sandbox on a remote host and
// prints what it wrote on stdout and stderr to the same streams.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity SetScript(kj::StringPtr script);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  // Returns false and sets error on malformed flags.
  bool BuildOptions(RunOptions* options, std::string* error);

  kj::ProcessContext& context;
  std::string script;
};
}  // namespace sandbox
#endif
