#include "manifest/main.hpp"
#include "sandbox/main.hpp"
#include "util/version.hpp"

class RemoteSandboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit RemoteSandboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), mm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Remote Sandbox (" + util::version + ")",
                           "Runs untrusted Python code in containers on "
                           "remote hosts")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a script in a remote sandbox")
        .addSubCommand("manifest", KJ_BIND_METHOD(mm, getMain),
                       "print the generated pyproject.toml")
        .build();
  }

 private:
  kj::ProcessContext& context;
  sandbox::Main rm;
  manifest::Main mm;
};

KJ_MAIN(RemoteSandboxMain);
