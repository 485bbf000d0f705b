#ifndef SANDBOX_REMOTE_SANDBOX_HPP
#define SANDBOX_REMOTE_SANDBOX_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "manifest/manifest.hpp"
#include "sandbox/isolation.hpp"
#include "transport/ssh_transport.hpp"
#include "transport/transport.hpp"

namespace sandbox {

// Where and how the code is laid out inside the instance.
struct Settings {
  std::string scratch_root = "/tmp";
  std::string manifest_file = "pyproject.toml";
  std::string script_file = "script.py";
  // Shell syntax, run from the working directory.
  std::string run_command = "uv run script.py";
  std::string shell = "/bin/sh";
  // Budget for removing the instance of a timed-out run.
  double kill_timeout_seconds = 30;
};

struct RunOptions {
  // 0 waits indefinitely. Otherwise the command inside the instance is also
  // run under timeout(1), rounded up to whole seconds.
  double timeout_seconds = 0;
  // Exported in order by the shell that launches the container runtime, and
  // forwarded into the instance by name. Names must be shell identifiers,
  // and names that steer the runtime itself (PATH, HOME, IFS, ENV, SHELL,
  // DOCKER_*, LD_*) are rejected.
  std::vector<std::pair<std::string, std::string>> environment;
  ResourceLimits limits;
};

struct RunResult {
  std::string output;
  std::string error;
};

// Runs untrusted code on a remote host, inside a fresh resource-limited
// container, together with the manifest describing its dependencies.
//
// Each Run is independent: it gets its own working directory and instance
// name, so concurrent runs of the same sandbox do not collide as long as the
// transport is used by one caller at a time.
class RemoteSandbox {
 public:
  // Exactly one of manifest and manifest_path must be given. The manifest
  // text is derived (or read) here, once. Throws util::ConfigurationError on
  // invalid arguments.
  RemoteSandbox(std::string name,
                std::shared_ptr<transport::Transport> transport,
                const manifest::Manifest* manifest,
                const std::string& manifest_path,
                Settings settings = Settings(),
                std::unique_ptr<Isolation> isolation = nullptr);

  static std::unique_ptr<RemoteSandbox> FromConnectionArgs(
      std::string name, transport::RemoteEndpoint endpoint,
      const manifest::Manifest* manifest, const std::string& manifest_path,
      Settings settings = Settings(),
      std::unique_ptr<Isolation> isolation = nullptr);

  // Throws util::TimeoutError or util::ConnectionError from the transport,
  // after removing the instance in the first case. Throws
  // std::invalid_argument for a rejected environment name.
  RunResult Run(const std::string& code,
                const RunOptions& options = RunOptions());

  // The command that Run would execute in instance instance_name.
  std::string BuildCommand(const std::string& code, const RunOptions& options,
                           const std::string& instance_name) const;

  const std::string& Name() const { return name_; }
  const std::string& Manifest() const { return manifest_; }
  const std::shared_ptr<transport::Transport>& GetTransport() const {
    return transport_;
  }
  const Settings& GetSettings() const { return settings_; }

 private:
  void RemoveInstance(const std::string& instance_name);

  std::string name_;
  std::shared_ptr<transport::Transport> transport_;
  std::string manifest_;
  Settings settings_;
  std::unique_ptr<Isolation> isolation_;
};

}  // namespace sandbox

#endif
