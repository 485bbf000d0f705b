#include "sandbox/remote_sandbox.hpp"

#include <kj/debug.h>
#include <cctype>
#include <cmath>
#include <cstring>
#include <stdexcept>

#include "sandbox/docker_isolation.hpp"
#include "sandbox/shell.hpp"
#include "util/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {

const constexpr size_t kTokenSize = 12;
const constexpr char* kTimeoutCommand = "timeout";

// Names that would change how the launching shell finds and runs the
// container runtime.
const constexpr char* kHostVariables[] = {"PATH", "HOME", "IFS", "ENV",
                                          "SHELL"};
const constexpr char* kHostPrefixes[] = {"DOCKER_", "LD_"};

// Container runtimes require the first character to be alphanumeric.
bool IsValidName(const std::string& name) {
  if (name.empty() || !isalnum(static_cast<unsigned char>(name[0])))
    return false;
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' &&
        c != '-') return false;
  }
  return true;
}

bool IsIdentifier(const std::string& name) {
  if (name.empty() || isdigit(static_cast<unsigned char>(name[0])))
    return false;
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

bool AffectsHost(const std::string& name) {
  for (const char* variable : kHostVariables) {
    if (name == variable) return true;
  }
  for (const char* prefix : kHostPrefixes) {
    if (name.compare(0, strlen(prefix), prefix) == 0) return true;
  }
  return false;
}

// Appends a heredoc that writes text to path.
void WriteFile(const std::string& path, const std::string& text,
               const std::string& marker, std::string* script) {
  *script += "cat > " + sandbox::QuoteArgument(path) + " << \"" + marker +
             "\"\n" + text;
  if (!text.empty() && text.back() != '\n') *script += "\n";
  *script += marker + "\n";
}

}  // namespace

namespace sandbox {

RemoteSandbox::RemoteSandbox(std::string name,
                             std::shared_ptr<transport::Transport> transport,
                             const manifest::Manifest* manifest,
                             const std::string& manifest_path,
                             Settings settings,
                             std::unique_ptr<Isolation> isolation)
    : name_(std::move(name)),
      transport_(std::move(transport)),
      settings_(std::move(settings)),
      isolation_(std::move(isolation)) {
  if (!IsValidName(name_))
    throw util::ConfigurationError(
        "invalid sandbox name \"" + name_ +
        "\": it must start with a letter or a digit and contain only "
        "letters, digits, '_', '.' and '-'");
  if (!transport_) throw util::ConfigurationError("missing transport");
  if (manifest == nullptr && manifest_path.empty())
    throw util::ConfigurationError(
        "either a manifest or a manifest path must be provided");
  if (manifest != nullptr && !manifest_path.empty())
    throw util::ConfigurationError(
        "a manifest and a manifest path cannot be provided together");
  if (manifest != nullptr) {
    manifest_ = manifest->ToString();
  } else {
    if (!util::File::IsRegularFile(manifest_path))
      throw util::ConfigurationError("invalid path: " + manifest_path);
    manifest_ = util::File::Read(manifest_path);
  }
  if (!isolation_) isolation_ = std::make_unique<DockerIsolation>();
  KJ_LOG(INFO, "Sandbox created", name_.c_str(), manifest_.size());
}

std::unique_ptr<RemoteSandbox> RemoteSandbox::FromConnectionArgs(
    std::string name, transport::RemoteEndpoint endpoint,
    const manifest::Manifest* manifest, const std::string& manifest_path,
    Settings settings, std::unique_ptr<Isolation> isolation) {
  auto transport =
      std::make_shared<transport::SshTransport>(std::move(endpoint));
  return std::make_unique<RemoteSandbox>(std::move(name), std::move(transport),
                                         manifest, manifest_path,
                                         std::move(settings),
                                         std::move(isolation));
}

std::string RemoteSandbox::BuildCommand(
    const std::string& code, const RunOptions& options,
    const std::string& instance_name) const {
  std::string directory =
      util::File::JoinPath(settings_.scratch_root, instance_name);
  std::string marker = HeredocMarker({manifest_, code});

  std::string script = "set -e\n";
  script += "mkdir -p " + QuoteArgument(directory) + "\n";
  WriteFile(util::File::JoinPath(directory, settings_.manifest_file),
            manifest_, marker, &script);
  WriteFile(util::File::JoinPath(directory, settings_.script_file), code,
            marker, &script);
  script += "cd " + QuoteArgument(directory) + "\n";
  script += settings_.run_command + "\n";

  LaunchSpec spec;
  spec.instance_name = instance_name;
  spec.limits = options.limits.WithDefaults();
  for (const auto& variable : options.environment) {
    if (!IsIdentifier(variable.first))
      throw std::invalid_argument("invalid environment variable name \"" +
                                  variable.first + "\"");
    if (AffectsHost(variable.first))
      throw std::invalid_argument("environment variable \"" +
                                  variable.first +
                                  "\" would affect the container runtime");
    spec.environment_names.push_back(variable.first);
  }
  // The budget is enforced inside the instance too, so that it holds even
  // if the instance starts after the transport gave up on it.
  if (options.timeout_seconds > 0) {
    spec.command = {kTimeoutCommand,
                    std::to_string(static_cast<int64_t>(
                        std::ceil(options.timeout_seconds))),
                    settings_.shell, "-c", script};
  } else {
    spec.command = {settings_.shell, "-c", script};
  }

  std::string command = JoinArguments(isolation_->LaunchArgs(spec));
  if (options.environment.empty()) return command;
  return RenderExports(options.environment) + " && " + command;
}

RunResult RemoteSandbox::Run(const std::string& code,
                             const RunOptions& options) {
  std::string instance_name = name_ + "-" + util::random_hex(kTokenSize);
  std::string command = BuildCommand(code, options, instance_name);
  KJ_LOG(INFO, "Running code", instance_name.c_str(), code.size(),
         options.timeout_seconds);

  transport::CommandOutput output;
  try {
    output = transport_->Execute(command, options.timeout_seconds);
  } catch (const util::TimeoutError& exc) {
    KJ_LOG(WARNING, "Run timed out, removing instance", instance_name.c_str(),
           exc.what());
    RemoveInstance(instance_name);
    throw;
  }
  KJ_LOG(INFO, "Run completed", instance_name.c_str(),
         output.stdout_text.size(), output.stderr_text.size());
  return RunResult{std::move(output.stdout_text),
                   std::move(output.stderr_text)};
}

void RemoteSandbox::RemoveInstance(const std::string& instance_name) {
  std::string command = JoinArguments(isolation_->RemoveArgs(instance_name));
  try {
    transport::CommandOutput output =
        transport_->Execute(command, settings_.kill_timeout_seconds);
    if (!output.stderr_text.empty()) {
      KJ_LOG(WARNING, "Cannot remove instance", instance_name.c_str(),
             output.stderr_text.c_str());
    }
  } catch (const std::runtime_error& exc) {
    KJ_LOG(WARNING, "Cannot remove instance", instance_name.c_str(),
           exc.what());
  }
}

}  // namespace sandbox
