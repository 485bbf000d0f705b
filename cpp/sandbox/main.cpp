#include "sandbox/main.hpp"
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <system_error>

#include <kj/debug.h>
#include "manifest/pyproject.hpp"
#include "sandbox/docker_isolation.hpp"
#include "util/errors.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {
namespace {

const constexpr char* kPasswordVariable = "REMOTE_SANDBOX_PASSWORD";
const constexpr char* kPassphraseVariable = "REMOTE_SANDBOX_PASSPHRASE";

std::string FromEnvironment(const std::string& value, const char* variable) {
  if (!value.empty()) return value;
  const char* env = getenv(variable);  // NOLINT
  return env == nullptr ? "" : env;
}

std::string ReadScript(const std::string& path) {
  if (path != "-") return util::File::Read(path);
  return std::string(std::istreambuf_iterator<char>(std::cin),
                     std::istreambuf_iterator<char>());
}

}  // namespace

kj::MainBuilder::Validity Main::SetScript(kj::StringPtr path) {
  script = path;
  return true;
}

bool Main::BuildOptions(RunOptions* options, std::string* error) {
  options->timeout_seconds = Flags::timeout;
  for (const std::string& variable : Flags::environment) {
    size_t pos = variable.find('=');
    if (pos == std::string::npos || pos == 0) {
      *error = "Invalid environment variable " + variable +
               ", expected NAME=VALUE";
      return false;
    }
    options->environment.emplace_back(variable.substr(0, pos),
                                      variable.substr(pos + 1));
  }
  options->limits.cpus = Flags::cpus;
  options->limits.memory_mb = Flags::memory;
  options->limits.processes = Flags::processes;
  options->limits.read_rate = Flags::read_rate;
  options->limits.write_rate = Flags::write_rate;
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  if (Flags::host.empty()) return "You need to specify a host!";
  if (Flags::username.empty()) return "You need to specify a user!";
  if (Flags::timeout < 0) return "The timeout cannot be negative!";

  RunOptions options;
  std::string error;
  if (!BuildOptions(&options, &error)) return kj::heapString(error.c_str());

  transport::RemoteEndpoint endpoint;
  endpoint.host = Flags::host;
  endpoint.port = Flags::port;
  endpoint.username = Flags::username;
  endpoint.password = FromEnvironment(Flags::password, kPasswordVariable);
  endpoint.passphrase =
      FromEnvironment(Flags::passphrase, kPassphraseVariable);
  endpoint.key_file = Flags::key_file;

  DockerIsolation::Options runtime;
  runtime.binary = Flags::docker;
  runtime.image = Flags::image;
  runtime.block_device = Flags::block_device;

  std::vector<manifest::Dependency> dependencies;
  for (const std::string& requirement : Flags::dependencies)
    dependencies.push_back(manifest::Dependency::Parse(requirement));
  manifest::PyprojectManifest pyproject(dependencies, Flags::title,
                                        Flags::python_min_version,
                                        Flags::python_max_version);

  std::string failure;
  try {
    std::string code = ReadScript(script);
    auto sandbox = RemoteSandbox::FromConnectionArgs(
        Flags::name, endpoint, Flags::pyproject.empty() ? &pyproject : nullptr,
        Flags::pyproject, Settings(),
        std::make_unique<DockerIsolation>(runtime));
    transport::ScopedSession session(sandbox->GetTransport().get());
    RunResult result = sandbox->Run(code, options);
    std::cout << result.output << std::flush;
    std::cerr << result.error << std::flush;
  } catch (const std::invalid_argument& exc) {
    return kj::heapString(exc.what());
  } catch (const util::TimeoutError& exc) {
    failure = std::string("Timeout: ") + exc.what();
  } catch (const util::ConnectionError& exc) {
    failure = std::string("Connection failed: ") + exc.what();
  } catch (const std::system_error& exc) {
    failure = std::string("Cannot read the script: ") + exc.what();
  }
  if (!failure.empty()) {
    KJ_LOG(ERROR, failure.c_str());
    context.exitError(failure.c_str());
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Remote Sandbox (" + util::version + ")",
                         "Runs a Python script inside a resource-limited "
                         "container on a remote host. Use - to read the "
                         "script from stdin.")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'H', "host"}, util::setString(Flags::host),
                        "<HOST>", "Remote host to connect to")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "SSH port of the remote host")
      .addOptionWithArg({'u', "user"}, util::setString(Flags::username),
                        "<USER>", "User to log in as")
      .addOptionWithArg({"password"}, util::setString(Flags::password),
                        "<PASSWORD>",
                        "Password of the user, defaults to the "
                        "REMOTE_SANDBOX_PASSWORD environment variable")
      .addOptionWithArg({"passphrase"}, util::setString(Flags::passphrase),
                        "<PASSPHRASE>",
                        "Passphrase of the private key, defaults to the "
                        "REMOTE_SANDBOX_PASSPHRASE environment variable")
      .addOptionWithArg({'k', "key-file"}, util::setString(Flags::key_file),
                        "<PATH>", "Private key to authenticate with")
      .addOptionWithArg({'n', "name"}, util::setString(Flags::name),
                        "<NAME>", "Name of the sandbox")
      .addOptionWithArg({'f', "pyproject"}, util::setString(Flags::pyproject),
                        "<PATH>", "Use this pyproject.toml as the manifest")
      .addOptionWithArg({'D', "dependency"},
                        util::appendString(Flags::dependencies),
                        "<REQUIREMENT>", "Add a dependency, e.g. numpy>=2")
      .addOptionWithArg({"title"}, util::setString(Flags::title), "<TITLE>",
                        "Name of the generated project")
      .addOptionWithArg({"python-min"},
                        util::setString(Flags::python_min_version),
                        "<VERSION>", "Lowest supported Python version")
      .addOptionWithArg({"python-max"},
                        util::setString(Flags::python_max_version),
                        "<VERSION>", "First unsupported Python version")
      .addOptionWithArg({'t', "timeout"}, util::setDouble(Flags::timeout),
                        "<SECONDS>", "Time budget of the run, 0 for none")
      .addOptionWithArg({'e', "env"}, util::appendString(Flags::environment),
                        "<NAME=VALUE>", "Export a variable to the script")
      .addOptionWithArg({"cpus"}, util::setDouble(Flags::cpus), "<CPUS>",
                        "CPU share of the container")
      .addOptionWithArg({"memory"}, util::setInt64(Flags::memory), "<MB>",
                        "Memory limit of the container in MiB")
      .addOptionWithArg({"processes"}, util::setInt(Flags::processes), "<N>",
                        "Maximum number of processes in the container")
      .addOptionWithArg({"read-rate"}, util::setString(Flags::read_rate),
                        "<RATE>", "Block device read rate, e.g. 10mb")
      .addOptionWithArg({"write-rate"}, util::setString(Flags::write_rate),
                        "<RATE>", "Block device write rate, e.g. 10mb")
      .addOptionWithArg({"image"}, util::setString(Flags::image), "<IMAGE>",
                        "Container image to run the script in")
      .addOptionWithArg({"block-device"},
                        util::setString(Flags::block_device), "<DEVICE>",
                        "Device the rate limits apply to")
      .addOptionWithArg({"docker"}, util::setString(Flags::docker), "<PATH>",
                        "Container runtime on the remote host")
      .expectArg("<SCRIPT>", KJ_BIND_METHOD(*this, SetScript))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
