#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#pragma GCC diagnostic pop

#include "manifest/pyproject.hpp"
#include "sandbox/docker_isolation.hpp"
#include "sandbox/remote_sandbox.hpp"
#include "transport/ssh_transport.hpp"
#include "util/errors.hpp"
#include "util/version.hpp"

using namespace pybind11::literals;

namespace {

std::unique_ptr<sandbox::Isolation> MakeIsolation(
    const sandbox::DockerIsolation::Options& options) {
  return std::make_unique<sandbox::DockerIsolation>(options);
}

}  // namespace

PYBIND11_MODULE(remote_sandbox_frontend, m) {
  m.doc() = "Remote sandbox frontend module";
  m.attr("__version__") = util::version;

  pybind11::register_exception<util::ConfigurationError>(
      m, "ConfigurationError", PyExc_ValueError);
  pybind11::register_exception<util::ConnectionError>(m, "ConnectionError",
                                                      PyExc_ConnectionError);
  pybind11::register_exception<util::TimeoutError>(m, "TimeoutError",
                                                   PyExc_TimeoutError);

  pybind11::class_<manifest::Dependency>(m, "Dependency")
      .def(pybind11::init<std::string, std::string>(), "name"_a,
           "version_constraints"_a = "")
      .def_static("parse", &manifest::Dependency::Parse, "requirement"_a)
      .def_readwrite("name", &manifest::Dependency::name)
      .def_readwrite("version_constraints",
                     &manifest::Dependency::version_constraints)
      .def("__repr__", [](const manifest::Dependency& dependency) {
        return "<Dependency " + dependency.name +
               dependency.version_constraints + ">";
      });

  pybind11::class_<manifest::Manifest>(m, "Manifest")
      .def("to_string", &manifest::Manifest::ToString)
      .def("__str__", &manifest::Manifest::ToString);

  pybind11::class_<manifest::PyprojectManifest, manifest::Manifest>(
      m, "PyprojectManifest")
      .def(pybind11::init<std::vector<manifest::Dependency>, std::string,
                          std::string, std::string>(),
           "dependencies"_a = std::vector<manifest::Dependency>(),
           "title"_a = "my-project", "python_min_version"_a = "3.13",
           "python_max_version"_a = "4")
      .def_property_readonly("dependencies",
                             &manifest::PyprojectManifest::Dependencies)
      .def_property_readonly("title", &manifest::PyprojectManifest::Title)
      .def_property_readonly("python_min_version",
                             &manifest::PyprojectManifest::PythonMinVersion)
      .def_property_readonly("python_max_version",
                             &manifest::PyprojectManifest::PythonMaxVersion);

  pybind11::class_<transport::RemoteEndpoint>(m, "RemoteEndpoint")
      .def(pybind11::init([](std::string host, int32_t port,
                             std::string username, std::string password,
                             std::string passphrase, std::string key_file) {
             transport::RemoteEndpoint endpoint;
             endpoint.host = std::move(host);
             endpoint.port = port;
             endpoint.username = std::move(username);
             endpoint.password = std::move(password);
             endpoint.passphrase = std::move(passphrase);
             endpoint.key_file = std::move(key_file);
             return endpoint;
           }),
           "host"_a, "port"_a = 22, "username"_a, "password"_a = "",
           "passphrase"_a = "", "key_file"_a = "")
      .def_readonly("host", &transport::RemoteEndpoint::host)
      .def_readonly("port", &transport::RemoteEndpoint::port)
      .def_readonly("username", &transport::RemoteEndpoint::username)
      .def_readonly("key_file", &transport::RemoteEndpoint::key_file);

  pybind11::class_<transport::Transport, std::shared_ptr<transport::Transport>>(
      m, "Transport")
      .def("connect", &transport::Transport::Connect,
           pybind11::call_guard<pybind11::gil_scoped_release>())
      .def("close", &transport::Transport::Close,
           pybind11::call_guard<pybind11::gil_scoped_release>())
      .def_property_readonly("connected", &transport::Transport::IsConnected)
      .def(
          "execute",
          [](transport::Transport& transport, const std::string& command,
             double timeout_seconds) {
            auto output = transport.Execute(command, timeout_seconds);
            return std::make_pair(output.stdout_text, output.stderr_text);
          },
          "command"_a, "timeout"_a = 0,
          pybind11::call_guard<pybind11::gil_scoped_release>());

  pybind11::class_<transport::SshTransport, transport::Transport,
                   std::shared_ptr<transport::SshTransport>>(m, "SshTransport")
      .def(pybind11::init<transport::RemoteEndpoint>(), "endpoint"_a)
      .def_property_readonly("endpoint", &transport::SshTransport::Endpoint)
      .def_property_readonly("uses_key", [](const transport::SshTransport& t) {
        return t.Mode() == transport::SshTransport::AuthMode::KEY;
      });

  pybind11::class_<sandbox::DockerIsolation::Options>(m, "DockerOptions")
      .def(pybind11::init<>())
      .def_readwrite("binary", &sandbox::DockerIsolation::Options::binary)
      .def_readwrite("image", &sandbox::DockerIsolation::Options::image)
      .def_readwrite("block_device",
                     &sandbox::DockerIsolation::Options::block_device);

  pybind11::class_<sandbox::Settings>(m, "Settings")
      .def(pybind11::init<>())
      .def_readwrite("scratch_root", &sandbox::Settings::scratch_root)
      .def_readwrite("manifest_file", &sandbox::Settings::manifest_file)
      .def_readwrite("script_file", &sandbox::Settings::script_file)
      .def_readwrite("run_command", &sandbox::Settings::run_command)
      .def_readwrite("shell", &sandbox::Settings::shell)
      .def_readwrite("kill_timeout_seconds",
                     &sandbox::Settings::kill_timeout_seconds);

  pybind11::class_<sandbox::RunOptions>(m, "RunOptions")
      .def(pybind11::init([](double timeout,
                             std::vector<std::pair<std::string, std::string>>
                                 environment,
                             double cpus, int64_t memory, int32_t processes,
                             std::string read_rate, std::string write_rate) {
             sandbox::RunOptions options;
             options.timeout_seconds = timeout;
             options.environment = std::move(environment);
             options.limits.cpus = cpus;
             options.limits.memory_mb = memory;
             options.limits.processes = processes;
             options.limits.read_rate = std::move(read_rate);
             options.limits.write_rate = std::move(write_rate);
             return options;
           }),
           "timeout"_a = 0,
           "environment"_a = std::vector<std::pair<std::string, std::string>>(),
           "cpus"_a = 0, "memory"_a = 0, "processes"_a = 0,
           "read_rate"_a = "", "write_rate"_a = "")
      .def_readwrite("timeout", &sandbox::RunOptions::timeout_seconds)
      .def_readwrite("environment", &sandbox::RunOptions::environment);

  pybind11::class_<sandbox::RunResult>(m, "RunResult")
      .def_readonly("output", &sandbox::RunResult::output)
      .def_readonly("error", &sandbox::RunResult::error);

  pybind11::class_<sandbox::RemoteSandbox>(m, "RemoteSandbox")
      .def(pybind11::init([](std::string name,
                             std::shared_ptr<transport::Transport> transport,
                             const manifest::Manifest* manifest,
                             const std::string& manifest_path,
                             sandbox::Settings settings,
                             sandbox::DockerIsolation::Options docker) {
             return std::make_unique<sandbox::RemoteSandbox>(
                 std::move(name), std::move(transport), manifest,
                 manifest_path, std::move(settings), MakeIsolation(docker));
           }),
           "name"_a, "transport"_a, "manifest"_a = nullptr,
           "manifest_path"_a = "", "settings"_a = sandbox::Settings(),
           "docker"_a = sandbox::DockerIsolation::Options())
      .def_static(
          "from_connection_args",
          [](std::string name, transport::RemoteEndpoint endpoint,
             const manifest::Manifest* manifest,
             const std::string& manifest_path, sandbox::Settings settings,
             sandbox::DockerIsolation::Options docker) {
            return sandbox::RemoteSandbox::FromConnectionArgs(
                std::move(name), std::move(endpoint), manifest, manifest_path,
                std::move(settings), MakeIsolation(docker));
          },
          "name"_a, "endpoint"_a, "manifest"_a = nullptr,
          "manifest_path"_a = "", "settings"_a = sandbox::Settings(),
          "docker"_a = sandbox::DockerIsolation::Options())
      .def_property_readonly("name", &sandbox::RemoteSandbox::Name)
      .def_property_readonly("manifest", &sandbox::RemoteSandbox::Manifest)
      .def_property_readonly("transport",
                             &sandbox::RemoteSandbox::GetTransport)
      .def("run", &sandbox::RemoteSandbox::Run, "code"_a,
           "options"_a = sandbox::RunOptions(),
           pybind11::call_guard<pybind11::gil_scoped_release>());
}
