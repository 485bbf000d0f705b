#include "manifest/main.hpp"
#include <iostream>

#include "manifest/pyproject.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace manifest {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  std::vector<Dependency> dependencies;
  for (const std::string& requirement : Flags::dependencies)
    dependencies.push_back(Dependency::Parse(requirement));
  PyprojectManifest pyproject(dependencies, Flags::title,
                              Flags::python_min_version,
                              Flags::python_max_version);
  std::cout << pyproject.ToString() << std::flush;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Remote Sandbox (" + util::version + ")",
                         "Prints the pyproject.toml generated for a run")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages")
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
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace manifest
