#include "sandbox/docker_isolation.hpp"

#include <utility>

#include "util/errors.hpp"
#include "util/misc.hpp"

namespace sandbox {

DockerIsolation::DockerIsolation(Options options)
    : options_(std::move(options)) {
  if (options_.binary.empty())
    throw util::ConfigurationError("the container runtime cannot be empty");
  if (options_.image.empty())
    throw util::ConfigurationError("the container image cannot be empty");
  if (options_.block_device.empty())
    throw util::ConfigurationError("the block device cannot be empty");
}

std::vector<std::string> DockerIsolation::LaunchArgs(
    const LaunchSpec& spec) const {
  const ResourceLimits& limits = spec.limits;
  std::vector<std::string> args = {
      options_.binary,
      "run",
      "--pids-limit",
      std::to_string(limits.processes),
      "--cpus",
      util::format_number(limits.cpus),
      "-m",
      std::to_string(limits.memory_mb) + "m",
      "--device-read-bps=" + options_.block_device + ":" + limits.read_rate,
      "--device-write-bps=" + options_.block_device + ":" + limits.write_rate};
  for (const std::string& name : spec.environment_names) {
    args.push_back("-e");
    args.push_back(name);
  }
  args.insert(args.end(),
              {"--rm", "--name", spec.instance_name, options_.image});
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

std::vector<std::string> DockerIsolation::RemoveArgs(
    const std::string& instance_name) const {
  return {options_.binary, "rm", "-f", instance_name};
}

}  // namespace sandbox
