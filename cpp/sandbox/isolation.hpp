#ifndef SANDBOX_ISOLATION_HPP
#define SANDBOX_ISOLATION_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sandbox {

const constexpr double kDefaultCpus = 1;
const constexpr int64_t kDefaultMemoryMb = 512;
const constexpr int32_t kDefaultProcesses = 100;
const constexpr char* kDefaultRate = "10mb";

// Resource ceilings of one sandbox instance. A zero or empty field means
// "not set" and is replaced by the corresponding default in WithDefaults.
struct ResourceLimits {
  double cpus = 0;
  int64_t memory_mb = 0;
  int32_t processes = 0;
  // Block device throughput, in the runtime's own notation ("10mb").
  std::string read_rate;
  std::string write_rate;

  ResourceLimits WithDefaults() const {
    ResourceLimits limits = *this;
    if (limits.cpus <= 0) limits.cpus = kDefaultCpus;
    if (limits.memory_mb <= 0) limits.memory_mb = kDefaultMemoryMb;
    if (limits.processes <= 0) limits.processes = kDefaultProcesses;
    if (limits.read_rate.empty()) limits.read_rate = kDefaultRate;
    if (limits.write_rate.empty()) limits.write_rate = kDefaultRate;
    return limits;
  }
};

// What to start inside a fresh isolated instance.
struct LaunchSpec {
  // Unique per launch, used to address the instance afterwards.
  std::string instance_name;
  ResourceLimits limits;
  // Variables of the launching shell to forward into the instance.
  std::vector<std::string> environment_names;
  std::vector<std::string> command;
};

// Turns launch requests into the command lines of a container runtime on the
// remote host. The instance is removed by the runtime when its command
// exits.
class Isolation {
 public:
  virtual std::vector<std::string> LaunchArgs(const LaunchSpec& spec) const = 0;
  // Forcibly stops and removes a running instance.
  virtual std::vector<std::string> RemoveArgs(
      const std::string& instance_name) const = 0;
  virtual ~Isolation() = default;
};

}  // namespace sandbox

#endif
