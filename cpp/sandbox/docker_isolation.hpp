#ifndef SANDBOX_DOCKER_ISOLATION_HPP
#define SANDBOX_DOCKER_ISOLATION_HPP

#include "sandbox/isolation.hpp"

namespace sandbox {

class DockerIsolation : public Isolation {
 public:
  struct Options {
    std::string binary = "docker";
    std::string image = "ghcr.io/astral-sh/uv:alpine";
    // The device the throughput limits apply to.
    std::string block_device = "/dev/sda";
  };

  DockerIsolation() = default;
  explicit DockerIsolation(Options options);

  // docker run --pids-limit P --cpus C -m Mm --device-read-bps=DEV:R
  //   --device-write-bps=DEV:W [-e NAME]... --rm --name N IMAGE COMMAND...
  std::vector<std::string> LaunchArgs(const LaunchSpec& spec) const override;
  std::vector<std::string> RemoveArgs(
      const std::string& instance_name) const override;

  const Options& GetOptions() const { return options_; }

 private:
  Options options_;
};

}  // namespace sandbox

#endif
