#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>
#include <vector>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // Connection flags
  static std::string host;
  static int32_t port;
  static std::string username;
  static std::string password;
  static std::string passphrase;
  static std::string key_file;

  // Manifest flags
  static std::string pyproject;
  static std::vector<std::string> dependencies;
  static std::string title;
  static std::string python_min_version;
  static std::string python_max_version;

  // Run flags
  static std::string name;
  static double timeout;
  static std::vector<std::string> environment;
  static double cpus;
  static int64_t memory;
  static int32_t processes;
  static std::string read_rate;
  static std::string write_rate;

  // Container runtime flags
  static std::string docker;
  static std::string image;
  static std::string block_device;
};

#endif
