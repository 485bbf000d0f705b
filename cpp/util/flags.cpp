#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::host;
int32_t Flags::port = 22;
std::string Flags::username;
std::string Flags::password;
std::string Flags::passphrase;
std::string Flags::key_file;

std::string Flags::pyproject;
std::vector<std::string> Flags::dependencies;
std::string Flags::title = "my-project";
std::string Flags::python_min_version = "3.13";
std::string Flags::python_max_version = "4";

std::string Flags::name = "sandbox";
double Flags::timeout = 0;
std::vector<std::string> Flags::environment;
double Flags::cpus = 0;
int64_t Flags::memory = 0;
int32_t Flags::processes = 0;
std::string Flags::read_rate;
std::string Flags::write_rate;

std::string Flags::docker = "docker";
std::string Flags::image = "ghcr.io/astral-sh/uv:alpine";
std::string Flags::block_device = "/dev/sda";
