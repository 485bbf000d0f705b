#include "manifest/pyproject.hpp"

#include <sstream>

namespace {

const constexpr char* kConstraintStart = "<>=!~;[@ ";

std::string TomlString(const std::string& s) {
  std::string quoted = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') quoted += '\\';
    quoted += c;
  }
  return quoted + "\"";
}

}  // namespace

namespace manifest {

Dependency Dependency::Parse(const std::string& requirement) {
  size_t pos = requirement.find_first_of(kConstraintStart);
  if (pos == std::string::npos) return {requirement, ""};
  return {requirement.substr(0, pos), requirement.substr(pos)};
}

std::string PyprojectManifest::ToString() const {
  std::ostringstream out;
  out << "[project]\n";
  out << "name = " << TomlString(title_) << "\n";
  out << "version = \"0.1.0\"\n";
  out << "description = \"Add your description here\"\n";
  out << "requires-python = "
      << TomlString(">=" + python_min_version_ + ",<" + python_max_version_)
      << "\n";
  out << "dependencies = [\n";
  for (const Dependency& dependency : dependencies_) {
    out << "    "
        << TomlString(dependency.name + dependency.version_constraints)
        << ",\n";
  }
  out << "]\n";
  return out.str();
}

}  // namespace manifest
