#ifndef MANIFEST_PYPROJECT_HPP
#define MANIFEST_PYPROJECT_HPP

#include <string>
#include <vector>

#include "manifest/manifest.hpp"

namespace manifest {

// A single requirement, e.g. name "typing-extensions" and constraints "<5".
struct Dependency {
  std::string name;
  std::string version_constraints;

  // Splits a requirement string such as "numpy>=2" at the first character
  // that cannot be part of a distribution name. A bare name has empty
  // constraints.
  static Dependency Parse(const std::string& requirement);
};

// Renders a pyproject.toml for uv.
class PyprojectManifest : public Manifest {
 public:
  explicit PyprojectManifest(std::vector<Dependency> dependencies,
                             std::string title = "my-project",
                             std::string python_min_version = "3.13",
                             std::string python_max_version = "4")
      : dependencies_(std::move(dependencies)),
        title_(std::move(title)),
        python_min_version_(std::move(python_min_version)),
        python_max_version_(std::move(python_max_version)) {}

  std::string ToString() const override;

  const std::vector<Dependency>& Dependencies() const { return dependencies_; }
  const std::string& Title() const { return title_; }
  const std::string& PythonMinVersion() const { return python_min_version_; }
  const std::string& PythonMaxVersion() const { return python_max_version_; }

 private:
  std::vector<Dependency> dependencies_;
  std::string title_;
  std::string python_min_version_;
  std::string python_max_version_;
};

}  // namespace manifest

#endif
