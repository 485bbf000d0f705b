#ifndef MANIFEST_MANIFEST_HPP
#define MANIFEST_MANIFEST_HPP

#include <string>

namespace manifest {

// Description of the project that the dependency installer inside the
// sandbox consumes.
class Manifest {
 public:
  virtual std::string ToString() const = 0;
  virtual ~Manifest() = default;
};

}  // namespace manifest

#endif
