#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads the whole file specified by path. Throws std::system_error if the
  // file cannot be opened or read.
  static std::string Read(const std::string& path);

  // Writes content to path, atomically replacing it if overwrite is true. If
  // overwrite is false and the file exists, nothing is written when exist_ok
  // is true, otherwise an exception is thrown.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false, bool exist_ok = true);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Make a file executable
  static void MakeExecutable(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path exists and is a regular file (symlinks are
  // followed).
  static bool IsRegularFile(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
