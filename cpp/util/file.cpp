#include "util/file.hpp"

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadBufferSize = 64 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

bool OsMakeExecutable(const std::string& path) {
  return chmod(path.c_str(), S_IRUSR | S_IWUSR | S_IXUSR) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  KJ_REQUIRE(tmp->size() < max_path_len, tmp->size(), max_path_len,
             "Path too long");
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[kReadBufferSize];
  ssize_t amount;
  while ((amount = read(fd.get(), buf, kReadBufferSize)) != 0) {  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    content.append(buf, amount);
  }
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite, bool exist_ok) {
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!BaseDir(path).empty()) MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) {
    if (exist_ok) return;
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  std::string temp_file;
  kj::AutoCloseFd fd = OsTempFile(path, &temp_file);
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  bool done = false;
  KJ_DEFER(if (!done) OsRemove(temp_file));
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd.get(), content.data() + pos,  // NOLINT
                            content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(),
                              "write " + temp_file);
    }
    pos += written;
  }
  if (fsync(fd.get()) == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  int err = OsAtomicMove(temp_file, path, overwrite);
  if (err != 0) {
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
  done = true;
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

void File::MakeExecutable(const std::string& path) {
  if (!OsMakeExecutable(path)) {
    throw std::system_error(errno, std::system_category(), "chmod");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, first.back()) != nullptr) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsRegularFile(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
