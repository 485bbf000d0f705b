#include "transport/ssh_transport.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <mutex>

#include <kj/debug.h>

#include "util/errors.hpp"
#include "util/misc.hpp"

namespace {

static const constexpr size_t kReadBufferSize = 32 * 1024;
// Upper bound for blocking libssh2 calls made while tearing down a channel or
// a session, so that a dead peer cannot hang the cleanup.
static const constexpr long kCleanupTimeoutMillis = 5000;

void InitLibssh2() {
  static std::once_flag once;
  std::call_once(once, []() {
    int rc = libssh2_init(0);
    KJ_ASSERT(rc == 0, "libssh2_init failed", rc);
  });
}

std::string SessionError(LIBSSH2_SESSION* session) {
  char* msg = nullptr;
  int len = 0;
  libssh2_session_last_error(session, &msg, &len, 0);
  if (msg == nullptr || len == 0) return "unknown error";
  return std::string(msg, len);
}

std::string HexFingerprint(const char* hash, size_t size) {
  static const constexpr char* digits = "0123456789abcdef";
  std::string hex;
  for (size_t i = 0; i < size; i++) {
    if (i > 0) hex += ':';
    unsigned char c = hash[i];
    hex += digits[c >> 4];
    hex += digits[c & 0xf];
  }
  return hex;
}

kj::AutoCloseFd OpenSocket(const std::string& host, int32_t port) {
  struct addrinfo hints {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  int rc =
      getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
  if (rc != 0) {
    throw util::ConnectionError("resolve " + host + ": " + gai_strerror(rc));
  }
  KJ_DEFER(freeaddrinfo(res));
  std::string error = "no usable address";
  for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    kj::AutoCloseFd fd(
        socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (fd.get() == -1) {
      error = strerror(errno);
      continue;
    }
    if (connect(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0) return fd;
    error = strerror(errno);
  }
  throw util::ConnectionError("connect to " + host + ":" +
                              std::to_string(port) + ": " + error);
}

}  // namespace

namespace transport {

SshTransport::SshTransport(RemoteEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {
  if (endpoint_.host.empty()) {
    throw util::ConfigurationError("missing host");
  }
  if (endpoint_.username.empty()) {
    throw util::ConfigurationError("missing username");
  }
  if (endpoint_.port <= 0 || endpoint_.port > 65535) {
    throw util::ConfigurationError("invalid port " +
                                   std::to_string(endpoint_.port));
  }
  if (endpoint_.password.empty() && endpoint_.passphrase.empty()) {
    throw util::ConfigurationError(
        "missing credential: provide a password or a key passphrase");
  }
  if (endpoint_.passphrase.empty()) {
    mode_ = AuthMode::PASSWORD;
    secret_ = endpoint_.password;
  } else if (!endpoint_.key_file.empty()) {
    mode_ = AuthMode::KEY;
    secret_ = endpoint_.passphrase;
  } else if (!endpoint_.password.empty()) {
    mode_ = AuthMode::PASSWORD;
    secret_ = endpoint_.password;
  } else {
    throw util::ConfigurationError(
        "passphrase requires a key reference: provide the private key file");
  }
}

SshTransport::~SshTransport() { Close(); }

void SshTransport::Connect() {
  if (session_ != nullptr) return;
  InitLibssh2();
  KJ_LOG(INFO, "Connecting", endpoint_.host.c_str(), endpoint_.port,
         endpoint_.username.c_str(),
         mode_ == AuthMode::KEY ? "key" : "password");

  kj::AutoCloseFd fd = OpenSocket(endpoint_.host, endpoint_.port);
  LIBSSH2_SESSION* session = libssh2_session_init();
  if (session == nullptr) {
    throw util::ConnectionError("libssh2_session_init failed");
  }
  bool established = false;
  KJ_DEFER(if (!established) {
    libssh2_session_disconnect(session, "Connection aborted");
    libssh2_session_free(session);
  });

  libssh2_session_set_blocking(session, 1);
  if (libssh2_session_handshake(session, fd.get()) != 0) {
    throw util::ConnectionError("SSH handshake with " + endpoint_.host +
                                " failed: " + SessionError(session));
  }
  const char* fingerprint =
      libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA1);
  if (fingerprint != nullptr) {
    KJ_LOG(INFO, "Host key", endpoint_.host.c_str(),
           HexFingerprint(fingerprint, 20).c_str());
  }

  int rc = 0;
  if (mode_ == AuthMode::KEY) {
    rc = libssh2_userauth_publickey_fromfile(
        session, endpoint_.username.c_str(), nullptr,
        endpoint_.key_file.c_str(), secret_.c_str());
  } else {
    rc = libssh2_userauth_password(session, endpoint_.username.c_str(),
                                   secret_.c_str());
  }
  if (rc != 0) {
    throw util::ConnectionError("authentication as " + endpoint_.username +
                                "@" + endpoint_.host +
                                " failed: " + SessionError(session));
  }

  session_ = session;
  socket_ = kj::mv(fd);
  established = true;
  KJ_LOG(INFO, "Connected", endpoint_.host.c_str());
}

void SshTransport::Close() {
  if (session_ == nullptr) return;
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(session_, kCleanupTimeoutMillis);
  libssh2_session_disconnect(session_, "Normal shutdown");
  libssh2_session_free(session_);
  session_ = nullptr;
  socket_ = nullptr;
  KJ_LOG(INFO, "Disconnected", endpoint_.host.c_str());
}

std::string SshTransport::LastError() const { return SessionError(session_); }

void SshTransport::WaitSocket(Deadline deadline, double timeout_seconds) {
  int wait_millis = -1;
  if (deadline != Deadline::max()) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw util::TimeoutError("remote command timed out after " +
                               util::format_number(timeout_seconds) +
                               " seconds");
    }
    wait_millis = remaining.count() > INT_MAX
                      ? INT_MAX
                      : static_cast<int>(remaining.count()) + 1;
  }
  int directions = libssh2_session_block_directions(session_);
  struct pollfd pfd {};
  pfd.fd = socket_.get();
  if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) pfd.events |= POLLIN;
  if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) pfd.events |= POLLOUT;
  if (pfd.events == 0) pfd.events = POLLIN;
  if (poll(&pfd, 1, wait_millis) == -1 && errno != EINTR) {
    throw util::ConnectionError(std::string("poll: ") + strerror(errno));
  }
}

void SshTransport::FreeChannel(LIBSSH2_CHANNEL* channel) {
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(session_, kCleanupTimeoutMillis);
  libssh2_channel_free(channel);
  libssh2_session_set_timeout(session_, 0);
}

CommandOutput SshTransport::Execute(const std::string& command,
                                    double timeout_seconds) {
  Connect();
  Deadline deadline = Deadline::max();
  if (timeout_seconds > 0) {
    deadline = std::chrono::steady_clock::now() +
               std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                   std::chrono::duration<double>(timeout_seconds));
  }
  KJ_LOG(INFO, "Executing remote command", endpoint_.host.c_str(),
         command.size(), timeout_seconds);

  libssh2_session_set_blocking(session_, 0);
  KJ_DEFER(libssh2_session_set_blocking(session_, 1));

  LIBSSH2_CHANNEL* channel = nullptr;
  while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
    if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
      throw util::ConnectionError("cannot open channel: " + LastError());
    }
    WaitSocket(deadline, timeout_seconds);
  }
  KJ_DEFER(FreeChannel(channel));

  int rc = 0;
  while ((rc = libssh2_channel_exec(channel, command.c_str())) ==
         LIBSSH2_ERROR_EAGAIN) {
    WaitSocket(deadline, timeout_seconds);
  }
  if (rc != 0) {
    throw util::ConnectionError("cannot start remote command: " +
                                LastError());
  }

  // Both streams are drained in the same loop, otherwise a command filling
  // the stderr window would stall while we wait on stdout.
  CommandOutput output;
  char buf[kReadBufferSize];
  auto drain = [&](int stream_id, std::string* target) {
    ssize_t n = libssh2_channel_read_ex(channel, stream_id, buf, sizeof(buf));
    if (n > 0) {
      target->append(buf, n);
      return true;
    }
    if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
      throw util::ConnectionError("read failed: " + LastError());
    }
    return false;
  };
  while (true) {
    bool progress = drain(0, &output.stdout_text);
    progress = drain(SSH_EXTENDED_DATA_STDERR, &output.stderr_text) || progress;
    if (progress) continue;
    if (libssh2_channel_eof(channel)) break;
    WaitSocket(deadline, timeout_seconds);
  }

  while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
    WaitSocket(deadline, timeout_seconds);
  }
  if (rc == 0) {
    while ((rc = libssh2_channel_wait_closed(channel)) ==
           LIBSSH2_ERROR_EAGAIN) {
      WaitSocket(deadline, timeout_seconds);
    }
  }
  if (rc == 0) {
    KJ_LOG(INFO, "Remote command finished",
           libssh2_channel_get_exit_status(channel),
           output.stdout_text.size(), output.stderr_text.size());
  } else {
    KJ_LOG(WARNING, "Remote channel not closed cleanly", LastError().c_str());
  }
  return output;
}

}  // namespace transport
