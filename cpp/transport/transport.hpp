#ifndef TRANSPORT_TRANSPORT_HPP
#define TRANSPORT_TRANSPORT_HPP

#include <string>

namespace transport {

// Text captured from a remote command. Both fields are always present, and
// empty if the command printed nothing on that stream.
struct CommandOutput {
  std::string stdout_text;
  std::string stderr_text;
};

// An authenticated channel to a remote host that can run one shell command at
// a time. The session is established lazily by the first Execute, or
// explicitly by Connect, and lives until Close or destruction.
// Implementations are not thread safe: concurrent calls on the same instance
// must be synchronized by the caller.
class Transport {
 public:
  // Establishes the session if it is not established yet. Throws
  // util::ConnectionError on failure.
  virtual void Connect() = 0;

  // Releases the session, if any. Calling it twice is harmless.
  virtual void Close() = 0;

  virtual bool IsConnected() const = 0;

  // Runs command, a complete shell string, on the remote host and returns
  // what it printed, regardless of its exit status. A timeout_seconds of 0
  // waits indefinitely, otherwise util::TimeoutError is thrown when it
  // expires. Connection problems throw util::ConnectionError.
  virtual CommandOutput Execute(const std::string& command,
                                double timeout_seconds) = 0;

  virtual ~Transport() = default;
  Transport() = default;
  Transport(const Transport&) = delete;
  Transport(Transport&&) = delete;
  Transport& operator=(const Transport&) = delete;
  Transport& operator=(Transport&&) = delete;
};

// Connects on construction and closes on destruction, on every exit path.
class ScopedSession {
 public:
  explicit ScopedSession(Transport* transport) : transport_(transport) {
    transport_->Connect();
  }
  ~ScopedSession() { transport_->Close(); }

  ScopedSession(const ScopedSession&) = delete;
  ScopedSession& operator=(const ScopedSession&) = delete;

 private:
  Transport* transport_;
};

}  // namespace transport

#endif
