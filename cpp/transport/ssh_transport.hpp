#ifndef TRANSPORT_SSH_TRANSPORT_HPP
#define TRANSPORT_SSH_TRANSPORT_HPP

#include <libssh2.h>
#include <chrono>
#include <cstdint>
#include <string>

#include <kj/io.h>

#include "transport/transport.hpp"

namespace transport {

// Where and as whom to connect. Credential fields are empty when not
// supplied.
struct RemoteEndpoint {
  std::string host;
  int32_t port = 22;
  std::string username;

  std::string password;
  std::string passphrase;
  std::string key_file;
};

// Transport over a single SSH session (libssh2). The host key is logged but
// not verified.
class SshTransport : public Transport {
 public:
  enum class AuthMode { PASSWORD, KEY };

  // Selects the authentication mode from the credential material:
  // - password only: PASSWORD;
  // - passphrase and key_file: KEY, the passphrase unlocks key_file;
  // - passphrase without key_file falls back to PASSWORD if a password is
  //   given, and is rejected otherwise.
  // Throws util::ConfigurationError if no mode can be selected, or if host,
  // username or port are invalid.
  explicit SshTransport(RemoteEndpoint endpoint);
  ~SshTransport() override;

  void Connect() override;
  void Close() override;
  bool IsConnected() const override { return session_ != nullptr; }
  CommandOutput Execute(const std::string& command,
                        double timeout_seconds) override;

  const RemoteEndpoint& Endpoint() const { return endpoint_; }
  AuthMode Mode() const { return mode_; }
  // The password in PASSWORD mode, the key passphrase in KEY mode.
  const std::string& Secret() const { return secret_; }

 private:
  using Deadline = std::chrono::steady_clock::time_point;

  // Blocks until the socket is ready in the direction libssh2 is waiting
  // for, or throws util::TimeoutError once deadline has passed.
  void WaitSocket(Deadline deadline, double timeout_seconds);
  void FreeChannel(LIBSSH2_CHANNEL* channel);
  std::string LastError() const;

  RemoteEndpoint endpoint_;
  AuthMode mode_ = AuthMode::PASSWORD;
  std::string secret_;

  kj::AutoCloseFd socket_;
  LIBSSH2_SESSION* session_ = nullptr;
};

}  // namespace transport

#endif
