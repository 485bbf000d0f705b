#include "transport/ssh_transport.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <pwd.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/errors.hpp"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using transport::RemoteEndpoint;
using transport::SshTransport;

RemoteEndpoint Endpoint(const std::string& password,
                        const std::string& passphrase,
                        const std::string& key_file) {
  RemoteEndpoint endpoint;
  endpoint.host = "127.0.0.1";
  endpoint.port = 22;
  endpoint.username = "test";
  endpoint.password = password;
  endpoint.passphrase = passphrase;
  endpoint.key_file = key_file;
  return endpoint;
}

// Returns a listening socket bound to a free local port.
int Listen(int32_t* port) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  EXPECT_NE(fd, -1);
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  EXPECT_EQ(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  EXPECT_EQ(listen(fd, 1), 0);
  socklen_t len = sizeof(addr);
  EXPECT_EQ(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
  *port = ntohs(addr.sin_port);
  return fd;
}

/*
 * Credentials
 */

// NOLINTNEXTLINE
TEST(SshTransport, PasswordOnly) {
  SshTransport transport(Endpoint("secret", "", ""));
  EXPECT_EQ(transport.Mode(), SshTransport::AuthMode::PASSWORD);
  EXPECT_EQ(transport.Secret(), "secret");
  EXPECT_FALSE(transport.IsConnected());
}

// NOLINTNEXTLINE
TEST(SshTransport, PassphraseWithKey) {
  SshTransport transport(Endpoint("", "unlock", "/home/test/.ssh/id_ed25519"));
  EXPECT_EQ(transport.Mode(), SshTransport::AuthMode::KEY);
  EXPECT_EQ(transport.Secret(), "unlock");
  EXPECT_EQ(transport.Endpoint().key_file, "/home/test/.ssh/id_ed25519");
}

// NOLINTNEXTLINE
TEST(SshTransport, PassphraseWithKeyWinsOverPassword) {
  SshTransport transport(Endpoint("secret", "unlock", "/key"));
  EXPECT_EQ(transport.Mode(), SshTransport::AuthMode::KEY);
  EXPECT_EQ(transport.Secret(), "unlock");
}

// NOLINTNEXTLINE
TEST(SshTransport, PassphraseWithoutKeyFallsBackToPassword) {
  SshTransport transport(Endpoint("secret", "unlock", ""));
  EXPECT_EQ(transport.Mode(), SshTransport::AuthMode::PASSWORD);
  EXPECT_EQ(transport.Secret(), "secret");
}

// NOLINTNEXTLINE
TEST(SshTransport, PassphraseAloneFails) {
  try {
    SshTransport transport(Endpoint("", "unlock", ""));
    FAIL() << "expected ConfigurationError";
  } catch (const util::ConfigurationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("passphrase requires a key reference"));
  }
}

// NOLINTNEXTLINE
TEST(SshTransport, MissingCredentialFails) {
  try {
    SshTransport transport(Endpoint("", "", ""));
    FAIL() << "expected ConfigurationError";
  } catch (const util::ConfigurationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("missing credential"));
  }
  EXPECT_THROW(SshTransport(Endpoint("", "", "/key")),  // NOLINT
               util::ConfigurationError);
}

// NOLINTNEXTLINE
TEST(SshTransport, InvalidEndpoint) {
  RemoteEndpoint no_host = Endpoint("secret", "", "");
  no_host.host = "";
  EXPECT_THROW(SshTransport{no_host}, util::ConfigurationError);  // NOLINT
  RemoteEndpoint no_user = Endpoint("secret", "", "");
  no_user.username = "";
  EXPECT_THROW(SshTransport{no_user}, util::ConfigurationError);  // NOLINT
  RemoteEndpoint bad_port = Endpoint("secret", "", "");
  bad_port.port = 70000;
  EXPECT_THROW(SshTransport{bad_port}, util::ConfigurationError);  // NOLINT
}

/*
 * Connection lifecycle
 */

// NOLINTNEXTLINE
TEST(SshTransport, CloseWithoutConnectIsHarmless) {
  SshTransport transport(Endpoint("secret", "", ""));
  transport.Close();
  transport.Close();
  EXPECT_FALSE(transport.IsConnected());
}

// NOLINTNEXTLINE
TEST(SshTransport, ConnectionRefused) {
  int32_t port = 0;
  int fd = Listen(&port);
  close(fd);
  RemoteEndpoint endpoint = Endpoint("secret", "", "");
  endpoint.port = port;
  SshTransport transport(endpoint);
  EXPECT_THROW(transport.Execute("echo hi", 5),  // NOLINT
               util::ConnectionError);
  EXPECT_FALSE(transport.IsConnected());
}

// NOLINTNEXTLINE
TEST(SshTransport, UnresolvableHost) {
  RemoteEndpoint endpoint = Endpoint("secret", "", "");
  endpoint.host = "no-such-host.invalid";
  SshTransport transport(endpoint);
  EXPECT_THROW(transport.Connect(), util::ConnectionError);  // NOLINT
}

// NOLINTNEXTLINE
TEST(SshTransport, HandshakeFailure) {
  int32_t port = 0;
  int fd = Listen(&port);
  std::thread server([fd]() {
    int client = accept(fd, nullptr, nullptr);
    if (client != -1) {
      const char garbage[] = "this is not ssh\r\n";
      ssize_t written = write(client, garbage, sizeof(garbage) - 1);
      (void)written;
      close(client);
    }
  });
  RemoteEndpoint endpoint = Endpoint("secret", "", "");
  endpoint.port = port;
  SshTransport transport(endpoint);
  EXPECT_THROW(transport.Connect(), util::ConnectionError);  // NOLINT
  EXPECT_FALSE(transport.IsConnected());
  server.join();
  close(fd);
}

/*
 * Loopback server
 */

const constexpr char* kSshd = "/usr/sbin/sshd";
const constexpr char* kSshKeygen = "/usr/bin/ssh-keygen";
const constexpr char* kPassphrase = "unlock";

bool CanConnect(int32_t port) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) return false;
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  bool ok = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  close(fd);
  return ok;
}

// Runs an sshd on a free loopback port that accepts the current user with a
// freshly generated, passphrase protected key. Tests are skipped when no
// usable sshd is available.
class LoopbackServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (access(kSshd, X_OK) != 0 || access(kSshKeygen, X_OK) != 0)
      GTEST_SKIP() << "sshd or ssh-keygen not installed";
    const struct passwd* user = getpwuid(getuid());
    ASSERT_NE(user, nullptr);
    username_ = user->pw_name;

    dir_ = std::make_unique<util::TempDir>("/tmp");
    const std::string& dir = dir_->Path();
    std::string host_key = util::File::JoinPath(dir, "host_key");
    key_file_ = util::File::JoinPath(dir, "id_rsa");
    std::string keygen =
        std::string(kSshKeygen) + " -q -t rsa -b 2048 -m PEM -N ";
    ASSERT_EQ(system((keygen + "'' -f " + host_key).c_str()), 0);
    ASSERT_EQ(
        system((keygen + "'" + kPassphrase + "' -f " + key_file_).c_str()), 0);
    std::string authorized_keys = util::File::JoinPath(dir, "authorized_keys");
    util::File::Write(authorized_keys, util::File::Read(key_file_ + ".pub"));

    close(Listen(&port_));
    std::string config = util::File::JoinPath(dir, "sshd_config");
    util::File::Write(config, "Port " + std::to_string(port_) +
                                  "\nListenAddress 127.0.0.1"
                                  "\nHostKey " + host_key +
                                  "\nPidFile " + dir + "/sshd.pid"
                                  "\nAuthorizedKeysFile " + authorized_keys +
                                  "\nStrictModes no"
                                  "\nPasswordAuthentication no"
                                  "\nPubkeyAuthentication yes"
                                  "\nPermitRootLogin yes"
                                  "\nUsePAM no\n");

    pid_ = fork();
    ASSERT_NE(pid_, -1);
    if (pid_ == 0) {
      int null = open("/dev/null", O_RDWR);
      dup2(null, STDOUT_FILENO);
      dup2(null, STDERR_FILENO);
      execl(kSshd, kSshd, "-D", "-f", config.c_str(), nullptr);
      _exit(127);
    }
    for (int attempt = 0; attempt < 50 && !CanConnect(port_); attempt++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!CanConnect(port_)) GTEST_SKIP() << "sshd did not start";
    try {
      SshTransport transport(LocalEndpoint());
      transport.Connect();
    } catch (const util::ConnectionError& e) {
      GTEST_SKIP() << "cannot log in to the local sshd: " << e.what();
    }
  }

  void TearDown() override {
    if (pid_ > 0) {
      kill(pid_, SIGTERM);
      waitpid(pid_, nullptr, 0);
    }
  }

  RemoteEndpoint LocalEndpoint() const {
    RemoteEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port_;
    endpoint.username = username_;
    endpoint.passphrase = kPassphrase;
    endpoint.key_file = key_file_;
    return endpoint;
  }

  std::unique_ptr<util::TempDir> dir_;
  std::string username_;
  std::string key_file_;
  int32_t port_ = 0;
  pid_t pid_ = -1;
};

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, CapturesBothStreams) {
  SshTransport transport(LocalEndpoint());
  auto output = transport.Execute("echo out; echo err >&2; exit 3", 10);
  EXPECT_EQ(output.stdout_text, "out\n");
  EXPECT_EQ(output.stderr_text, "err\n");
}

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, LargeOutputOnBothStreams) {
  // More than the channel window on stderr before anything on stdout.
  SshTransport transport(LocalEndpoint());
  auto output = transport.Execute(
      "head -c 3000000 /dev/zero | tr '\\0' b >&2; "
      "head -c 3000000 /dev/zero | tr '\\0' a",
      60);
  EXPECT_EQ(output.stdout_text, std::string(3000000, 'a'));
  EXPECT_EQ(output.stderr_text, std::string(3000000, 'b'));
}

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, ConnectsOnceAndReusesSession) {
  SshTransport transport(LocalEndpoint());
  EXPECT_FALSE(transport.IsConnected());
  auto first = transport.Execute("echo $SSH_CONNECTION", 10);
  EXPECT_TRUE(transport.IsConnected());
  auto second = transport.Execute("echo $SSH_CONNECTION", 10);
  // The client port is part of SSH_CONNECTION, so equal values mean the same
  // TCP connection.
  EXPECT_NE(first.stdout_text, "\n");
  EXPECT_EQ(first.stdout_text, second.stdout_text);
}

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, Timeout) {
  SshTransport transport(LocalEndpoint());
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(transport.Execute("sleep 5", 0.5),  // NOLINT
               util::TimeoutError);
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::seconds(4));
}

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, SessionUsableAfterTimeout) {
  SshTransport transport(LocalEndpoint());
  EXPECT_THROW(transport.Execute("sleep 5", 0.5),  // NOLINT
               util::TimeoutError);
  EXPECT_EQ(transport.Execute("echo ok", 10).stdout_text, "ok\n");
}

// NOLINTNEXTLINE
TEST_F(LoopbackServerTest, WrongPassphrase) {
  RemoteEndpoint endpoint = LocalEndpoint();
  endpoint.passphrase = "wrong";
  SshTransport transport(endpoint);
  EXPECT_THROW(transport.Connect(), util::ConnectionError);  // NOLINT
  EXPECT_FALSE(transport.IsConnected());
}

/*
 * ScopedSession
 */

class CountingTransport : public transport::Transport {
 public:
  void Connect() override {
    connects++;
    connected = true;
  }
  void Close() override {
    closes++;
    connected = false;
  }
  bool IsConnected() const override { return connected; }
  transport::CommandOutput Execute(const std::string& command,
                                   double /*timeout_seconds*/) override {
    if (command == "fail") throw util::ConnectionError("dropped");
    return {command, ""};
  }

  int connects = 0;
  int closes = 0;
  bool connected = false;
};

// NOLINTNEXTLINE
TEST(ScopedSession, ClosesOnScopeExit) {
  CountingTransport transport;
  {
    transport::ScopedSession session(&transport);
    EXPECT_TRUE(transport.IsConnected());
    EXPECT_EQ(transport.Execute("echo", 0).stdout_text, "echo");
  }
  EXPECT_EQ(transport.connects, 1);
  EXPECT_EQ(transport.closes, 1);
  EXPECT_FALSE(transport.IsConnected());
}

// NOLINTNEXTLINE
TEST(ScopedSession, ClosesOnError) {
  CountingTransport transport;
  try {
    transport::ScopedSession session(&transport);
    transport.Execute("fail", 0);
    FAIL() << "expected ConnectionError";
  } catch (const util::ConnectionError&) {
  }
  EXPECT_EQ(transport.closes, 1);
  EXPECT_FALSE(transport.IsConnected());
}

}  // namespace
