#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "log.hpp"
#include "message_channel.hpp"

// Rendezvous server for RelayTransport. Every connection opens with one
// framed JSON request:
//   RELAY_REGISTER  keeps the connection as the node's control link
//   RELAY_LIST      answered with RELAY_PEERS, then closed
//   RELAY_CONNECT   parked until the target dials RELAY_ACCEPT, then both
//                   connections get RELAY_OK and are spliced byte for byte
class RelayServer : public ChannelHandler {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t port = 9100;                       // 0 binds an ephemeral port
    std::chrono::milliseconds pending_timeout{15000};
    std::chrono::milliseconds handshake_timeout{10000};
    MessageChannel::Options channel;
  };

  explicit RelayServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~RelayServer() override;

  RelayServer(const RelayServer&) = delete;
  RelayServer& operator=(const RelayServer&) = delete;

  // Binds and starts serving on a background thread. Throws MeshError.
  void start();
  void stop();
  bool is_running() const { return running_.load(); }

  uint16_t port() const { return bound_port_.load(); }
  std::size_t registered_count() const;
  std::size_t active_splices() const;

  void on_hello(const std::shared_ptr<MessageChannel>&, const nlohmann::json&) override {}
  void on_control(const std::shared_ptr<MessageChannel>&, const nlohmann::json&) override {}
  void on_binary(const std::shared_ptr<MessageChannel>&, std::string) override {}
  void on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) override;

private:
  struct Connection;
  struct Splice;

  struct Registration {
    std::shared_ptr<MessageChannel> channel;
    std::string node_name;
    nlohmann::json capabilities;
  };

  struct PendingSession {
    std::shared_ptr<Connection> dialer;
    std::string from;
    std::string target;
  };

  void do_accept();
  void read_request(const std::shared_ptr<Connection>& conn);
  void handle_request(const std::shared_ptr<Connection>& conn, const nlohmann::json& request);
  void handle_register(const std::shared_ptr<Connection>& conn, const nlohmann::json& request);
  void handle_list(const std::shared_ptr<Connection>& conn);
  void handle_connect(const std::shared_ptr<Connection>& conn, const nlohmann::json& request);
  void handle_accept(const std::shared_ptr<Connection>& conn, const nlohmann::json& request);
  void reply_and_close(const std::shared_ptr<Connection>& conn, const nlohmann::json& reply);
  void start_splice(const std::shared_ptr<Connection>& a, const std::shared_ptr<Connection>& b);

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};

  // Touched on the io thread; the mutex only serves registered_count().
  mutable std::mutex mutex_;
  std::map<std::string, Registration> registrations_;
  std::map<std::string, PendingSession> pending_;
  std::set<std::shared_ptr<Connection>> handshaking_;
  std::set<std::shared_ptr<Splice>> splices_;
};
