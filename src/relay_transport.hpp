#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport_adapter.hpp"

// Tunnels peer channels through a rendezvous server (see relay_server.hpp).
// The node keeps one registered control link; every peer channel is a
// separate server connection spliced to the peer's.
class RelayTransport : public TransportAdapter {
public:
  struct Options {
    std::vector<std::string> servers;   // host:port, tried in order
    std::chrono::milliseconds request_timeout{5000};
  };

  RelayTransport(Options options,
                 MessageChannel::Options channel_options,
                 std::shared_ptr<Logger> logger = nullptr);
  ~RelayTransport() override;

  bool is_registered() const { return registered_.load(); }
  std::string registered_server() const;

  std::vector<PeerInfo> discover(std::chrono::milliseconds timeout) override;
  std::shared_ptr<MessageChannel> connect(const PeerInfo& target,
                                          std::chrono::milliseconds timeout) override;

protected:
  void on_start() override;
  void on_stop() override;

private:
  class ControlHandler : public ChannelHandler {
  public:
    explicit ControlHandler(RelayTransport& owner) : owner_(owner) {}
    void on_hello(const std::shared_ptr<MessageChannel>&, const nlohmann::json&) override {}
    void on_control(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& message) override;
    void on_binary(const std::shared_ptr<MessageChannel>&, std::string) override {}
    void on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) override;
  private:
    RelayTransport& owner_;
  };

  // Registers with the first server that answers; returns false when none does.
  bool ensure_registered(std::chrono::milliseconds timeout);
  void accept_session(const std::string& server, const std::string& session, const std::string& from);
  ChannelSocket adopt_native(int fd, const asio::ip::tcp& protocol);
  void schedule_keepalive();

  Options options_;
  ControlHandler control_handler_;
  asio::thread_pool accept_pool_{1};

  std::mutex register_mutex_;
  mutable std::mutex control_mutex_;
  std::shared_ptr<MessageChannel> control_;
  std::string control_server_;
  std::atomic<bool> registered_{false};
  std::unique_ptr<asio::steady_timer> keepalive_timer_;
};
