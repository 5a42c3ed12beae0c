#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "transport_adapter.hpp"

// TCP listener/dialer plus the UDP DISCOVER responder.
class TcpTransport : public TransportAdapter {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 9000;            // 0 binds an ephemeral port
    uint16_t discovery_port = 9876;         // where this node answers DISCOVER
    uint16_t discovery_target_port = 9876;  // where DISCOVER is sent
    std::string broadcast_address = "255.255.255.255";
  };

  TcpTransport(Options options,
               MessageChannel::Options channel_options,
               std::shared_ptr<Logger> logger = nullptr);
  ~TcpTransport() override;

  // Actual listen port once started.
  uint16_t listen_port() const { return bound_port_.load(); }

  // Replies arrive on listen_port + 1, so only one scan owns that socket at a
  // time; a call made while a scan is in flight shares its results.
  std::vector<PeerInfo> discover(std::chrono::milliseconds timeout) override;
  std::shared_ptr<MessageChannel> connect(const PeerInfo& target,
                                          std::chrono::milliseconds timeout) override;

protected:
  void on_start() override;
  void on_stop() override;

private:
  using tcp = asio::ip::tcp;
  using udp = asio::ip::udp;

  void do_accept();
  void do_receive_discovery();
  void answer_discover(const nlohmann::json& message, const udp::endpoint& sender);
  std::vector<PeerInfo> run_discover(std::chrono::milliseconds timeout);

  Options options_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<udp::socket> discovery_socket_;
  std::array<char, 2048> discovery_buf_{};
  udp::endpoint discovery_sender_;
  std::atomic<uint16_t> bound_port_{0};
  std::mutex discover_mutex_;
  std::shared_future<std::vector<PeerInfo>> discover_inflight_;
};
