#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "message_channel.hpp"
#include "peer_info.hpp"

// Upward interface of every adapter; the coordinator implements it. Calls
// arrive on the adapter's io thread.
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void on_peer_connected(const std::string& transport, const PeerInfo& peer) = 0;
  virtual void on_peer_message(const std::string& transport,
                               const std::string& peer_id,
                               const nlohmann::json& message) = 0;
  virtual void on_peer_binary(const std::string& transport,
                              const std::string& peer_id,
                              std::string payload) = 0;
  virtual void on_peer_disconnected(const std::string& transport, const std::string& peer_id) = 0;
};

struct LocalIdentity {
  std::string node_id;
  std::string node_name;
  std::set<std::string> capabilities;
};

// One transport medium. Owns an io loop and a peer-ID keyed connection table.
class TransportAdapter : public ChannelHandler {
public:
  TransportAdapter(std::string kind,
                   MessageChannel::Options channel_options,
                   std::shared_ptr<Logger> logger);
  ~TransportAdapter() override;

  TransportAdapter(const TransportAdapter&) = delete;
  TransportAdapter& operator=(const TransportAdapter&) = delete;

  const std::string& kind() const { return kind_; }

  // Both must be set before start().
  void set_identity(LocalIdentity identity);
  void set_sink(MessageSink* sink) { sink_ = sink; }
  const LocalIdentity& identity() const { return identity_; }

  // Throws MeshError(AlreadyRunning) when called twice without stop().
  void start();
  // Closes every channel and joins the io thread. Must not be called from a
  // channel callback.
  void stop();
  bool is_running() const { return running_.load(); }

  // Returns within `timeout` even when the scan itself cannot be cancelled.
  virtual std::vector<PeerInfo> discover(std::chrono::milliseconds timeout) = 0;

  // Opens a channel to `target` and registers it under target.id. Throws
  // MeshError on failure.
  virtual std::shared_ptr<MessageChannel> connect(const PeerInfo& target,
                                                  std::chrono::milliseconds timeout) = 0;

  // Throws MeshError(PeerNotConnected) when `peer_id` has no open channel.
  void send_data(const std::string& peer_id, std::string bytes);
  void send_json(const std::string& peer_id, const nlohmann::json& message);
  void send_frames(const std::string& peer_id, std::vector<std::string> payloads);

  bool is_connected(const std::string& peer_id) const;
  std::shared_ptr<MessageChannel> channel(const std::string& peer_id) const;
  std::vector<std::string> connected_peers() const;
  void disconnect(const std::string& peer_id);

protected:
  // Opens listeners. Runs on the caller's thread before the io thread starts.
  virtual void on_start() = 0;
  // Closes listeners. Runs on the io thread.
  virtual void on_stop() {}

  // Wraps a connected socket into a channel served by this adapter. A
  // non-empty `peer_id` registers it immediately (dialer side); otherwise it
  // is registered when the peer's HELLO arrives.
  std::shared_ptr<MessageChannel> adopt(ChannelSocket socket,
                                        const std::string& peer_id,
                                        const std::string& remote_address);

  asio::io_context& io() { return io_; }
  nlohmann::json make_hello_message() const;

  void on_hello(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& hello) override;
  void on_control(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& message) override;
  void on_binary(const std::shared_ptr<MessageChannel>& channel, std::string payload) override;
  void on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) override;

  std::shared_ptr<Logger> logger_;
  MessageChannel::Options channel_options_;

private:
  std::shared_ptr<MessageChannel> require_channel(const std::string& peer_id) const;

  std::string kind_;
  LocalIdentity identity_;
  MessageSink* sink_ = nullptr;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;

  mutable std::shared_mutex table_mutex_;
  std::unordered_map<std::string, std::shared_ptr<MessageChannel>> connections_;
  std::set<std::shared_ptr<MessageChannel>> unbound_;   // accepted, awaiting HELLO
};
