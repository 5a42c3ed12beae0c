#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

using ChannelSocket = asio::generic::stream_protocol::socket;

class MessageChannel;

// Receives everything a channel reads. Callbacks run on the channel's
// executor thread; the handler must outlive the io loop driving the channel.
class ChannelHandler {
public:
  virtual ~ChannelHandler() = default;
  virtual void on_hello(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& hello) = 0;
  // BYE, DATA_TRANSFER and MESH_ROUTE documents.
  virtual void on_control(const std::shared_ptr<MessageChannel>& channel, const nlohmann::json& message) = 0;
  virtual void on_binary(const std::shared_ptr<MessageChannel>& channel, std::string payload) = 0;
  virtual void on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) = 0;
};

// Length-framed message stream over any connected stream socket (TCP, local
// socket pairs, relay splices).
class MessageChannel : public std::enable_shared_from_this<MessageChannel> {
public:
  struct Options {
    uint32_t max_frame_bytes = kDefaultMaxFrameBytes;
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    // Further control types handed to ChannelHandler::on_control.
    std::set<std::string> extra_control_types;
  };

  static std::shared_ptr<MessageChannel> create(ChannelSocket socket,
                                                ChannelHandler* handler,
                                                Options options,
                                                std::shared_ptr<Logger> logger);

  ~MessageChannel();

  // Queues `first_frame` (normally HELLO; null sends nothing) and starts the
  // read loop.
  void start(const nlohmann::json& first_frame = nullptr);

  // Thread safe. Frames are written in call order.
  void send_json(const nlohmann::json& j);
  void send_binary(std::string payload);
  void send_frames(std::vector<std::string> payloads);

  // Thread safe and idempotent. Pending reads and writes fail immediately.
  void close(const std::string& reason = "closed");

  bool is_open() const { return open_.load(); }
  // Frames queued or in flight; 0 once everything sent has been written.
  std::size_t queued_frames() const;

  std::string peer_id() const;
  void set_peer_id(const std::string& id);
  std::string transport() const { return transport_; }
  void set_transport(std::string transport) { transport_ = std::move(transport); }
  // Set before start().
  const std::string& remote_address() const { return remote_address_; }
  void set_remote_address(std::string address) { remote_address_ = std::move(address); }

  uint64_t frames_received() const { return frames_received_.load(); }
  uint64_t frames_skipped() const { return frames_skipped_.load(); }
  // Frames whose handling threw; the channel keeps reading past them.
  uint64_t frames_rejected() const { return frames_rejected_.load(); }

private:
  MessageChannel(ChannelSocket socket,
                 ChannelHandler* handler,
                 Options options,
                 std::shared_ptr<Logger> logger);

  void enqueue(std::vector<std::string> frames);
  void do_write();
  void do_read_header();
  void do_read_body(uint32_t length);
  void handle_payload(std::string payload);
  void handle_control(const nlohmann::json& message);
  void arm_idle_timer();
  void close_on_executor(const std::string& reason);

  ChannelSocket socket_;
  asio::steady_timer idle_timer_;
  ChannelHandler* handler_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  std::array<unsigned char, kFrameHeaderBytes> header_{};
  std::string body_;

  mutable std::mutex write_mutex_;
  std::deque<std::string> write_queue_;
  bool writing_ = false;

  mutable std::mutex id_mutex_;
  std::string peer_id_;
  std::string transport_;
  std::string remote_address_;

  std::atomic<bool> open_{true};
  std::atomic<bool> close_notified_{false};
  std::atomic<uint64_t> frames_received_{0};
  std::atomic<uint64_t> frames_skipped_{0};
  std::atomic<uint64_t> frames_rejected_{0};
};
