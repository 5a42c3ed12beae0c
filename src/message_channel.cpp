#include "message_channel.hpp"

using json = nlohmann::json;

std::shared_ptr<MessageChannel> MessageChannel::create(ChannelSocket socket,
                                                       ChannelHandler* handler,
                                                       Options options,
                                                       std::shared_ptr<Logger> logger)
{
  return std::shared_ptr<MessageChannel>(
    new MessageChannel(std::move(socket), handler, options, std::move(logger)));
}

MessageChannel::MessageChannel(ChannelSocket socket,
                               ChannelHandler* handler,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : socket_(std::move(socket)),
    idle_timer_(socket_.get_executor()),
    handler_(handler),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("channel"))
{
}

MessageChannel::~MessageChannel(){
  std::error_code ec;
  socket_.close(ec);
}

void MessageChannel::start(const json& first_frame){
  if(!first_frame.is_null()) send_json(first_frame);
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [this, self](){
    arm_idle_timer();
    do_read_header();
  });
}

std::string MessageChannel::peer_id() const {
  std::lock_guard lg(id_mutex_);
  return peer_id_;
}

void MessageChannel::set_peer_id(const std::string& id){
  std::lock_guard lg(id_mutex_);
  peer_id_ = id;
}

void MessageChannel::send_json(const json& j){
  enqueue({j.dump()});
}

void MessageChannel::send_binary(std::string payload){
  std::vector<std::string> frames;
  frames.push_back(std::move(payload));
  enqueue(std::move(frames));
}

void MessageChannel::send_frames(std::vector<std::string> payloads){
  enqueue(std::move(payloads));
}

void MessageChannel::enqueue(std::vector<std::string> frames){
  if(!open_) return;
  bool start_write = false;
  {
    std::lock_guard lg(write_mutex_);
    for(auto& payload : frames) {
      write_queue_.push_back(encode_frame(payload));
    }
    if(!writing_ && !write_queue_.empty()) {
      writing_ = true;
      start_write = true;
    }
  }
  if(start_write) {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self](){ do_write(); });
  }
}

// Runs on the executor. The front element stays in the queue until written;
// deque push_back keeps references to existing elements valid.
void MessageChannel::do_write(){
  const std::string* front = nullptr;
  {
    std::lock_guard lg(write_mutex_);
    if(write_queue_.empty()) {
      writing_ = false;
      return;
    }
    front = &write_queue_.front();
  }
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(*front),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        logger_->debug("write error on channel {}: {}", peer_id(), ec.message());
        close_on_executor("write failed: " + ec.message());
        return;
      }
      {
        std::lock_guard lg(write_mutex_);
        write_queue_.pop_front();
      }
      do_write();
    });
}

std::size_t MessageChannel::queued_frames() const {
  std::lock_guard lg(write_mutex_);
  return write_queue_.size();
}

void MessageChannel::arm_idle_timer(){
  if(!open_) return;
  idle_timer_.expires_after(options_.idle_timeout);
  auto self = shared_from_this();
  idle_timer_.async_wait([this, self](const std::error_code& ec){
    if(ec) return;  // re-armed or cancelled
    logger_->info("channel {} idle for {}s, closing", peer_id(),
                  std::chrono::duration_cast<std::chrono::seconds>(options_.idle_timeout).count());
    close_on_executor("idle timeout");
  });
}

void MessageChannel::do_read_header(){
  auto self = shared_from_this();
  asio::async_read(socket_, asio::buffer(header_),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        close_on_executor(ec == asio::error::eof ? "peer closed" : "read failed: " + ec.message());
        return;
      }
      int32_t length = decode_frame_length(header_.data());
      if(length <= 0) {
        frames_skipped_++;
        logger_->debug("skipping frame with declared length {}", length);
        arm_idle_timer();
        do_read_header();
        return;
      }
      if(static_cast<uint32_t>(length) > options_.max_frame_bytes) {
        logger_->warn("protocol violation from {}: frame of {} bytes exceeds limit {}",
                      peer_id(), length, options_.max_frame_bytes);
        close_on_executor("protocol violation: oversized frame");
        return;
      }
      do_read_body(static_cast<uint32_t>(length));
    });
}

void MessageChannel::do_read_body(uint32_t length){
  body_.assign(length, '\0');
  auto self = shared_from_this();
  asio::async_read(socket_, asio::buffer(body_),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        close_on_executor("read failed: " + ec.message());
        return;
      }
      frames_received_++;
      arm_idle_timer();
      std::string payload;
      payload.swap(body_);
      handle_payload(std::move(payload));
      if(open_) do_read_header();
    });
}

void MessageChannel::handle_payload(std::string payload){
  try {
    if(is_control_payload(payload)) {
      auto doc = json::parse(payload, nullptr, false);
      if(!doc.is_discarded() && doc.is_object() &&
         doc.contains("type") && doc["type"].is_string()) {
        handle_control(doc);
        return;
      }
      logger_->debug("unparseable control frame from {}, passing on as binary", peer_id());
    }
    if(handler_) handler_->on_binary(shared_from_this(), std::move(payload));
  } catch(const std::exception& ex) {
    frames_rejected_++;
    logger_->warn("frame from {} rejected: {}", peer_id(), ex.what());
  }
}

void MessageChannel::handle_control(const json& message){
  const auto type = message["type"].get<std::string>();
  auto self = shared_from_this();
  if(type == kMsgPing) {
    send_json(make_pong());
  } else if(type == kMsgPong) {
    // keepalive only
  } else if(type == kMsgHello) {
    auto id = field_string(message, "node_id");
    auto current = peer_id();
    if(!current.empty() && !id.empty() && current != id) {
      logger_->warn("HELLO rebinds channel {} to {}", current, id);
    }
    if(!id.empty()) set_peer_id(id);
    if(handler_) handler_->on_hello(self, message);
  } else if(type == kMsgBye || type == kMsgDataTransfer || type == kMsgMeshRoute ||
            options_.extra_control_types.count(type) > 0) {
    if(handler_) handler_->on_control(self, message);
  } else {
    logger_->debug("ignoring unknown message type '{}' from {}", type, peer_id());
  }
}

// Runs inline when already on the channel's executor.
void MessageChannel::close(const std::string& reason){
  auto self = shared_from_this();
  asio::dispatch(socket_.get_executor(), [this, self, reason](){
    close_on_executor(reason);
  });
}

void MessageChannel::close_on_executor(const std::string& reason){
  open_ = false;
  std::error_code ec;
  idle_timer_.cancel();
  socket_.shutdown(ChannelSocket::shutdown_both, ec);
  socket_.close(ec);
  if(close_notified_.exchange(true)) return;
  logger_->debug("channel {} closed: {}", peer_id(), reason);
  if(handler_) handler_->on_closed(shared_from_this(), reason);
}
