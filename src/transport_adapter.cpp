#include "transport_adapter.hpp"

#include <future>

#include "errors.hpp"
#include "protocol.hpp"

using json = nlohmann::json;

TransportAdapter::TransportAdapter(std::string kind,
                                   MessageChannel::Options channel_options,
                                   std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>(kind)),
    channel_options_(channel_options),
    kind_(std::move(kind)) {}

// Derived adapters stop in their own destructors; this is the last resort
// for adapters that never opened listeners.
TransportAdapter::~TransportAdapter() {
  stop();
}

void TransportAdapter::set_identity(LocalIdentity identity) {
  identity_ = std::move(identity);
}

void TransportAdapter::start() {
  std::lock_guard lg(lifecycle_mutex_);
  if(running_.exchange(true)) {
    throw MeshError(ErrorCode::AlreadyRunning, kind_ + " transport already started");
  }
  io_.restart();
  work_.emplace(asio::make_work_guard(io_));
  try {
    on_start();
  } catch(...) {
    work_.reset();
    running_ = false;
    throw;
  }
  io_thread_ = std::thread([this](){
    io_.run();
  });
  logger_->debug("{} transport started", kind_);
}

void TransportAdapter::stop() {
  std::lock_guard lg(lifecycle_mutex_);
  if(!running_.exchange(false)) return;

  std::promise<void> done;
  auto finished = done.get_future();
  asio::post(io_, [this, &done](){
    try {
      on_stop();
    } catch(const std::exception& e) {
      logger_->warn("{} transport stop: {}", kind_, e.what());
    }
    std::vector<std::shared_ptr<MessageChannel>> channels;
    {
      std::unique_lock lock(table_mutex_);
      for(auto& kv : connections_) channels.push_back(kv.second);
      for(auto& c : unbound_) channels.push_back(c);
      connections_.clear();
      unbound_.clear();
    }
    for(auto& c : channels) c->close("transport stopped");
    done.set_value();
  });
  finished.wait();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();
  logger_->debug("{} transport stopped", kind_);
}

json TransportAdapter::make_hello_message() const {
  return make_hello(identity_.node_id, identity_.node_name, kind_, identity_.capabilities);
}

std::shared_ptr<MessageChannel> TransportAdapter::adopt(ChannelSocket socket,
                                                        const std::string& peer_id,
                                                        const std::string& remote_address) {
  auto channel = MessageChannel::create(std::move(socket), this, channel_options_,
                                        logger_->child("channel"));
  channel->set_transport(kind_);
  channel->set_remote_address(remote_address);
  std::shared_ptr<MessageChannel> replaced;
  {
    std::unique_lock lock(table_mutex_);
    if(peer_id.empty()) {
      unbound_.insert(channel);
    } else {
      channel->set_peer_id(peer_id);
      auto it = connections_.find(peer_id);
      if(it != connections_.end()) replaced = it->second;
      connections_[peer_id] = channel;
    }
  }
  if(replaced) {
    logger_->debug("replacing existing channel to {}", peer_id);
    replaced->close("replaced");
  }
  channel->start(make_hello_message());
  return channel;
}

void TransportAdapter::on_hello(const std::shared_ptr<MessageChannel>& channel, const json& hello) {
  PeerInfo peer;
  peer.id = field_string(hello, "node_id");
  peer.name = field_string(hello, "node_name");
  peer.address = channel->remote_address();
  peer.protocol = kind_;
  peer.signal_strength = 100;
  peer.last_seen = std::chrono::system_clock::now();
  if(hello.contains("capabilities") && hello["capabilities"].is_array()) {
    for(const auto& cap : hello["capabilities"]) {
      if(cap.is_string()) peer.capabilities.insert(cap.get<std::string>());
    }
  }
  if(peer.id.empty()) {
    logger_->warn("HELLO without node_id on {} channel from {}", kind_, peer.address);
    return;
  }

  std::shared_ptr<MessageChannel> replaced;
  {
    std::unique_lock lock(table_mutex_);
    unbound_.erase(channel);
    for(auto it = connections_.begin(); it != connections_.end(); ++it) {
      if(it->second == channel && it->first != peer.id) {
        connections_.erase(it);
        break;
      }
    }
    auto it = connections_.find(peer.id);
    if(it != connections_.end() && it->second != channel) {
      replaced = it->second;
    }
    connections_[peer.id] = channel;
  }
  if(replaced) replaced->close("replaced");

  logger_->info("{} peer {} ({}) connected", kind_, peer.id, peer.name);
  if(sink_) sink_->on_peer_connected(kind_, peer);
}

void TransportAdapter::on_control(const std::shared_ptr<MessageChannel>& channel, const json& message) {
  auto peer_id = channel->peer_id();
  if(peer_id.empty()) {
    logger_->debug("dropping {} before HELLO", field_string(message, "type"));
    return;
  }
  if(sink_) sink_->on_peer_message(kind_, peer_id, message);
}

void TransportAdapter::on_binary(const std::shared_ptr<MessageChannel>& channel, std::string payload) {
  auto peer_id = channel->peer_id();
  if(peer_id.empty()) return;
  if(sink_) sink_->on_peer_binary(kind_, peer_id, std::move(payload));
}

void TransportAdapter::on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) {
  auto peer_id = channel->peer_id();
  bool was_bound = false;
  {
    std::unique_lock lock(table_mutex_);
    unbound_.erase(channel);
    auto it = connections_.find(peer_id);
    if(it != connections_.end() && it->second == channel) {
      connections_.erase(it);
      was_bound = true;
    }
  }
  if(was_bound) {
    logger_->info("{} peer {} disconnected ({})", kind_, peer_id, reason);
    if(sink_) sink_->on_peer_disconnected(kind_, peer_id);
  }
}

std::shared_ptr<MessageChannel> TransportAdapter::require_channel(const std::string& peer_id) const {
  std::shared_lock lock(table_mutex_);
  auto it = connections_.find(peer_id);
  if(it == connections_.end() || !it->second->is_open()) {
    throw MeshError(ErrorCode::PeerNotConnected,
                    peer_id + " has no open " + kind_ + " connection");
  }
  return it->second;
}

void TransportAdapter::send_data(const std::string& peer_id, std::string bytes) {
  require_channel(peer_id)->send_binary(std::move(bytes));
}

void TransportAdapter::send_json(const std::string& peer_id, const json& message) {
  require_channel(peer_id)->send_json(message);
}

void TransportAdapter::send_frames(const std::string& peer_id, std::vector<std::string> payloads) {
  require_channel(peer_id)->send_frames(std::move(payloads));
}

bool TransportAdapter::is_connected(const std::string& peer_id) const {
  std::shared_lock lock(table_mutex_);
  auto it = connections_.find(peer_id);
  return it != connections_.end() && it->second->is_open();
}

std::shared_ptr<MessageChannel> TransportAdapter::channel(const std::string& peer_id) const {
  std::shared_lock lock(table_mutex_);
  auto it = connections_.find(peer_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::string> TransportAdapter::connected_peers() const {
  std::shared_lock lock(table_mutex_);
  std::vector<std::string> out;
  out.reserve(connections_.size());
  for(const auto& kv : connections_) {
    if(kv.second->is_open()) out.push_back(kv.first);
  }
  return out;
}

void TransportAdapter::disconnect(const std::string& peer_id) {
  auto c = channel(peer_id);
  if(c) c->close("disconnect requested");
}
