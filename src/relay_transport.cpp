#include "relay_transport.hpp"

#include <algorithm>

#include "errors.hpp"
#include "net_util.hpp"
#include "protocol.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void open_client(BlockingTcpClient& client,
                 const std::string& server,
                 std::chrono::milliseconds timeout) {
  std::string host;
  uint16_t port = 0;
  if(!split_host_port(server, host, port)) {
    throw MeshError(ErrorCode::Configuration, "relay server '" + server + "' is not host:port");
  }
  client.connect(host, port, timeout);
}

} // namespace

RelayTransport::RelayTransport(Options options,
                               MessageChannel::Options channel_options,
                               std::shared_ptr<Logger> logger)
  : TransportAdapter(kProtocolRelay, channel_options, std::move(logger)),
    options_(std::move(options)),
    control_handler_(*this) {}

RelayTransport::~RelayTransport() {
  stop();
  accept_pool_.join();
}

std::string RelayTransport::registered_server() const {
  std::lock_guard lg(control_mutex_);
  return control_server_;
}

void RelayTransport::on_start() {
  if(options_.servers.empty()) {
    throw MeshError(ErrorCode::Configuration, "relay transport has no servers configured");
  }
  if(!ensure_registered(options_.request_timeout)) {
    logger_->warn("no relay server reachable yet; will retry on demand");
  }
  keepalive_timer_ = std::make_unique<asio::steady_timer>(io());
  schedule_keepalive();
}

void RelayTransport::on_stop() {
  if(keepalive_timer_) keepalive_timer_->cancel();
  std::shared_ptr<MessageChannel> control;
  {
    std::lock_guard lg(control_mutex_);
    control.swap(control_);
    control_server_.clear();
  }
  registered_ = false;
  if(control) control->close("transport stopped");
}

void RelayTransport::schedule_keepalive() {
  auto interval = std::max<std::chrono::milliseconds>(channel_options_.idle_timeout / 3,
                                                      std::chrono::seconds(1));
  keepalive_timer_->expires_after(interval);
  keepalive_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !is_running()) return;
    std::shared_ptr<MessageChannel> control;
    {
      std::lock_guard lg(control_mutex_);
      control = control_;
    }
    if(control && control->is_open()) control->send_json(make_ping());
    schedule_keepalive();
  });
}

ChannelSocket RelayTransport::adopt_native(int fd, const asio::ip::tcp& protocol) {
  return ChannelSocket(io(),
                       asio::generic::stream_protocol(protocol.family(), protocol.protocol()),
                       fd);
}

bool RelayTransport::ensure_registered(std::chrono::milliseconds timeout) {
  if(registered_) return true;
  std::lock_guard reg(register_mutex_);
  if(registered_) return true;

  auto deadline = std::chrono::steady_clock::now() + timeout;
  for(const auto& server : options_.servers) {
    auto left = remaining_until(deadline);
    if(left.count() == 0) break;
    try {
      BlockingTcpClient client(channel_options_.max_frame_bytes);
      open_client(client, server, left);

      json request;
      request["type"] = kMsgRelayRegister;
      request["node_id"] = identity().node_id;
      request["node_name"] = identity().node_name;
      request["capabilities"] = identity().capabilities;
      client.write_frame(request, remaining_until(deadline));

      auto reply = client.read_frame(remaining_until(deadline));
      if(field_string(reply, "type") != kMsgRelayOk) {
        logger_->warn("relay {} refused registration: {}", server,
                      field_string(reply, "reason", "unexpected reply"));
        continue;
      }

      auto protocol = client.remote_protocol();
      int fd = client.release_native();
      auto options = channel_options_;
      options.extra_control_types = {kMsgRelayIncoming, kMsgRelayError};
      auto control = MessageChannel::create(adopt_native(fd, protocol),
                                            &control_handler_,
                                            options,
                                            logger_->child("relay-control"));
      control->set_transport(kind());
      control->set_remote_address(server);
      control->set_peer_id(server);
      {
        std::lock_guard lg(control_mutex_);
        control_ = control;
        control_server_ = server;
      }
      registered_ = true;
      control->start();
      logger_->info("registered with relay {}", server);
      return true;
    } catch(const MeshError& e) {
      logger_->warn("relay {} unavailable: {}", server, e.what());
    }
  }
  return false;
}

void RelayTransport::ControlHandler::on_control(const std::shared_ptr<MessageChannel>&,
                                                const json& message) {
  auto type = field_string(message, "type");
  if(type == kMsgRelayError) {
    owner_.logger_->warn("relay reported: {}", field_string(message, "reason", "unknown"));
    return;
  }
  if(type != kMsgRelayIncoming) return;
  auto session = field_string(message, "session");
  std::string from;
  if(message.contains("from") && message["from"].is_object()) {
    from = field_string(message["from"], "node_id");
  }
  if(session.empty()) {
    owner_.logger_->warn("RELAY_INCOMING without session");
    return;
  }
  auto server = owner_.registered_server();
  owner_.logger_->info("incoming relay session {} from {}", session, from);
  RelayTransport* owner = &owner_;
  asio::post(owner_.accept_pool_, [owner, server, session, from](){
    owner->accept_session(server, session, from);
  });
}

void RelayTransport::ControlHandler::on_closed(const std::shared_ptr<MessageChannel>& channel,
                                               const std::string& reason) {
  bool was_current = false;
  {
    std::lock_guard lg(owner_.control_mutex_);
    if(owner_.control_ == channel) {
      owner_.control_.reset();
      owner_.control_server_.clear();
      was_current = true;
    }
  }
  if(was_current) {
    owner_.registered_ = false;
    if(owner_.is_running()) {
      owner_.logger_->warn("relay control link lost: {}", reason);
    }
  }
}

void RelayTransport::accept_session(const std::string& server,
                                    const std::string& session,
                                    const std::string& from) {
  if(!is_running() || server.empty()) return;
  try {
    BlockingTcpClient client(channel_options_.max_frame_bytes);
    open_client(client, server, options_.request_timeout);
    json request;
    request["type"] = kMsgRelayAccept;
    request["session"] = session;
    request["node_id"] = identity().node_id;
    client.write_frame(request, options_.request_timeout);
    auto reply = client.read_frame(options_.request_timeout);
    if(field_string(reply, "type") != kMsgRelayOk) {
      throw MeshError(ErrorCode::Network,
                      "relay refused session " + session + ": " +
                      field_string(reply, "reason", "unexpected reply"));
    }
    auto protocol = client.remote_protocol();
    int fd = client.release_native();
    adopt(adopt_native(fd, protocol), "", "relay:" + server);
  } catch(const std::exception& e) {
    logger_->warn("accepting relay session {} from {} failed: {}", session, from, e.what());
  }
}

std::vector<PeerInfo> RelayTransport::discover(std::chrono::milliseconds timeout) {
  if(!is_running()) return {};
  auto deadline = std::chrono::steady_clock::now() + timeout;
  if(!ensure_registered(timeout)) {
    throw MeshError(ErrorCode::Network, "no relay server reachable");
  }
  auto server = registered_server();

  BlockingTcpClient client(channel_options_.max_frame_bytes);
  open_client(client, server, remaining_until(deadline));
  json request;
  request["type"] = kMsgRelayList;
  request["node_id"] = identity().node_id;
  client.write_frame(request, remaining_until(deadline));
  auto reply = client.read_frame(remaining_until(deadline));
  if(field_string(reply, "type") != kMsgRelayPeers || !reply.contains("peers")) {
    throw MeshError(ErrorCode::ProtocolViolation, "relay " + server + " sent no peer list");
  }

  std::vector<PeerInfo> out;
  auto now = std::chrono::system_clock::now();
  for(const auto& entry : reply["peers"]) {
    if(!entry.is_object()) continue;
    PeerInfo peer;
    peer.id = field_string(entry, "node_id");
    if(peer.id.empty() || peer.id == identity().node_id) continue;
    peer.name = field_string(entry, "node_name");
    peer.address = "relay:" + server;
    peer.protocol = kProtocolRelay;
    peer.signal_strength = 50;
    peer.last_seen = now;
    if(entry.contains("capabilities") && entry["capabilities"].is_array()) {
      for(const auto& cap : entry["capabilities"]) {
        if(cap.is_string()) peer.capabilities.insert(cap.get<std::string>());
      }
    }
    out.push_back(std::move(peer));
  }
  logger_->debug("relay {} lists {} peer(s)", server, out.size());
  return out;
}

std::shared_ptr<MessageChannel> RelayTransport::connect(const PeerInfo& target,
                                                        std::chrono::milliseconds timeout) {
  if(!is_running()) {
    throw MeshError(ErrorCode::NotRunning, "relay transport is not running");
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  if(!ensure_registered(timeout)) {
    throw MeshError(ErrorCode::Network, "no relay server reachable");
  }
  auto server = registered_server();

  BlockingTcpClient client(channel_options_.max_frame_bytes);
  open_client(client, server, remaining_until(deadline));
  json request;
  request["type"] = kMsgRelayConnect;
  request["node_id"] = identity().node_id;
  request["node_name"] = identity().node_name;
  request["target"] = target.id;
  client.write_frame(request, remaining_until(deadline));
  auto reply = client.read_frame(remaining_until(deadline));
  auto type = field_string(reply, "type");
  if(type == kMsgRelayError) {
    throw MeshError(ErrorCode::Network,
                    "relay " + server + ": " + field_string(reply, "reason", "unknown error"));
  }
  if(type != kMsgRelayOk) {
    throw MeshError(ErrorCode::ProtocolViolation, "relay " + server + " sent " + type);
  }

  auto protocol = client.remote_protocol();
  int fd = client.release_native();
  logger_->info("relayed link to {} via {}", target.id, server);
  return adopt(adopt_native(fd, protocol), target.id, "relay:" + server);
}
