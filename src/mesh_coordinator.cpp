#include "mesh_coordinator.hpp"

#include <algorithm>
#include <thread>

#include "errors.hpp"
#include "protocol.hpp"
#include "relay_transport.hpp"
#include "simulated_transport.hpp"
#include "tcp_transport.hpp"
#include "utils.hpp"

using json = nlohmann::json;

std::vector<std::shared_ptr<TransportAdapter>> make_transports(const MeshConfig& config,
                                                               std::shared_ptr<SimulatedMedium> medium,
                                                               std::shared_ptr<Logger> logger) {
  if(!logger) logger = std::make_shared<Logger>("mesh");
  MessageChannel::Options channel;
  channel.max_frame_bytes = config.max_frame_bytes;
  channel.idle_timeout = config.idle_timeout;

  std::vector<std::shared_ptr<TransportAdapter>> out;
  if(config.enable_tcp) {
    TcpTransport::Options options;
    options.listen_ip = config.listen_ip;
    options.listen_port = config.listen_port;
    options.discovery_port = config.discovery_port;
    options.discovery_target_port = config.effective_discovery_target_port();
    options.broadcast_address = config.broadcast_address;
    out.push_back(std::make_shared<TcpTransport>(options, channel, logger->child(kProtocolTcp)));
  }

  if((config.enable_wifi_direct || config.enable_bluetooth) && config.simulate_radios && !medium) {
    medium = std::make_shared<SimulatedMedium>();
  }
  for(const std::string radio : {kProtocolWifiDirect, kProtocolBluetooth}) {
    bool enabled = (radio == kProtocolWifiDirect) ? config.enable_wifi_direct : config.enable_bluetooth;
    if(!enabled) continue;
    if(config.simulate_radios) {
      out.push_back(std::make_shared<SimulatedTransport>(radio, medium, channel, logger->child(radio)));
    } else {
      out.push_back(std::make_shared<UnsupportedTransport>(radio, logger->child(radio)));
    }
  }

  if(config.enable_relay) {
    RelayTransport::Options options;
    options.servers = config.relay_servers.empty() ? default_relay_servers() : config.relay_servers;
    options.request_timeout = config.connect_timeout;
    out.push_back(std::make_shared<RelayTransport>(options, channel, logger->child(kProtocolRelay)));
  }
  return out;
}

MeshCoordinator::MeshCoordinator(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("mesh")),
    discovery_(logger_->child("discovery")),
    transfers_(*this, logger_->child("transfer")) {}

MeshCoordinator::~MeshCoordinator() {
  stop_node();
}

void MeshCoordinator::add_transport(std::shared_ptr<TransportAdapter> transport) {
  if(!transport) return;
  std::unique_lock lk(transports_mutex_);
  transports_.push_back(std::move(transport));
}

void MeshCoordinator::set_probe(std::shared_ptr<ConnectivityProbe> probe) {
  probe_ = std::move(probe);
}

void MeshCoordinator::set_simulated_medium(std::shared_ptr<SimulatedMedium> medium) {
  medium_ = std::move(medium);
}

std::shared_ptr<TransportAdapter> MeshCoordinator::transport(const std::string& kind) const {
  std::shared_lock lk(transports_mutex_);
  for(const auto& t : transports_) {
    if(t->kind() == kind) return t;
  }
  return nullptr;
}

std::vector<std::shared_ptr<TransportAdapter>> MeshCoordinator::transports() const {
  std::shared_lock lk(transports_mutex_);
  return transports_;
}

std::vector<std::shared_ptr<TransportAdapter>> MeshCoordinator::running_transports() const {
  std::vector<std::shared_ptr<TransportAdapter>> out;
  std::shared_lock lk(transports_mutex_);
  for(const auto& t : transports_) {
    if(t->is_running()) out.push_back(t);
  }
  return out;
}

std::shared_ptr<TransportAdapter> MeshCoordinator::connected_transport(const std::string& peer_id) const {
  std::shared_lock lk(transports_mutex_);
  for(const auto& t : transports_) {
    if(t->is_running() && t->is_connected(peer_id)) return t;
  }
  return nullptr;
}

void MeshCoordinator::start_node(const MeshConfig& config) {
  std::lock_guard lg(lifecycle_mutex_);
  if(running_) {
    throw MeshError(ErrorCode::AlreadyRunning, "node " + node_id_ + " is already running");
  }
  config.validate();

  config_ = config;
  node_id_ = config.node_id.empty() ? generate_node_id() : config.node_id;
  node_name_ = config.node_name.empty() ? "node-" + node_id_.substr(0, 8) : config.node_name;
  config_.node_id = node_id_;
  config_.node_name = node_name_;
  directory_.set_self_id(node_id_);

  auto all = transports();
  if(all.empty()) {
    all = make_transports(config_, medium_, logger_);
    std::unique_lock lk(transports_mutex_);
    transports_ = all;
  }

  LocalIdentity identity;
  identity.node_id = node_id_;
  identity.node_name = node_name_;
  identity.capabilities = {"chunked-transfer", "mesh-route"};
  for(const auto& t : all) identity.capabilities.insert(t->kind());

  std::vector<std::shared_ptr<TransportAdapter>> started;
  for(const auto& t : all) {
    t->set_identity(identity);
    t->set_sink(this);
    try {
      t->start();
      started.push_back(t);
    } catch(const MeshError& e) {
      if(e.code() == ErrorCode::TransportUnsupported) {
        logger_->warn("{} unavailable: {}", t->kind(), e.detail());
        continue;
      }
      logger_->error("{} failed to start: {}", t->kind(), e.what());
      for(auto& s : started) s->stop();
      throw;
    }
  }
  if(started.empty()) {
    throw MeshError(ErrorCode::Configuration, "none of the enabled transports could be started");
  }

  if(!probe_) {
    ConnectivityProbe::Options options;
    options.enable_relay = config_.enable_relay;
    options.enable_wifi_direct = config_.enable_wifi_direct;
    options.relay_servers = config_.relay_servers.empty() ? default_relay_servers() : config_.relay_servers;
    options.isolation_confirmations = config_.isolation_confirmations;
    probe_ = std::make_shared<ConnectivityProbe>(options, nullptr, logger_->child("probe"));
  }
  auto info = probe_->detect_conditions();
  {
    std::unique_lock lk(info_mutex_);
    connection_info_ = info;
  }
  if(info.client_isolation) {
    logger_->warn("client isolation detected, connections fall back to {}", to_string(info.mode));
  }

  transfers_.reopen();
  transfers_.enable_auto_receive(config_.data_dir / "received", config_.transfer);

  running_ = true;
  loop_pool_ = std::make_unique<asio::thread_pool>(3);
  {
    std::lock_guard tlg(timer_mutex_);
    discovery_timer_ = std::make_unique<asio::steady_timer>(*loop_pool_);
    routing_timer_ = std::make_unique<asio::steady_timer>(*loop_pool_);
    connectivity_timer_ = std::make_unique<asio::steady_timer>(*loop_pool_);
  }
  schedule(*discovery_timer_, config_.discovery_interval, &MeshCoordinator::run_discovery_cycle, "discovery");
  schedule(*routing_timer_, config_.routing_interval, &MeshCoordinator::refresh_routes, "routing");
  schedule(*connectivity_timer_, config_.connectivity_interval, &MeshCoordinator::recheck_connectivity, "connectivity");

  logger_->info("node {} ({}) up with {} transport(s), mode {}",
                node_name_, node_id_, started.size(), to_string(info.mode));
}

void MeshCoordinator::schedule(asio::steady_timer& timer,
                               std::chrono::seconds interval,
                               Loop body,
                               const char* name) {
  std::lock_guard lg(timer_mutex_);
  if(!running_) return;
  timer.expires_after(interval);
  timer.async_wait([this, &timer, interval, body, name](const std::error_code& ec){
    if(ec || !running_) return;
    try {
      (this->*body)();
    } catch(const std::exception& e) {
      logger_->warn("{} task failed: {}", name, e.what());
    }
    schedule(timer, interval, body, name);
  });
}

void MeshCoordinator::wait_for_flush(std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while(std::chrono::steady_clock::now() < deadline) {
    bool pending = false;
    for(const auto& t : running_transports()) {
      for(const auto& id : t->connected_peers()) {
        auto channel = t->channel(id);
        if(channel && channel->is_open() && channel->queued_frames() > 0) {
          pending = true;
          break;
        }
      }
      if(pending) break;
    }
    if(!pending) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void MeshCoordinator::stop_node() {
  std::lock_guard lg(lifecycle_mutex_);
  if(!running_.exchange(false)) return;

  {
    std::lock_guard tlg(timer_mutex_);
    for(auto* timer : {discovery_timer_.get(), routing_timer_.get(), connectivity_timer_.get()}) {
      if(timer) timer->cancel();
    }
  }
  discovery_.cancel_active();
  transfers_.shutdown();

  auto bye = make_bye(node_id_);
  std::size_t notified = 0;
  for(const auto& t : running_transports()) {
    for(const auto& id : t->connected_peers()) {
      try {
        t->send_json(id, bye);
        ++notified;
      } catch(const MeshError& e) {
        logger_->debug("no BYE for {}: {}", id, e.detail());
      }
    }
  }
  if(notified > 0) wait_for_flush(std::chrono::milliseconds(1000));

  for(const auto& t : transports()) t->stop();

  if(loop_pool_) loop_pool_->join();
  {
    std::lock_guard tlg(timer_mutex_);
    discovery_timer_.reset();
    routing_timer_.reset();
    connectivity_timer_.reset();
  }
  loop_pool_.reset();
  logger_->info("node {} stopped ({} peer(s) notified)", node_id_, notified);
}

ScanResult MeshCoordinator::scan(const ScanOptions& options) {
  if(!running_) {
    throw MeshError(ErrorCode::NotRunning, "node is not running");
  }
  auto result = discovery_.scan(running_transports(), options);
  record_sightings(result);
  return result;
}

// Every per-transport sighting first, then the strongest one per peer so it
// ends up as the peer's headline info.
void MeshCoordinator::record_sightings(const ScanResult& result) {
  for(const auto& peer : result.sightings) directory_.upsert_discovered(peer);
  for(const auto& peer : result.peers) directory_.upsert_discovered(peer);
}

void MeshCoordinator::run_discovery_cycle() {
  ScanOptions options;
  options.timeout = config_.scan_timeout;
  options.include_cached = false;
  auto result = discovery_.scan(running_transports(), options);
  record_sightings(result);
  if(!result.complete()) {
    logger_->debug("discovery incomplete: {}", result.error_summary());
  }
  logger_->debug("discovery cycle saw {} peer(s), {} known", result.live_count, directory_.size());
}

Peer MeshCoordinator::find_peer_by_id_or_name(const std::string& query) const {
  return directory_.find_by_id_or_name(query);
}

std::vector<Peer> MeshCoordinator::get_known_peers() const {
  auto peers = directory_.snapshot();
  std::sort(peers.begin(), peers.end(), [](const Peer& a, const Peer& b){
    return a.info.id < b.info.id;
  });
  return peers;
}

ConnectionInfo MeshCoordinator::get_connection_info() const {
  std::shared_lock lk(info_mutex_);
  return connection_info_;
}

bool MeshCoordinator::is_peer_connected(const std::string& peer_id) const {
  return connected_transport(peer_id) != nullptr;
}

void MeshCoordinator::connect_with(const std::string& kind, const Peer& peer) {
  auto t = transport(kind);
  if(!t || !t->is_running()) {
    throw MeshError(ErrorCode::TransportUnsupported, kind + " transport is not available");
  }
  PeerInfo target = peer.info;
  auto sighting = peer.sightings.find(kind);
  if(sighting != peer.sightings.end()) {
    target = sighting->second;
  } else if(kind == kProtocolTcp) {
    throw MeshError(ErrorCode::Network, "no TCP address known for " + peer.info.id);
  }
  target.protocol = kind;
  t->connect(target, config_.connect_timeout);
}

void MeshCoordinator::connect_to_peer(const std::string& id_or_name) {
  if(!running_) {
    throw MeshError(ErrorCode::NotRunning, "node is not running");
  }
  auto peer = directory_.find_by_id_or_name(id_or_name);
  if(connected_transport(peer.info.id)) {
    logger_->debug("{} is already connected", peer.info.id);
    return;
  }

  auto info = get_connection_info();
  std::vector<std::string> plan;
  if(config_.enable_tcp) plan.push_back(kProtocolTcp);
  if(info.client_isolation && config_.enable_wifi_direct) plan.push_back(kProtocolWifiDirect);
  if(config_.enable_relay) plan.push_back(kProtocolRelay);
  if(plan.empty()) {
    throw MeshError(ErrorCode::TransportUnsupported,
                    "no connection strategy is enabled for " + peer.info.id);
  }

  std::optional<MeshError> last;
  std::string attempted;
  for(const auto& kind : plan) {
    attempted += (attempted.empty() ? "" : ", ") + kind;
    try {
      connect_with(kind, peer);
      logger_->info("connected to {} ({}) via {}", peer.info.name, peer.info.id, kind);
      return;
    } catch(const MeshError& e) {
      logger_->warn("{} connection to {} failed: {}", kind, peer.info.id, e.detail());
      last = e;
    }
  }
  throw MeshError(last->code(), last->detail() + " (tried " + attempted + ")");
}

FileTransferInfo MeshCoordinator::send_file_chunked(const std::filesystem::path& path,
                                                    const std::string& id_or_name,
                                                    const TransferOptions& options) {
  if(!running_) {
    throw MeshError(ErrorCode::NotRunning, "node is not running");
  }
  auto peer = directory_.find_by_id_or_name(id_or_name);
  if(!connected_transport(peer.info.id)) connect_to_peer(peer.info.id);
  return transfers_.send_file_chunked(path, peer.info.id, options);
}

FileTransferInfo MeshCoordinator::receive_file_chunked(const std::string& id_or_name,
                                                       const std::filesystem::path& dest_dir,
                                                       const TransferOptions& options) {
  if(!running_) {
    throw MeshError(ErrorCode::NotRunning, "node is not running");
  }
  std::string peer_id = id_or_name;
  try {
    peer_id = directory_.find_by_id_or_name(id_or_name).info.id;
  } catch(const MeshError& e) {
    // A sender that has not connected yet is addressed by its raw ID.
    if(e.code() != ErrorCode::PeerNotFound) throw;
  }
  return transfers_.receive_file_chunked(peer_id, dest_dir, options);
}

std::vector<std::string> MeshCoordinator::tcp_peer_addresses() const {
  std::vector<std::string> out;
  for(const auto& peer : directory_.snapshot()) {
    auto it = peer.sightings.find(kProtocolTcp);
    if(it != peer.sightings.end() && !it->second.address.empty()) {
      out.push_back(it->second.address);
    }
  }
  return out;
}

void MeshCoordinator::recheck_connectivity() {
  if(!probe_) return;
  auto updated = probe_->recheck(get_connection_info(), tcp_peer_addresses());
  std::unique_lock lk(info_mutex_);
  connection_info_ = updated;
}

void MeshCoordinator::refresh_routes() {
  auto now = std::chrono::system_clock::now();
  for(const auto& id : directory_.evict_stale(now, config_.peer_ttl)) {
    discovery_.cache().forget(id);
    {
      std::lock_guard lg(adverts_mutex_);
      adverts_.erase(id);
    }
    logger_->info("forgot peer {} (unseen for over {}s)", id, config_.peer_ttl.count());
  }

  std::unordered_map<std::string, std::vector<AdvertisedRoute>> adverts;
  {
    std::lock_guard lg(adverts_mutex_);
    adverts = adverts_;
  }

  auto peers = directory_.snapshot();
  std::unordered_map<std::string, int> link_quality;
  for(const auto& peer : peers) {
    if(peer.connected_via.empty()) continue;
    link_quality[peer.info.id] = peer.connection_quality > 0 ? peer.connection_quality
                                                             : peer.info.signal_strength;
  }

  json advert = json::array();
  for(const auto& peer : peers) {
    const auto& id = peer.info.id;
    std::vector<Route> routes;
    auto direct = link_quality.find(id);
    if(direct != link_quality.end()) {
      routes.push_back(Route{id, id, 1, direct->second});
      advert.push_back({{"destination", id}, {"hop_count", 1}, {"quality", direct->second}});
    }
    for(const auto& kv : adverts) {
      if(kv.first == id) continue;
      auto via = link_quality.find(kv.first);
      if(via == link_quality.end()) continue;
      for(const auto& learned : kv.second) {
        if(learned.destination != id) continue;
        routes.push_back(Route{id, kv.first, learned.hop_count + 1, std::min(learned.quality, via->second)});
      }
    }
    directory_.set_routes(id, std::move(routes));
  }

  if(advert.empty()) return;
  auto message = make_route_advert(node_id_, advert);
  for(const auto& kv : link_quality) {
    try {
      send_control(kv.first, message);
    } catch(const MeshError& e) {
      logger_->debug("route advert to {} not sent: {}", kv.first, e.detail());
    }
  }
}

void MeshCoordinator::handle_route_advert(const std::string& peer_id, const json& message) {
  if(!message.contains("routes") || !message["routes"].is_array()) {
    logger_->debug("MESH_ROUTE from {} without routes", peer_id);
    return;
  }
  std::vector<AdvertisedRoute> routes;
  for(const auto& entry : message["routes"]) {
    if(!entry.is_object()) continue;
    AdvertisedRoute route;
    route.destination = field_string(entry, "destination");
    route.hop_count = static_cast<int>(std::clamp<int64_t>(field_int(entry, "hop_count", 1), 0, 255));
    route.quality = static_cast<int>(std::clamp<int64_t>(field_int(entry, "quality", 0), 0, 100));
    if(route.destination.empty() || route.destination == node_id_ || route.hop_count < 1) continue;
    routes.push_back(std::move(route));
  }
  std::lock_guard lg(adverts_mutex_);
  adverts_[peer_id] = std::move(routes);
}

void MeshCoordinator::on_peer_connected(const std::string& transport, const PeerInfo& peer) {
  directory_.mark_connected(peer, transport);
  logger_->info("peer {} ({}) connected over {}", peer.name, peer.id, transport);
}

void MeshCoordinator::on_peer_message(const std::string& transport,
                                      const std::string& peer_id,
                                      const json& message) {
  auto type = field_string(message, "type");
  if(type == kMsgDataTransfer) {
    transfers_.handle_control(peer_id, message);
  } else if(type == kMsgMeshRoute) {
    handle_route_advert(peer_id, message);
  } else if(type == kMsgBye) {
    logger_->info("peer {} left the mesh ({})", peer_id, transport);
    directory_.remove(peer_id);
    discovery_.cache().forget(peer_id);
    {
      std::lock_guard lg(adverts_mutex_);
      adverts_.erase(peer_id);
    }
    transfers_.handle_peer_lost(peer_id);
  } else {
    logger_->debug("ignoring {} from {}", type, peer_id);
  }
}

void MeshCoordinator::on_peer_binary(const std::string&,
                                     const std::string& peer_id,
                                     std::string payload) {
  transfers_.handle_binary(peer_id, payload);
}

void MeshCoordinator::on_peer_disconnected(const std::string& transport, const std::string& peer_id) {
  directory_.mark_disconnected(peer_id, transport);
  if(auto other = connected_transport(peer_id)) {
    if(auto peer = directory_.get(peer_id)) directory_.mark_connected(peer->info, other->kind());
    return;
  }
  {
    std::lock_guard lg(adverts_mutex_);
    adverts_.erase(peer_id);
  }
  transfers_.handle_peer_lost(peer_id);
  logger_->debug("peer {} disconnected from {}", peer_id, transport);
}

void MeshCoordinator::send_control(const std::string& peer_id, const json& message) {
  auto t = connected_transport(peer_id);
  if(!t) {
    throw MeshError(ErrorCode::PeerNotConnected, peer_id + " has no open channel");
  }
  t->send_json(peer_id, message);
}

void MeshCoordinator::send_binary(const std::string& peer_id, std::string payload) {
  auto t = connected_transport(peer_id);
  if(!t) {
    throw MeshError(ErrorCode::PeerNotConnected, peer_id + " has no open channel");
  }
  t->send_data(peer_id, std::move(payload));
}

LogListenerHandle MeshCoordinator::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void MeshCoordinator::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) logger_->remove_listener(handle);
}

void MeshCoordinator::clear_log_listeners() {
  logger_->clear_listeners();
}
