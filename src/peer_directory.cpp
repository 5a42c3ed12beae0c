#include "peer_directory.hpp"

#include <mutex>

#include "errors.hpp"
#include "utils.hpp"

nlohmann::json peer_to_json(const Peer& peer) {
  auto j = peer_info_to_json(peer.info);
  j["online"] = peer.is_online;
  j["connection_quality"] = peer.connection_quality;
  j["connected_via"] = peer.connected_via;
  nlohmann::json routes = nlohmann::json::array();
  for(const auto& route : peer.routes) {
    routes.push_back({{"destination", route.destination_id},
                      {"next_hop", route.next_hop},
                      {"hop_count", route.hop_count},
                      {"quality", route.quality}});
  }
  j["routes"] = std::move(routes);
  return j;
}

std::optional<Route> find_best_route(const std::vector<Route>& routes) {
  const Route* best = nullptr;
  for(const auto& route : routes) {
    if(route.hop_count == 1) return route;
    if(!best || route.quality > best->quality) best = &route;
  }
  if(!best) return std::nullopt;
  return *best;
}

void PeerDirectory::set_self_id(std::string id) {
  std::unique_lock lk(mutex_);
  self_id_ = std::move(id);
}

void PeerDirectory::upsert_discovered(const PeerInfo& info) {
  if(info.id.empty()) return;
  std::unique_lock lk(mutex_);
  if(info.id == self_id_) return;
  auto it = peers_.find(info.id);
  if(it == peers_.end()) {
    Peer peer;
    peer.info = info;
    if(info.signal_strength > 0) peer.sightings[info.protocol] = info;
    peers_.emplace(info.id, std::move(peer));
    return;
  }
  if(info.signal_strength == 0) return;
  auto& peer = it->second;
  peer.sightings[info.protocol] = info;
  peer.info.name = info.name;
  peer.info.address = info.address;
  peer.info.protocol = info.protocol;
  peer.info.signal_strength = info.signal_strength;
  peer.info.last_seen = info.last_seen;
  peer.info.capabilities = info.capabilities;
}

void PeerDirectory::mark_connected(const PeerInfo& info, const std::string& transport) {
  if(info.id.empty()) return;
  std::unique_lock lk(mutex_);
  if(info.id == self_id_) return;
  auto& peer = peers_[info.id];
  if(peer.info.id.empty()) peer.info = info;
  if(!info.name.empty()) peer.info.name = info.name;
  if(!info.capabilities.empty()) peer.info.capabilities = info.capabilities;
  peer.info.last_seen = std::chrono::system_clock::now();
  peer.is_online = true;
  peer.connected_via = transport;
  peer.connection_quality = info.signal_strength;
}

void PeerDirectory::mark_disconnected(const std::string& id, const std::string& transport) {
  std::unique_lock lk(mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return;
  if(it->second.connected_via != transport) return;
  it->second.connected_via.clear();
  it->second.is_online = false;
  it->second.connection_quality = 0;
}

void PeerDirectory::set_routes(const std::string& id, std::vector<Route> routes) {
  std::unique_lock lk(mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return;
  it->second.routes = std::move(routes);
}

bool PeerDirectory::remove(const std::string& id) {
  std::unique_lock lk(mutex_);
  return peers_.erase(id) > 0;
}

std::optional<Peer> PeerDirectory::get(const std::string& id) const {
  std::shared_lock lk(mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<Peer> PeerDirectory::snapshot() const {
  std::shared_lock lk(mutex_);
  std::vector<Peer> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::size_t PeerDirectory::size() const {
  std::shared_lock lk(mutex_);
  return peers_.size();
}

Peer PeerDirectory::find_by_id_or_name(const std::string& query) const {
  std::shared_lock lk(mutex_);
  auto exact = peers_.find(query);
  if(exact != peers_.end()) return exact->second;

  for(const auto& kv : peers_) {
    if(iequals(kv.first, query)) return kv.second;
  }
  for(const auto& kv : peers_) {
    if(kv.second.info.name == query) return kv.second;
  }

  const Peer* match = nullptr;
  std::size_t matches = 0;
  for(const auto& kv : peers_) {
    if(iequals(kv.second.info.name, query)) {
      match = &kv.second;
      ++matches;
    }
  }
  if(matches > 1) {
    throw MeshError(ErrorCode::AmbiguousPeer,
                    std::to_string(matches) + " peers are named '" + query + "' ignoring case; use the peer ID");
  }
  if(!match) {
    throw MeshError(ErrorCode::PeerNotFound, "no peer with ID or name '" + query + "'");
  }
  return *match;
}

std::vector<std::string> PeerDirectory::evict_stale(std::chrono::system_clock::time_point now,
                                                    std::chrono::seconds ttl) {
  std::vector<std::string> evicted;
  if(ttl.count() <= 0) return evicted;
  std::unique_lock lk(mutex_);
  for(auto it = peers_.begin(); it != peers_.end();) {
    const auto& peer = it->second;
    if(peer.connected_via.empty() && now - peer.info.last_seen > ttl) {
      evicted.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}
