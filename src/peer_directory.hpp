#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "peer_info.hpp"

struct Route {
  std::string destination_id;
  std::string next_hop;
  int hop_count = 1;
  int quality = 0;      // 0-100
};

// Mesh level view of a peer, owned by PeerDirectory.
struct Peer {
  PeerInfo info;                              // most recent sighting on any transport
  std::map<std::string, PeerInfo> sightings;  // latest sighting per protocol
  bool is_online = false;
  int connection_quality = 0;
  std::string connected_via;    // transport of the open channel, empty when none
  std::vector<Route> routes;
};

nlohmann::json peer_to_json(const Peer& peer);

// A direct route (hop_count 1) wins outright; otherwise the highest quality,
// first one on ties. Empty input yields nullopt.
std::optional<Route> find_best_route(const std::vector<Route>& routes);

class PeerDirectory {
public:
  explicit PeerDirectory(std::string self_id = "") : self_id_(std::move(self_id)) {}

  void set_self_id(std::string id);

  // Records a discovery sighting. Cached sightings (signal 0) never overwrite
  // a known entry.
  void upsert_discovered(const PeerInfo& info);
  void mark_connected(const PeerInfo& info, const std::string& transport);
  void mark_disconnected(const std::string& id, const std::string& transport);
  void set_routes(const std::string& id, std::vector<Route> routes);
  bool remove(const std::string& id);

  std::optional<Peer> get(const std::string& id) const;
  std::vector<Peer> snapshot() const;
  std::size_t size() const;

  // Exact ID, case-insensitive ID, exact name, then a unique case-insensitive
  // name. Throws MeshError(PeerNotFound) or MeshError(AmbiguousPeer).
  Peer find_by_id_or_name(const std::string& query) const;

  // Drops peers unseen for longer than `ttl` that have no open channel.
  std::vector<std::string> evict_stale(std::chrono::system_clock::time_point now,
                                       std::chrono::seconds ttl);

private:
  mutable std::shared_mutex mutex_;
  std::string self_id_;
  std::unordered_map<std::string, Peer> peers_;
};
