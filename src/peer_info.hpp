#pragma once
#include <chrono>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

// Protocol tags carried in PeerInfo::protocol.
inline constexpr const char* kProtocolTcp = "tcp";
inline constexpr const char* kProtocolWifiDirect = "wifi-direct";
inline constexpr const char* kProtocolBluetooth = "bluetooth";
inline constexpr const char* kProtocolRelay = "relay";

// One discovery sighting. Refreshed on every scan.
struct PeerInfo {
  std::string id;
  std::string name;
  std::string address;          // transport specific ("ip:port", "sim:<id>", ...)
  std::string protocol;
  int signal_strength = 0;      // 0-100, 0 marks a cached (stale) entry
  std::chrono::system_clock::time_point last_seen{};
  std::set<std::string> capabilities;
};

inline nlohmann::json peer_info_to_json(const PeerInfo& p) {
  nlohmann::json j;
  j["id"] = p.id;
  j["name"] = p.name;
  j["address"] = p.address;
  j["protocol"] = p.protocol;
  j["signal_strength"] = p.signal_strength;
  j["last_seen"] = std::chrono::duration_cast<std::chrono::seconds>(
    p.last_seen.time_since_epoch()).count();
  j["capabilities"] = p.capabilities;
  return j;
}
