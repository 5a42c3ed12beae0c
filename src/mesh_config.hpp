#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "transfer_types.hpp"

class SettingsManager;

// Typed node configuration built from SettingsManager.
struct MeshConfig {
  std::string node_name;
  std::string node_id;                    // generated by the coordinator when empty

  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 9000;
  uint16_t discovery_port = 9876;
  uint16_t discovery_target_port = 0;     // 0 = discovery_port
  std::string broadcast_address = "255.255.255.255";

  bool enable_tcp = true;
  bool enable_wifi_direct = true;
  bool enable_bluetooth = true;
  bool enable_relay = true;
  std::vector<std::string> relay_servers;
  bool simulate_radios = false;

  std::filesystem::path data_dir = ".";

  std::chrono::milliseconds scan_timeout{30000};
  std::chrono::seconds discovery_interval{60};
  std::chrono::seconds routing_interval{30};
  std::chrono::seconds connectivity_interval{300};
  std::chrono::seconds peer_ttl{1800};
  int isolation_confirmations = 2;

  std::chrono::seconds idle_timeout{300};
  uint32_t max_frame_bytes = 100u * 1024u * 1024u;
  std::chrono::milliseconds connect_timeout{5000};

  TransferOptions transfer;

  uint16_t effective_discovery_target_port() const {
    return discovery_target_port != 0 ? discovery_target_port : discovery_port;
  }

  static MeshConfig from_settings(const SettingsManager& settings);

  // Throws MeshError(Configuration).
  void validate() const;
};

std::vector<std::string> default_relay_servers();
