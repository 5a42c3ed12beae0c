#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

enum class ConnectionMode { Direct, Relay, Mixed };

inline const char* to_string(ConnectionMode mode) {
  switch(mode) {
    case ConnectionMode::Direct: return "direct";
    case ConnectionMode::Relay:  return "relay";
    case ConnectionMode::Mixed:  return "mixed";
  }
  return "unknown";
}

struct ConnectionInfo {
  ConnectionMode mode = ConnectionMode::Direct;
  bool client_isolation = false;
  std::string nat_type = "Unknown";
  std::string public_ip;
  bool relay_available = false;
  std::chrono::system_clock::time_point last_connectivity_check{};
};

nlohmann::json connection_info_to_json(const ConnectionInfo& info);

// Outbound probes used by ConnectivityProbe; tests substitute a scripted one.
class NetworkEnvironment {
public:
  virtual ~NetworkEnvironment() = default;
  virtual bool tcp_reachable(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;
  // Throws on failure.
  virtual std::string public_ip(std::chrono::milliseconds timeout) = 0;
  virtual std::vector<std::string> local_addresses() = 0;
};

class SystemNetworkEnvironment : public NetworkEnvironment {
public:
  bool tcp_reachable(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
  std::string public_ip(std::chrono::milliseconds timeout) override;
  std::vector<std::string> local_addresses() override;
};

class ConnectivityProbe {
public:
  struct Options {
    bool enable_relay = true;
    bool enable_wifi_direct = true;
    std::vector<std::string> relay_servers;
    int isolation_confirmations = 2;
    std::chrono::milliseconds isolation_probe_timeout{500};
    std::chrono::milliseconds public_ip_timeout{5000};
    std::chrono::milliseconds relay_probe_timeout{5000};
  };

  explicit ConnectivityProbe(Options options,
                             std::shared_ptr<NetworkEnvironment> environment = nullptr,
                             std::shared_ptr<Logger> logger = nullptr);

  // One fresh sample. Never throws; every failed probe just leaves its field
  // at the default. `peer_addresses` are host:port pairs of known TCP peers.
  ConnectionInfo detect_conditions(const std::vector<std::string>& peer_addresses = {});

  // Like detect_conditions, but the isolation flag of `current` only flips
  // after isolation_confirmations consecutive disagreeing samples.
  ConnectionInfo recheck(const ConnectionInfo& current,
                         const std::vector<std::string>& peer_addresses = {});

  bool sample_isolation(const std::vector<std::string>& peer_addresses);

  static ConnectionMode decide_mode(bool isolated, bool relay_enabled, bool wifi_direct_enabled);

private:
  ConnectionInfo sample(const std::vector<std::string>& peer_addresses);

  Options options_;
  std::shared_ptr<NetworkEnvironment> environment_;
  std::shared_ptr<Logger> logger_;
  std::mutex mutex_;
  int disagreements_ = 0;
};
