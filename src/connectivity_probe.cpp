#include "connectivity_probe.hpp"

#include <algorithm>
#include <array>

#include "net_util.hpp"
#include "utils.hpp"

namespace {

// SSDP group; a completed connect means local multicast traffic gets through.
constexpr const char* kMulticastProbeHost = "239.255.255.250";
constexpr uint16_t kMulticastProbePort = 1900;

const std::array<const char*, 3> kGatewayCandidates = {"192.168.1.1", "192.168.0.1", "10.0.0.1"};

} // namespace

nlohmann::json connection_info_to_json(const ConnectionInfo& info) {
  nlohmann::json j;
  j["mode"] = to_string(info.mode);
  j["client_isolation"] = info.client_isolation;
  j["nat_type"] = info.nat_type;
  j["public_ip"] = info.public_ip;
  j["relay_available"] = info.relay_available;
  j["last_connectivity_check"] = std::chrono::duration_cast<std::chrono::seconds>(
    info.last_connectivity_check.time_since_epoch()).count();
  return j;
}

bool SystemNetworkEnvironment::tcp_reachable(const std::string& host,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout) {
  return ::tcp_reachable(host, port, timeout);
}

std::string SystemNetworkEnvironment::public_ip(std::chrono::milliseconds timeout) {
  return http_get_body("api.ipify.org", "/?format=text", timeout);
}

std::vector<std::string> SystemNetworkEnvironment::local_addresses() {
  return local_ipv4_addresses();
}

ConnectivityProbe::ConnectivityProbe(Options options,
                                     std::shared_ptr<NetworkEnvironment> environment,
                                     std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    environment_(environment ? std::move(environment) : std::make_shared<SystemNetworkEnvironment>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("probe")) {}

ConnectionMode ConnectivityProbe::decide_mode(bool isolated, bool relay_enabled, bool wifi_direct_enabled) {
  if(!isolated) return ConnectionMode::Direct;
  if(relay_enabled) return ConnectionMode::Relay;
  if(wifi_direct_enabled) return ConnectionMode::Mixed;
  return ConnectionMode::Relay;
}

bool ConnectivityProbe::sample_isolation(const std::vector<std::string>& peer_addresses) {
  auto timeout = options_.isolation_probe_timeout;
  if(environment_->tcp_reachable(kMulticastProbeHost, kMulticastProbePort, timeout)) {
    return false;
  }
  bool gateway = false;
  for(const auto* candidate : kGatewayCandidates) {
    if(environment_->tcp_reachable(candidate, 80, timeout)) {
      logger_->debug("gateway {} reachable", candidate);
      gateway = true;
      break;
    }
  }
  if(!gateway) return false;

  for(const auto& address : peer_addresses) {
    std::string host;
    uint16_t port = 0;
    if(!split_host_port(address, host, port)) continue;
    if(environment_->tcp_reachable(host, port, timeout)) {
      logger_->debug("peer {} reachable directly", address);
      return false;
    }
  }
  return true;
}

ConnectionInfo ConnectivityProbe::sample(const std::vector<std::string>& peer_addresses) {
  ConnectionInfo info;
  info.last_connectivity_check = std::chrono::system_clock::now();

  try {
    info.public_ip = trim_copy(environment_->public_ip(options_.public_ip_timeout));
  } catch(const std::exception& e) {
    logger_->debug("public IP lookup failed: {}", e.what());
  }

  info.client_isolation = sample_isolation(peer_addresses);

  if(!info.public_ip.empty()) {
    auto local = environment_->local_addresses();
    if(std::find(local.begin(), local.end(), info.public_ip) != local.end()) {
      info.nat_type = "None";
    }
  }

  if(options_.enable_relay) {
    for(const auto& server : options_.relay_servers) {
      std::string host;
      uint16_t port = 0;
      if(!split_host_port(server, host, port)) continue;
      if(environment_->tcp_reachable(host, port, options_.relay_probe_timeout)) {
        info.relay_available = true;
        break;
      }
    }
  }
  return info;
}

ConnectionInfo ConnectivityProbe::detect_conditions(const std::vector<std::string>& peer_addresses) {
  auto info = sample(peer_addresses);
  info.mode = decide_mode(info.client_isolation, options_.enable_relay, options_.enable_wifi_direct);
  {
    std::lock_guard lg(mutex_);
    disagreements_ = 0;
  }
  logger_->info("network: mode={} isolation={} nat={} public_ip={} relay_available={}",
                to_string(info.mode), info.client_isolation, info.nat_type,
                info.public_ip.empty() ? "-" : info.public_ip, info.relay_available);
  return info;
}

ConnectionInfo ConnectivityProbe::recheck(const ConnectionInfo& current,
                                          const std::vector<std::string>& peer_addresses) {
  auto info = sample(peer_addresses);
  bool observed = info.client_isolation;
  {
    std::lock_guard lg(mutex_);
    if(observed == current.client_isolation) {
      disagreements_ = 0;
    } else if(++disagreements_ >= std::max(1, options_.isolation_confirmations)) {
      disagreements_ = 0;
      logger_->info("client isolation changed to {}", observed);
    } else {
      logger_->debug("isolation sample {} disagrees ({} of {})",
                     observed, disagreements_, options_.isolation_confirmations);
      info.client_isolation = current.client_isolation;
    }
  }
  info.mode = decide_mode(info.client_isolation, options_.enable_relay, options_.enable_wifi_direct);
  if(info.mode != current.mode) {
    logger_->info("connection mode {} -> {}", to_string(current.mode), to_string(info.mode));
  }
  return info;
}
