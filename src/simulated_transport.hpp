#pragma once
#include <asio.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport_adapter.hpp"

class SimulatedTransport;

// In-process stand-in for the radio layer (WiFi Direct, Bluetooth). Nodes
// attached to the same radio see each other; links are local socket pairs.
class SimulatedMedium {
public:
  struct NodeProfile {
    int signal_strength = 80;
    bool reachable = true;
  };

  void attach(const std::string& radio, SimulatedTransport* transport);
  void detach(const std::string& radio, const SimulatedTransport* transport);

  void set_profile(const std::string& radio, const std::string& node_id, NodeProfile profile);
  // Time one scan on `radio` takes before it reports. Scans cannot be
  // cancelled; callers race them against their own timeout.
  void set_scan_latency(const std::string& radio, std::chrono::milliseconds latency);
  std::chrono::milliseconds scan_latency(const std::string& radio) const;

  std::vector<PeerInfo> visible_from(const std::string& radio, const std::string& node_id) const;

  // Pairs `dialer_end` with a fresh socket served by the target node.
  // Throws MeshError(Network) when the target is absent or out of range.
  void link(const std::string& radio,
            const std::string& from_node,
            const std::string& to_node,
            asio::local::stream_protocol::socket& dialer_end);

private:
  struct Entry {
    SimulatedTransport* transport = nullptr;
    LocalIdentity identity;
  };

  NodeProfile profile_locked(const std::string& radio, const std::string& node_id) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::map<std::string, Entry>> radios_;
  std::map<std::string, std::map<std::string, NodeProfile>> profiles_;
  std::map<std::string, std::chrono::milliseconds> scan_latency_;
};

class SimulatedTransport : public TransportAdapter {
public:
  SimulatedTransport(std::string radio,
                     std::shared_ptr<SimulatedMedium> medium,
                     MessageChannel::Options channel_options,
                     std::shared_ptr<Logger> logger = nullptr);
  ~SimulatedTransport() override;

  std::vector<PeerInfo> discover(std::chrono::milliseconds timeout) override;
  std::shared_ptr<MessageChannel> connect(const PeerInfo& target,
                                          std::chrono::milliseconds timeout) override;

  // Called by the medium with the medium lock held.
  void accept_link(asio::local::stream_protocol::socket& dialer_end, const std::string& from_node);

protected:
  void on_start() override;
  void on_stop() override;

private:
  std::shared_ptr<SimulatedMedium> medium_;
};

// Radio adapter for builds without platform radio support.
class UnsupportedTransport : public TransportAdapter {
public:
  explicit UnsupportedTransport(std::string radio, std::shared_ptr<Logger> logger = nullptr);

  std::vector<PeerInfo> discover(std::chrono::milliseconds timeout) override;
  std::shared_ptr<MessageChannel> connect(const PeerInfo& target,
                                          std::chrono::milliseconds timeout) override;

protected:
  void on_start() override;
};
