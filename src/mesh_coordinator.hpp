#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunked_transfer.hpp"
#include "connectivity_probe.hpp"
#include "log.hpp"
#include "mesh_config.hpp"
#include "peer_directory.hpp"
#include "peer_discovery.hpp"
#include "transport_adapter.hpp"

class SimulatedMedium;

// Builds the adapters `config` enables, in strategy order (tcp, wifi-direct,
// bluetooth, relay). Radios come from `medium` when simulate_radios is set,
// otherwise they are UnsupportedTransport stand-ins.
std::vector<std::shared_ptr<TransportAdapter>> make_transports(const MeshConfig& config,
                                                               std::shared_ptr<SimulatedMedium> medium,
                                                               std::shared_ptr<Logger> logger);

// Owns node identity, the peer directory and the transports; runs the
// discovery, routing and connectivity loops.
class MeshCoordinator : public MessageSink, public TransferLink {
public:
  explicit MeshCoordinator(std::shared_ptr<Logger> logger = nullptr);
  ~MeshCoordinator() override;

  MeshCoordinator(const MeshCoordinator&) = delete;
  MeshCoordinator& operator=(const MeshCoordinator&) = delete;

  // Injection points, used before start_node(). Without explicit transports
  // start_node() builds them with make_transports().
  void add_transport(std::shared_ptr<TransportAdapter> transport);
  void set_probe(std::shared_ptr<ConnectivityProbe> probe);
  void set_simulated_medium(std::shared_ptr<SimulatedMedium> medium);

  // Throws MeshError(AlreadyRunning), MeshError(Configuration) or the
  // MeshError of a transport that failed to start.
  void start_node(const MeshConfig& config);
  // Sends BYE to every connected peer, then stops the transports and loops.
  void stop_node();
  bool is_node_running() const { return running_.load(); }

  ScanResult scan(const ScanOptions& options);

  // Tries direct TCP, then WiFi Direct when isolated, then relay. Throws the
  // error of the last strategy tried, naming every strategy attempted.
  void connect_to_peer(const std::string& id_or_name);
  bool is_peer_connected(const std::string& peer_id) const;

  Peer find_peer_by_id_or_name(const std::string& query) const;
  std::vector<Peer> get_known_peers() const;
  ConnectionInfo get_connection_info() const;

  // Resolves and connects the peer when needed, then runs the transfer.
  FileTransferInfo send_file_chunked(const std::filesystem::path& path,
                                     const std::string& id_or_name,
                                     const TransferOptions& options);
  FileTransferInfo receive_file_chunked(const std::string& id_or_name,
                                        const std::filesystem::path& dest_dir,
                                        const TransferOptions& options);
  ChunkedTransferEngine& transfers() { return transfers_; }

  // Loop bodies; exposed so they can be driven on demand.
  void run_discovery_cycle();
  void refresh_routes();
  void recheck_connectivity();

  const std::string& node_id() const { return node_id_; }
  const std::string& node_name() const { return node_name_; }
  const MeshConfig& config() const { return config_; }
  std::shared_ptr<TransportAdapter> transport(const std::string& kind) const;
  std::vector<std::shared_ptr<TransportAdapter>> transports() const;

  std::shared_ptr<Logger> logger() const { return logger_; }
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  // MessageSink
  void on_peer_connected(const std::string& transport, const PeerInfo& peer) override;
  void on_peer_message(const std::string& transport,
                       const std::string& peer_id,
                       const nlohmann::json& message) override;
  void on_peer_binary(const std::string& transport,
                      const std::string& peer_id,
                      std::string payload) override;
  void on_peer_disconnected(const std::string& transport, const std::string& peer_id) override;

  // TransferLink
  void send_control(const std::string& peer_id, const nlohmann::json& message) override;
  void send_binary(const std::string& peer_id, std::string payload) override;

private:
  struct AdvertisedRoute {
    std::string destination;
    int hop_count = 1;
    int quality = 0;
  };

  using Loop = void (MeshCoordinator::*)();

  std::shared_ptr<TransportAdapter> connected_transport(const std::string& peer_id) const;
  std::vector<std::shared_ptr<TransportAdapter>> running_transports() const;
  std::vector<std::string> tcp_peer_addresses() const;
  void record_sightings(const ScanResult& result);
  void connect_with(const std::string& kind, const Peer& peer);
  void handle_route_advert(const std::string& peer_id, const nlohmann::json& message);
  void schedule(asio::steady_timer& timer, std::chrono::seconds interval, Loop body, const char* name);
  void wait_for_flush(std::chrono::milliseconds limit);

  std::shared_ptr<Logger> logger_;
  MeshConfig config_;
  std::string node_id_;
  std::string node_name_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};

  mutable std::shared_mutex transports_mutex_;
  std::vector<std::shared_ptr<TransportAdapter>> transports_;
  std::shared_ptr<SimulatedMedium> medium_;

  std::shared_ptr<ConnectivityProbe> probe_;
  mutable std::shared_mutex info_mutex_;
  ConnectionInfo connection_info_;

  PeerDirectory directory_;
  PeerDiscoveryAggregator discovery_;
  ChunkedTransferEngine transfers_;

  std::mutex adverts_mutex_;
  std::unordered_map<std::string, std::vector<AdvertisedRoute>> adverts_;

  // Background loops: one steady_timer each on a small pool.
  std::unique_ptr<asio::thread_pool> loop_pool_;
  std::mutex timer_mutex_;
  std::unique_ptr<asio::steady_timer> discovery_timer_;
  std::unique_ptr<asio::steady_timer> routing_timer_;
  std::unique_ptr<asio::steady_timer> connectivity_timer_;
};
