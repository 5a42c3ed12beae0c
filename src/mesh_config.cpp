#include "mesh_config.hpp"

#include "errors.hpp"
#include "settings_manager.hpp"

std::vector<std::string> default_relay_servers(){
  return {"relay1.bitshare.net:9100", "relay2.bitshare.net:9100"};
}

MeshConfig MeshConfig::from_settings(const SettingsManager& settings){
  MeshConfig cfg;
  cfg.node_name = settings.get<std::string>("node_name");
  cfg.node_id = settings.get<std::string>("node_id");
  cfg.listen_ip = settings.get<std::string>("listen_ip");
  cfg.listen_port = static_cast<uint16_t>(settings.get<long long>("listen_port"));
  cfg.discovery_port = static_cast<uint16_t>(settings.get<long long>("discovery_port"));
  cfg.discovery_target_port = static_cast<uint16_t>(settings.get<long long>("discovery_target_port"));
  cfg.broadcast_address = settings.get<std::string>("broadcast_address");

  cfg.enable_tcp = settings.get<bool>("enable_tcp");
  cfg.enable_wifi_direct = settings.get<bool>("enable_wifi_direct");
  cfg.enable_bluetooth = settings.get<bool>("enable_bluetooth");
  cfg.enable_relay = settings.get<bool>("enable_relay");
  cfg.relay_servers = settings.get<std::vector<std::string>>("relay_servers");
  if(cfg.enable_relay && cfg.relay_servers.empty()) {
    cfg.relay_servers = default_relay_servers();
  }
  cfg.simulate_radios = settings.get<bool>("simulate_radios");
  cfg.data_dir = settings.get<std::string>("data_dir");

  cfg.scan_timeout = std::chrono::milliseconds(settings.get<long long>("scan_timeout_ms"));
  cfg.discovery_interval = std::chrono::seconds(settings.get<long long>("discovery_interval_s"));
  cfg.routing_interval = std::chrono::seconds(settings.get<long long>("routing_interval_s"));
  cfg.connectivity_interval = std::chrono::seconds(settings.get<long long>("connectivity_interval_s"));
  cfg.peer_ttl = std::chrono::seconds(settings.get<long long>("peer_ttl_s"));
  cfg.isolation_confirmations = static_cast<int>(settings.get<long long>("isolation_confirmations"));

  cfg.idle_timeout = std::chrono::seconds(settings.get<long long>("idle_timeout_s"));
  cfg.max_frame_bytes = static_cast<uint32_t>(settings.get<long long>("max_frame_bytes"));
  cfg.connect_timeout = std::chrono::milliseconds(settings.get<long long>("connect_timeout_ms"));

  cfg.transfer.chunk_size = static_cast<uint64_t>(settings.get<long long>("chunk_size"));
  cfg.transfer.parallelism = static_cast<std::size_t>(settings.get<long long>("parallelism"));
  cfg.transfer.retry_count = static_cast<std::size_t>(settings.get<long long>("retry_count"));
  cfg.transfer.retry_delay = std::chrono::milliseconds(settings.get<long long>("retry_delay_ms"));
  cfg.transfer.verify_checksums = settings.get<bool>("verify_checksums");

  cfg.validate();
  return cfg;
}

void MeshConfig::validate() const {
  auto fail = [](const std::string& message){
    throw MeshError(ErrorCode::Configuration, message);
  };
  if(!enable_tcp && !enable_wifi_direct && !enable_bluetooth && !enable_relay) {
    fail("at least one transport must be enabled");
  }
  if(enable_tcp && listen_port == 65535) {
    fail("listen_port 65535 leaves no room for the discovery reply port");
  }
  if(discovery_port == 0) fail("discovery_port must be non-zero");
  if(transfer.chunk_size == 0) fail("chunk_size must be > 0");
  if(transfer.parallelism == 0) fail("parallelism must be >= 1");
  if(max_frame_bytes < 1024) fail("max_frame_bytes must be >= 1024");
  if(transfer.chunk_size + 1024 > max_frame_bytes) {
    fail("chunk_size " + std::to_string(transfer.chunk_size) +
         " does not fit in max_frame_bytes " + std::to_string(max_frame_bytes));
  }
  if(isolation_confirmations < 1) fail("isolation_confirmations must be >= 1");
  if(scan_timeout.count() <= 0) fail("scan_timeout_ms must be > 0");
  if(connect_timeout.count() <= 0) fail("connect_timeout_ms must be > 0");
  if(enable_relay) {
    for(const auto& server : relay_servers) {
      std::string host;
      uint16_t port = 0;
      if(!split_host_port(server, host, port)) {
        fail("relay server '" + server + "' is not host:port");
      }
    }
  }
}
