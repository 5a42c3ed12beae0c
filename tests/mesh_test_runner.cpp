#include "connectivity_probe.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "mesh_config.hpp"
#include "mesh_coordinator.hpp"
#include "net_util.hpp"
#include "protocol.hpp"
#include "relay_server.hpp"
#include "simulated_transport.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

using meshshare::test::TestCase;
using meshshare::test::TestContext;
using meshshare::test::read_file;
using meshshare::test::scratch_dir;
using meshshare::test::throws_code;
using meshshare::test::wait_for_condition;
using meshshare::test::write_random_file;
using namespace std::chrono_literals;

// Fixed answers for the connectivity probe: either every probe target is
// reachable (open network) or only a gateway answers (client isolation).
class StaticNetwork : public NetworkEnvironment {
public:
  explicit StaticNetwork(bool isolated) : isolated_(isolated) {}

  bool tcp_reachable(const std::string& host, uint16_t port, std::chrono::milliseconds) override {
    if(host == "239.255.255.250") return !isolated_;
    return host == "192.168.1.1" && port == 80;
  }
  std::string public_ip(std::chrono::milliseconds) override {
    throw MeshError(ErrorCode::Network, "offline test network");
  }
  std::vector<std::string> local_addresses() override { return {"127.0.0.1"}; }

private:
  bool isolated_;
};

std::shared_ptr<ConnectivityProbe> static_probe(const MeshConfig& config, bool isolated) {
  ConnectivityProbe::Options options;
  options.enable_relay = config.enable_relay;
  options.enable_wifi_direct = config.enable_wifi_direct;
  options.relay_servers = config.relay_servers;
  options.isolation_confirmations = config.isolation_confirmations;
  return std::make_shared<ConnectivityProbe>(options, std::make_shared<StaticNetwork>(isolated));
}

uint16_t test_port(int offset) {
  static const int base = 30000 + static_cast<int>(getpid() % 2000) * 10;
  return static_cast<uint16_t>(base + offset);
}

// Loopback-only node with every background loop parked.
MeshConfig node_config(const std::string& id, const std::filesystem::path& root) {
  MeshConfig config;
  config.node_id = id;
  config.node_name = id + "-node";
  config.listen_ip = "127.0.0.1";
  config.listen_port = 0;
  config.broadcast_address = "127.0.0.1";
  config.enable_tcp = false;
  config.enable_wifi_direct = false;
  config.enable_bluetooth = false;
  config.enable_relay = false;
  config.simulate_radios = true;
  config.data_dir = root / id;
  config.scan_timeout = 500ms;
  config.discovery_interval = std::chrono::seconds(3600);
  config.routing_interval = std::chrono::seconds(3600);
  config.connectivity_interval = std::chrono::seconds(3600);
  config.connect_timeout = 1000ms;
  config.transfer.chunk_size = 8192;
  config.transfer.retry_delay = 10ms;
  config.transfer.ack_timeout = 3s;
  config.transfer.receive_timeout = 5s;
  return config;
}

std::unique_ptr<MeshCoordinator> make_node(TestContext& ctx,
                                           const MeshConfig& config,
                                           bool isolated,
                                           std::shared_ptr<SimulatedMedium> medium = nullptr) {
  auto node = std::make_unique<MeshCoordinator>(std::make_shared<Logger>(config.node_id));
  ctx.logs.attach(*node, config.node_id);
  if(medium) node->set_simulated_medium(std::move(medium));
  node->set_probe(static_probe(config, isolated));
  node->start_node(config);
  return node;
}

bool wait_for_link(MeshCoordinator& a, MeshCoordinator& b) {
  return wait_for_condition([&]{
    return a.is_peer_connected(b.node_id()) && b.is_peer_connected(a.node_id());
  }, 5s);
}

bool received_copy(const MeshConfig& receiver, const std::filesystem::path& source) {
  auto target = receiver.data_dir / "received" / source.filename();
  return wait_for_condition([&]{ return std::filesystem::exists(target); }, 5s) &&
         read_file(target) == read_file(source);
}

bool test_simulated_radios_connect_and_transfer(TestContext& ctx) {
  auto root = scratch_dir("mesh_sim");
  auto medium = std::make_shared<SimulatedMedium>();

  auto alice_config = node_config("alice", root);
  alice_config.enable_wifi_direct = alice_config.enable_bluetooth = true;
  auto bob_config = node_config("bob", root);
  bob_config.enable_wifi_direct = bob_config.enable_bluetooth = true;
  medium->set_profile(kProtocolBluetooth, "alice", SimulatedMedium::NodeProfile{35, true});

  auto alice = make_node(ctx, alice_config, true, medium);
  auto bob = make_node(ctx, bob_config, true, medium);

  ScanOptions options;
  options.timeout = 1s;
  auto result = bob->scan(options);
  bool ok = result.peers.size() == 1 && result.peers[0].id == "alice" &&
            result.peers[0].protocol == kProtocolWifiDirect &&
            result.sightings.size() == 2;

  auto known = bob->find_peer_by_id_or_name("ALICE-NODE");
  ok = ok && known.info.id == "alice" && known.sightings.count(kProtocolBluetooth) == 1;

  ok = ok && bob->get_connection_info().mode == ConnectionMode::Mixed;
  bob->connect_to_peer("alice-node");
  ok = ok && wait_for_link(*alice, *bob);
  ok = ok && alice->find_peer_by_id_or_name("bob").connected_via == kProtocolWifiDirect;

  auto source = root / "holiday.jpg";
  write_random_file(source, 8192 * 3 + 17);
  auto sent = bob->send_file_chunked(source, "alice", bob_config.transfer);
  ok = ok && sent.status == TransferStatus::Completed && received_copy(alice_config, source);

  bob->stop_node();
  alice->stop_node();
  return ok;
}

bool test_tcp_discovery_connect_and_bye(TestContext& ctx) {
  auto root = scratch_dir("mesh_tcp");
  auto alice_config = node_config("alice", root);
  alice_config.enable_tcp = true;
  alice_config.discovery_port = test_port(0);
  alice_config.discovery_target_port = test_port(1);
  auto bob_config = node_config("bob", root);
  bob_config.enable_tcp = true;
  bob_config.discovery_port = test_port(1);
  bob_config.discovery_target_port = test_port(0);

  auto alice = make_node(ctx, alice_config, false);
  auto bob = make_node(ctx, bob_config, false);

  // A datagram with a mistyped port must not take the responder down.
  {
    asio::io_context io;
    asio::ip::udp::socket udp(io, asio::ip::udp::v4());
    std::string junk = "{\"type\":\"DISCOVER\",\"node_id\":7,\"port\":\"9000\"}";
    udp.send_to(asio::buffer(junk),
                asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), test_port(0)));
  }
  std::this_thread::sleep_for(50ms);
  bool ok = alice->is_node_running();

  ScanOptions options;
  options.timeout = 700ms;
  options.include_cached = false;
  auto result = bob->scan(options);
  ok = ok && result.peers.size() == 1 && result.peers[0].id == "alice" &&
       result.peers[0].address.rfind("127.0.0.1:", 0) == 0;
  ok = ok && alice->scan(options).peers.size() == 1;
  if(!ok && ctx.verbose) std::cout << "    tcp scan: " << result.error_summary() << "\n";

  // Overlapping scans share one reply port; both still see alice.
  ScanResult first;
  ScanResult second;
  std::thread overlapping([&]{ first = bob->scan(options); });
  second = bob->scan(options);
  overlapping.join();
  ok = ok && first.peers.size() == 1 && first.peers[0].id == "alice";
  ok = ok && second.peers.size() == 1 && second.peers[0].id == "alice";

  bob->connect_to_peer("alice");
  ok = ok && wait_for_link(*alice, *bob);
  ok = ok && bob->find_peer_by_id_or_name("alice").connected_via == kProtocolTcp;

  auto source = root / "report.pdf";
  write_random_file(source, 8192 * 5);
  auto sent = bob->send_file_chunked(source, "alice-node", bob_config.transfer);
  ok = ok && sent.status == TransferStatus::Completed && received_copy(alice_config, source);

  bob->stop_node();
  ok = ok && ctx.logs.wait_for_substring("peer bob left the mesh", 3s);
  ok = ok && wait_for_condition([&]{
    return alice->get_known_peers().empty() && !alice->is_peer_connected("bob");
  }, 3s);
  ok = ok && throws_code([&]{ alice->find_peer_by_id_or_name("bob"); }, ErrorCode::PeerNotFound);

  // Departed peers are gone from the discovery cache as well.
  ScanOptions cached;
  cached.timeout = 300ms;
  cached.include_cached = true;
  ok = ok && alice->scan(cached).peers.empty();
  alice->stop_node();
  return ok;
}

bool test_connect_tries_strategies_in_order(TestContext& ctx) {
  auto root = scratch_dir("mesh_fallback");
  auto medium = std::make_shared<SimulatedMedium>();

  // Alice is only reachable over bluetooth, which no strategy dials.
  auto alice_config = node_config("alice", root);
  alice_config.enable_bluetooth = true;
  auto bob_config = node_config("bob", root);
  bob_config.enable_tcp = true;
  bob_config.discovery_port = test_port(2);
  bob_config.discovery_target_port = test_port(3);
  bob_config.enable_wifi_direct = bob_config.enable_bluetooth = true;
  bob_config.enable_relay = true;
  bob_config.relay_servers = {"127.0.0.1:1"};

  auto alice = make_node(ctx, alice_config, false, medium);
  auto bob = make_node(ctx, bob_config, true, medium);

  ScanOptions options;
  options.timeout = 700ms;
  bob->scan(options);
  ctx.logs.clear();

  std::string detail;
  bool ok = throws_code([&]{ bob->connect_to_peer("alice"); }, ErrorCode::Network, &detail);
  ok = ok && detail.find("no relay server reachable") != std::string::npos;
  ok = ok && detail.find("(tried tcp, wifi-direct, relay)") != std::string::npos;

  auto lines = ctx.logs.snapshot();
  auto position = [&](const std::string& needle){
    for(std::size_t i = 0; i < lines.size(); ++i) {
      if(lines[i].find(needle) != std::string::npos) return static_cast<long>(i);
    }
    return -1L;
  };
  auto tcp = position("tcp connection to alice failed");
  auto wifi = position("wifi-direct connection to alice failed");
  auto relay = position("relay connection to alice failed");
  ok = ok && tcp >= 0 && wifi > tcp && relay > wifi;
  ok = ok && !bob->is_peer_connected("alice");

  bob->stop_node();
  alice->stop_node();
  return ok;
}

bool test_relay_links_isolated_nodes(TestContext& ctx) {
  auto root = scratch_dir("mesh_relay");
  RelayServer::Options relay_options;
  relay_options.listen_ip = "127.0.0.1";
  relay_options.port = 0;
  auto relay_logger = std::make_shared<Logger>("relay");
  ctx.logs.attach(relay_logger);
  RelayServer relay(relay_options, relay_logger);
  relay.start();
  std::string server = "127.0.0.1:" + std::to_string(relay.port());

  // A mistyped registration is refused without disturbing the server.
  BlockingTcpClient rogue;
  rogue.connect("127.0.0.1", relay.port(), 1s);
  rogue.write_frame(nlohmann::json{{"type", kMsgRelayRegister}, {"node_id", 1}}, 1s);
  auto refusal = rogue.read_frame(1s);
  bool refused = field_string(refusal, "type") == kMsgRelayError &&
                 field_string(refusal, "reason") == "node_id required";
  rogue.close();

  auto alice_config = node_config("alice", root);
  alice_config.enable_relay = true;
  alice_config.relay_servers = {server};
  auto bob_config = node_config("bob", root);
  bob_config.enable_relay = true;
  bob_config.relay_servers = {server};

  auto alice = make_node(ctx, alice_config, true);
  auto bob = make_node(ctx, bob_config, true);
  bool ok = refused && wait_for_condition([&]{ return relay.registered_count() == 2; }, 3s);

  ScanOptions options;
  options.timeout = 2s;
  auto result = bob->scan(options);
  ok = ok && result.peers.size() == 1 && result.peers[0].protocol == kProtocolRelay;

  bob->connect_to_peer("alice");
  ok = ok && wait_for_link(*alice, *bob);
  ok = ok && wait_for_condition([&]{ return relay.active_splices() == 1; }, 2s);

  auto source = root / "archive.tar";
  write_random_file(source, 8192 * 4 + 1);
  auto sent = bob->send_file_chunked(source, "alice", bob_config.transfer);
  ok = ok && sent.status == TransferStatus::Completed && received_copy(alice_config, source);

  bob->stop_node();
  alice->stop_node();
  ok = ok && wait_for_condition([&]{ return relay.registered_count() == 0; }, 3s);
  relay.stop();
  return ok;
}

bool test_malformed_documents_do_not_stop_the_node(TestContext& ctx) {
  auto root = scratch_dir("mesh_malformed");
  auto medium = std::make_shared<SimulatedMedium>();
  auto alice_config = node_config("alice", root);
  alice_config.enable_wifi_direct = true;
  auto bob_config = node_config("bob", root);
  bob_config.enable_wifi_direct = true;
  auto alice = make_node(ctx, alice_config, true, medium);
  auto bob = make_node(ctx, bob_config, true, medium);

  ScanOptions options;
  options.timeout = 1s;
  bob->scan(options);
  bob->connect_to_peer("alice");
  bool ok = wait_for_link(*alice, *bob);

  auto radio = bob->transport(kProtocolWifiDirect);
  const char* documents[] = {
    "{\"type\":\"HELLO\",\"node_id\":5,\"node_name\":[1]}",
    "{\"type\":\"DATA_TRANSFER\",\"op\":7,\"file_id\":{}}",
    "{\"type\":\"DATA_TRANSFER\",\"op\":\"manifest\",\"file_id\":\"f1\",\"file_size\":\"big\"}",
    "{\"type\":\"DATA_TRANSFER\",\"op\":\"chunk_ack\",\"file_id\":\"f2\",\"ok\":\"yes\",\"index\":-1}",
    "{\"type\":\"MESH_ROUTE\",\"origin\":3,\"routes\":[{\"destination\":\"carol\",\"hop_count\":\"x\",\"quality\":\"high\"}]}"
  };
  for(const char* doc : documents) {
    radio->send_json("alice", nlohmann::json::parse(doc));
  }
  radio->send_json("alice", make_ping());

  std::this_thread::sleep_for(200ms);
  ok = ok && alice->is_node_running() && wait_for_link(*alice, *bob);

  // Still fully usable afterwards.
  auto source = root / "after.bin";
  write_random_file(source, 8192 * 2 + 5);
  auto sent = bob->send_file_chunked(source, "alice", bob_config.transfer);
  ok = ok && sent.status == TransferStatus::Completed && received_copy(alice_config, source);

  bob->stop_node();
  alice->stop_node();
  return ok;
}

bool test_routes_learned_from_neighbours(TestContext& ctx) {
  auto root = scratch_dir("mesh_routes");
  auto medium = std::make_shared<SimulatedMedium>();
  std::vector<std::unique_ptr<MeshCoordinator>> nodes;
  std::vector<MeshConfig> configs;
  for(const char* id : {"alice", "bob", "carol"}) {
    auto config = node_config(id, root);
    config.enable_wifi_direct = true;
    configs.push_back(config);
    nodes.push_back(make_node(ctx, config, true, medium));
  }
  auto& alice = *nodes[0];
  auto& bob = *nodes[1];
  auto& carol = *nodes[2];

  ScanOptions options;
  options.timeout = 1s;
  for(auto& node : nodes) node->scan(options);

  // alice - bob - carol, no direct alice - carol link.
  bob.connect_to_peer("alice");
  bob.connect_to_peer("carol");
  bool ok = wait_for_link(alice, bob) && wait_for_link(bob, carol);

  bob.refresh_routes();
  ok = ok && wait_for_condition([&]{
    alice.refresh_routes();
    auto routes = alice.find_peer_by_id_or_name("carol").routes;
    return routes.size() == 1 && routes[0].next_hop == "bob" && routes[0].hop_count == 2;
  }, 3s);

  auto via_bob = alice.find_peer_by_id_or_name("bob").routes;
  auto best = find_best_route(via_bob);
  ok = ok && best && best->hop_count == 1 && best->next_hop == "bob";

  for(auto& node : nodes) node->stop_node();
  return ok;
}

bool test_lifecycle_rules(TestContext& ctx) {
  auto root = scratch_dir("mesh_lifecycle");
  auto medium = std::make_shared<SimulatedMedium>();
  auto config = node_config("alice", root);
  config.enable_wifi_direct = true;
  auto node = make_node(ctx, config, false, medium);

  bool ok = node->is_node_running() && node->transports().size() == 1;
  ok = ok && throws_code([&]{ node->start_node(config); }, ErrorCode::AlreadyRunning);
  auto radio = node->transport(kProtocolWifiDirect);
  ok = ok && throws_code([&]{ radio->start(); }, ErrorCode::AlreadyRunning);
  ok = ok && throws_code([&]{ radio->send_json("nobody", make_ping()); }, ErrorCode::PeerNotConnected);

  node->stop_node();
  node->stop_node();
  ok = ok && !node->is_node_running();
  ok = ok && throws_code([&]{ node->scan(ScanOptions{}); }, ErrorCode::NotRunning);
  ok = ok && throws_code([&]{ node->connect_to_peer("bob"); }, ErrorCode::NotRunning);

  node->start_node(config);
  ok = ok && node->is_node_running() && node->transport(kProtocolWifiDirect)->is_running();
  node->stop_node();

  auto invalid = config;
  invalid.enable_wifi_direct = false;
  MeshCoordinator fresh;
  ok = ok && throws_code([&]{ fresh.start_node(invalid); }, ErrorCode::Configuration);
  return ok && !fresh.is_node_running();
}

bool test_unsupported_radios_only_warn(TestContext& ctx) {
  auto root = scratch_dir("mesh_unsupported");
  auto config = node_config("alice", root);
  config.simulate_radios = false;
  config.enable_bluetooth = true;
  config.enable_tcp = true;
  config.discovery_port = test_port(4);

  auto node = make_node(ctx, config, false);
  bool ok = node->is_node_running() &&
            !node->transport(kProtocolBluetooth)->is_running() &&
            node->transport(kProtocolTcp)->is_running();
  ok = ok && ctx.logs.wait_for_substring("bluetooth unavailable", 1s);
  node->stop_node();

  auto radios_only = config;
  radios_only.enable_tcp = false;
  MeshCoordinator lonely(std::make_shared<Logger>("lonely"));
  lonely.set_probe(static_probe(radios_only, false));
  ok = ok && throws_code([&]{ lonely.start_node(radios_only); }, ErrorCode::Configuration);
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"simulated_radios_connect_and_transfer", test_simulated_radios_connect_and_transfer},
    {"tcp_discovery_connect_and_bye", test_tcp_discovery_connect_and_bye},
    {"connect_tries_strategies_in_order", test_connect_tries_strategies_in_order},
    {"relay_links_isolated_nodes", test_relay_links_isolated_nodes},
    {"malformed_documents_do_not_stop_the_node", test_malformed_documents_do_not_stop_the_node},
    {"routes_learned_from_neighbours", test_routes_learned_from_neighbours},
    {"lifecycle_rules", test_lifecycle_rules},
    {"unsupported_radios_only_warn", test_unsupported_radios_only_warn}
  };
  return meshshare::test::run_tests("mesh", tests, argc, argv);
}
