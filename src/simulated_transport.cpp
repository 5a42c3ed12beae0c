#include "simulated_transport.hpp"

#include <future>
#include <thread>

#include "errors.hpp"

// ---- SimulatedMedium -------------------------------------------------------

void SimulatedMedium::attach(const std::string& radio, SimulatedTransport* transport) {
  std::lock_guard lg(mutex_);
  Entry entry;
  entry.transport = transport;
  entry.identity = transport->identity();
  radios_[radio][entry.identity.node_id] = std::move(entry);
}

void SimulatedMedium::detach(const std::string& radio, const SimulatedTransport* transport) {
  std::lock_guard lg(mutex_);
  auto it = radios_.find(radio);
  if(it == radios_.end()) return;
  for(auto node = it->second.begin(); node != it->second.end(); ++node) {
    if(node->second.transport == transport) {
      it->second.erase(node);
      return;
    }
  }
}

void SimulatedMedium::set_profile(const std::string& radio, const std::string& node_id, NodeProfile profile) {
  std::lock_guard lg(mutex_);
  profiles_[radio][node_id] = profile;
}

void SimulatedMedium::set_scan_latency(const std::string& radio, std::chrono::milliseconds latency) {
  std::lock_guard lg(mutex_);
  scan_latency_[radio] = latency;
}

std::chrono::milliseconds SimulatedMedium::scan_latency(const std::string& radio) const {
  std::lock_guard lg(mutex_);
  auto it = scan_latency_.find(radio);
  return it == scan_latency_.end() ? std::chrono::milliseconds(0) : it->second;
}

SimulatedMedium::NodeProfile SimulatedMedium::profile_locked(const std::string& radio,
                                                             const std::string& node_id) const {
  auto r = profiles_.find(radio);
  if(r == profiles_.end()) return {};
  auto n = r->second.find(node_id);
  return n == r->second.end() ? NodeProfile{} : n->second;
}

std::vector<PeerInfo> SimulatedMedium::visible_from(const std::string& radio,
                                                    const std::string& node_id) const {
  std::lock_guard lg(mutex_);
  std::vector<PeerInfo> out;
  auto it = radios_.find(radio);
  if(it == radios_.end()) return out;
  auto now = std::chrono::system_clock::now();
  for(const auto& kv : it->second) {
    if(kv.first == node_id) continue;
    auto profile = profile_locked(radio, kv.first);
    if(!profile.reachable) continue;
    PeerInfo peer;
    peer.id = kv.second.identity.node_id;
    peer.name = kv.second.identity.node_name;
    peer.address = "sim:" + kv.first;
    peer.protocol = radio;
    peer.signal_strength = profile.signal_strength;
    peer.last_seen = now;
    peer.capabilities = kv.second.identity.capabilities;
    out.push_back(std::move(peer));
  }
  return out;
}

void SimulatedMedium::link(const std::string& radio,
                           const std::string& from_node,
                           const std::string& to_node,
                           asio::local::stream_protocol::socket& dialer_end) {
  std::lock_guard lg(mutex_);
  auto it = radios_.find(radio);
  if(it == radios_.end() || it->second.find(to_node) == it->second.end()) {
    throw MeshError(ErrorCode::Network, to_node + " is not present on " + radio);
  }
  if(!profile_locked(radio, to_node).reachable || !profile_locked(radio, from_node).reachable) {
    throw MeshError(ErrorCode::Network, to_node + " is out of " + radio + " range");
  }
  it->second[to_node].transport->accept_link(dialer_end, from_node);
}

// ---- SimulatedTransport ----------------------------------------------------

SimulatedTransport::SimulatedTransport(std::string radio,
                                       std::shared_ptr<SimulatedMedium> medium,
                                       MessageChannel::Options channel_options,
                                       std::shared_ptr<Logger> logger)
  : TransportAdapter(std::move(radio), channel_options, std::move(logger)),
    medium_(std::move(medium)) {
  if(!medium_) medium_ = std::make_shared<SimulatedMedium>();
}

SimulatedTransport::~SimulatedTransport() {
  stop();
}

void SimulatedTransport::on_start() {
  medium_->attach(kind(), this);
  logger_->info("simulated {} radio up", kind());
}

void SimulatedTransport::on_stop() {
  medium_->detach(kind(), this);
}

std::vector<PeerInfo> SimulatedTransport::discover(std::chrono::milliseconds timeout) {
  if(!is_running()) return {};
  auto result = std::make_shared<std::promise<std::vector<PeerInfo>>>();
  auto scanned = result->get_future();
  // The scan thread owns what it touches so it may outlive this call.
  std::thread([medium = medium_, radio = kind(), self = identity().node_id, result](){
    std::this_thread::sleep_for(medium->scan_latency(radio));
    result->set_value(medium->visible_from(radio, self));
  }).detach();

  if(scanned.wait_for(timeout) != std::future_status::ready) {
    logger_->debug("{} scan still running after {}ms, returning no peers", kind(), timeout.count());
    return {};
  }
  return scanned.get();
}

std::shared_ptr<MessageChannel> SimulatedTransport::connect(const PeerInfo& target,
                                                            std::chrono::milliseconds) {
  if(!is_running()) {
    throw MeshError(ErrorCode::NotRunning, kind() + " transport is not running");
  }
  asio::local::stream_protocol::socket ours(io());
  medium_->link(kind(), identity().node_id, target.id, ours);
  logger_->info("{} link to {} established", kind(), target.id);
  return adopt(ChannelSocket(std::move(ours)), target.id, "sim:" + target.id);
}

void SimulatedTransport::accept_link(asio::local::stream_protocol::socket& dialer_end,
                                     const std::string& from_node) {
  if(!is_running()) {
    throw MeshError(ErrorCode::Network, identity().node_id + " radio is down");
  }
  asio::local::stream_protocol::socket mine(io());
  try {
    asio::local::connect_pair(dialer_end, mine);
  } catch(const std::system_error& e) {
    throw MeshError(ErrorCode::Network, std::string("socket pair: ") + e.what());
  }
  adopt(ChannelSocket(std::move(mine)), "", "sim:" + from_node);
}

// ---- UnsupportedTransport --------------------------------------------------

UnsupportedTransport::UnsupportedTransport(std::string radio, std::shared_ptr<Logger> logger)
  : TransportAdapter(std::move(radio), MessageChannel::Options{}, std::move(logger)) {}

void UnsupportedTransport::on_start() {
  throw MeshError(ErrorCode::TransportUnsupported,
                  kind() + " is not available in this build (enable simulate_radios to emulate it)");
}

std::vector<PeerInfo> UnsupportedTransport::discover(std::chrono::milliseconds) {
  return {};
}

std::shared_ptr<MessageChannel> UnsupportedTransport::connect(const PeerInfo&, std::chrono::milliseconds) {
  throw MeshError(ErrorCode::TransportUnsupported, kind() + " is not available in this build");
}
