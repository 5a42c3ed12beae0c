#include "peer_discovery.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <thread>

#include "transport_adapter.hpp"

namespace {

struct TransportReply {
  std::vector<PeerInfo> peers;
  std::string error;
  bool done = false;
};

} // namespace

// Collection point shared with the scan threads; outlives the scan() call
// when a transport hangs.
struct PeerDiscoveryAggregator::FanIn {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<TransportReply> replies;
  std::size_t remaining = 0;
  bool cancelled = false;
};

std::string ScanResult::error_summary() const {
  std::string out;
  for(const auto& kv : errors) {
    if(!out.empty()) out += "; ";
    out += kv.first + ": " + kv.second;
  }
  if(!pending.empty()) {
    if(!out.empty()) out += "; ";
    out += "no response before timeout from";
    for(std::size_t i = 0; i < pending.size(); ++i) {
      out += (i == 0 ? " " : ", ") + pending[i];
    }
  }
  return out;
}

void PeerCache::remember(const std::vector<PeerInfo>& peers) {
  std::lock_guard lg(mutex_);
  for(const auto& peer : peers) {
    if(peer.id.empty()) continue;
    peers_[peer.id] = peer;
  }
}

void PeerCache::forget(const std::string& id) {
  std::lock_guard lg(mutex_);
  peers_.erase(id);
}

std::vector<PeerInfo> PeerCache::snapshot() const {
  std::lock_guard lg(mutex_);
  std::vector<PeerInfo> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::size_t PeerCache::size() const {
  std::lock_guard lg(mutex_);
  return peers_.size();
}

PeerDiscoveryAggregator::PeerDiscoveryAggregator(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {}

void PeerDiscoveryAggregator::cancel_active() {
  std::lock_guard lg(active_mutex_);
  for(const auto& fan_in : active_) {
    {
      std::lock_guard flg(fan_in->mutex);
      fan_in->cancelled = true;
    }
    fan_in->cv.notify_all();
  }
}

ScanResult PeerDiscoveryAggregator::scan(const std::vector<std::shared_ptr<TransportAdapter>>& transports,
                                         const ScanOptions& options) {
  auto deadline = std::chrono::steady_clock::now() + options.timeout;
  // Transports that listen for their whole budget must report before the deadline.
  auto listen_budget = options.timeout - std::min<std::chrono::milliseconds>(options.timeout / 10,
                                                                              std::chrono::milliseconds(200));
  auto fan_in = std::make_shared<FanIn>();
  fan_in->replies.resize(transports.size());
  fan_in->remaining = transports.size();
  {
    std::lock_guard lg(active_mutex_);
    active_.insert(fan_in);
  }

  for(std::size_t i = 0; i < transports.size(); ++i) {
    std::thread([fan_in, transport = transports[i], i, timeout = listen_budget](){
      TransportReply reply;
      try {
        reply.peers = transport->discover(timeout);
      } catch(const std::exception& e) {
        reply.error = e.what();
      }
      reply.done = true;
      {
        std::lock_guard lg(fan_in->mutex);
        fan_in->replies[i] = std::move(reply);
        --fan_in->remaining;
      }
      fan_in->cv.notify_all();
    }).detach();
  }

  std::vector<TransportReply> replies;
  {
    std::unique_lock lk(fan_in->mutex);
    fan_in->cv.wait_until(lk, deadline, [&]{ return fan_in->remaining == 0 || fan_in->cancelled; });
    replies = fan_in->replies;
  }
  {
    std::lock_guard lg(active_mutex_);
    active_.erase(fan_in);
  }

  ScanResult result;
  std::unordered_map<std::string, std::size_t> by_id;
  for(std::size_t i = 0; i < replies.size(); ++i) {
    const auto& kind = transports[i]->kind();
    const auto& reply = replies[i];
    if(!reply.done) {
      result.pending.push_back(kind);
      continue;
    }
    if(!reply.error.empty()) {
      result.errors[kind] = reply.error;
      logger_->warn("{} discovery failed: {}", kind, reply.error);
      continue;
    }
    for(const auto& peer : reply.peers) {
      if(peer.id.empty()) continue;
      result.sightings.push_back(peer);
      auto it = by_id.find(peer.id);
      if(it == by_id.end()) {
        by_id[peer.id] = result.peers.size();
        result.peers.push_back(peer);
      } else if(peer.signal_strength > result.peers[it->second].signal_strength) {
        result.peers[it->second] = peer;
      }
    }
  }
  result.live_count = result.peers.size();
  cache_.remember(result.peers);

  if(options.include_cached) {
    for(auto cached : cache_.snapshot()) {
      if(by_id.count(cached.id)) continue;
      cached.signal_strength = 0;
      by_id[cached.id] = result.peers.size();
      result.peers.push_back(std::move(cached));
    }
  }

  if(!result.pending.empty()) {
    logger_->warn("scan timed out after {}ms; {}", options.timeout.count(), result.error_summary());
  }
  logger_->debug("scan found {} live peer(s), {} total", result.live_count, result.peers.size());
  return result;
}
