#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "peer_info.hpp"

class TransportAdapter;

struct ScanOptions {
  std::chrono::milliseconds timeout{30000};
  bool include_cached = true;
};

// Aggregated outcome of one scan. Transport failures are reported here
// rather than thrown; a scan never fails as a whole.
struct ScanResult {
  std::vector<PeerInfo> peers;                  // one entry per ID, strongest signal first seen
  std::vector<PeerInfo> sightings;              // every live report, one per transport and peer
  std::map<std::string, std::string> errors;    // transport -> cause
  std::vector<std::string> pending;             // transports still scanning at the deadline
  std::size_t live_count = 0;

  bool complete() const { return errors.empty() && pending.empty(); }
  // One line naming every failed and unanswered transport, empty when complete.
  std::string error_summary() const;
};

// Every peer any scan has seen, keyed by ID.
class PeerCache {
public:
  void remember(const std::vector<PeerInfo>& peers);
  void forget(const std::string& id);
  std::vector<PeerInfo> snapshot() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, PeerInfo> peers_;
};

class PeerDiscoveryAggregator {
public:
  explicit PeerDiscoveryAggregator(std::shared_ptr<Logger> logger = nullptr);

  // Runs discover() on every transport concurrently and returns no later than
  // options.timeout plus scheduling overhead, whatever the transports do.
  // Scans still running at the deadline are abandoned, not cancelled.
  ScanResult scan(const std::vector<std::shared_ptr<TransportAdapter>>& transports,
                  const ScanOptions& options);

  // Makes scans in progress return now with what has arrived so far.
  void cancel_active();

  PeerCache& cache() { return cache_; }

private:
  struct FanIn;

  std::shared_ptr<Logger> logger_;
  PeerCache cache_;
  std::mutex active_mutex_;
  std::set<std::shared_ptr<FanIn>> active_;
};
