#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct ChunkInfo {
  std::size_t index = 0;
  uint64_t size = 0;
  uint64_t offset = 0;
  std::string checksum;   // sha256 hex of [offset, offset + size)
  bool completed = false;
};

enum class TransferStatus { Preparing, Transferring, Receiving, Completed, Failed };

inline const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::Preparing:    return "preparing";
    case TransferStatus::Transferring: return "transferring";
    case TransferStatus::Receiving:    return "receiving";
    case TransferStatus::Completed:    return "completed";
    case TransferStatus::Failed:       return "failed";
  }
  return "unknown";
}

// Manifest plus live progress of one transfer. completed_count never exceeds
// total_chunks.
struct FileTransferInfo {
  std::string file_id;
  std::string file_name;
  std::string file_path;
  uint64_t file_size = 0;
  uint64_t chunk_size = 0;
  std::vector<ChunkInfo> chunks;
  std::size_t total_chunks = 0;
  std::size_t completed_count = 0;
  uint64_t bytes_completed = 0;
  std::chrono::steady_clock::time_point start_time{};
  uint64_t transfer_rate = 0;   // bytes per second
  TransferStatus status = TransferStatus::Preparing;
  std::string error;
};

using TransferProgressCallback = std::function<void(const FileTransferInfo&)>;

struct TransferOptions {
  uint64_t chunk_size = 1024 * 1024;
  std::size_t parallelism = 5;
  std::size_t retry_count = 3;
  std::chrono::milliseconds retry_delay{1000};
  bool verify_checksums = true;
  // How long one chunk send waits for its acknowledgement.
  std::chrono::milliseconds ack_timeout{30000};
  // How long a receive waits for the manifest and then between chunks.
  std::chrono::milliseconds receive_timeout{60000};
  std::chrono::milliseconds progress_interval{500};
  TransferProgressCallback progress_callback;
};
