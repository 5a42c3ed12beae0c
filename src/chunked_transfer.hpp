#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "protocol.hpp"
#include "transfer_types.hpp"

// Outbound path of the transfer engine. Both calls throw MeshError when the
// peer has no open channel.
class TransferLink {
public:
  virtual ~TransferLink() = default;
  virtual void send_control(const std::string& peer_id, const nlohmann::json& message) = 0;
  virtual void send_binary(const std::string& peer_id, std::string payload) = 0;
};

// Moves files as checksummed chunks over DATA_TRANSFER control documents and
// binary chunk frames. Inbound traffic is fed in through handle_control and
// handle_binary, which never block.
class ChunkedTransferEngine {
public:
  using FinishedCallback = std::function<void(const FileTransferInfo&)>;

  explicit ChunkedTransferEngine(TransferLink& link, std::shared_ptr<Logger> logger = nullptr);
  ~ChunkedTransferEngine();

  ChunkedTransferEngine(const ChunkedTransferEngine&) = delete;
  ChunkedTransferEngine& operator=(const ChunkedTransferEngine&) = delete;

  // Blocks until the receiver confirmed the whole file. Throws MeshError
  // (TransferFailed, ChecksumMismatch, Timeout, PeerNotConnected) after the
  // progress callback saw the failed status.
  FileTransferInfo send_file_chunked(const std::filesystem::path& path,
                                     const std::string& peer_id,
                                     const TransferOptions& options);

  // Waits for the next manifest from `peer_id` and receives it into
  // `dest_dir`. Throws MeshError like send_file_chunked.
  FileTransferInfo receive_file_chunked(const std::string& peer_id,
                                        const std::filesystem::path& dest_dir,
                                        const TransferOptions& options);

  // Manifests nobody is waiting for are received into `dest_dir` on a
  // background thread. Without auto receive they are declined.
  void enable_auto_receive(std::filesystem::path dest_dir,
                           TransferOptions options,
                           FinishedCallback on_finished = nullptr);
  void disable_auto_receive();

  void handle_control(const std::string& peer_id, const nlohmann::json& message);
  void handle_binary(const std::string& peer_id, const std::string& payload);
  // Fails every session with `peer_id`.
  void handle_peer_lost(const std::string& peer_id);

  // Aborts all sessions and joins background receivers.
  void shutdown();
  // Accepts new sessions again after shutdown().
  void reopen();

  std::size_t active_sessions() const;

private:
  struct SendSession {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<nlohmann::json> manifest_ack;
    std::unordered_map<std::size_t, nlohmann::json> chunk_acks;
    std::optional<nlohmann::json> complete_ack;
    std::string aborted;
  };

  struct ReceiveEvent {
    enum class Kind { Chunk, Complete, Abort };
    Kind kind = Kind::Chunk;
    ChunkFrame chunk;
    std::string reason;
  };

  struct ReceiveSession {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<nlohmann::json> manifest;
    std::deque<ReceiveEvent> events;
  };

  struct BackgroundReceiver {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  static std::string session_key(const std::string& peer_id, const std::string& file_id);

  FileTransferInfo run_receive(const std::string& peer_id,
                               const std::shared_ptr<ReceiveSession>& session,
                               const std::filesystem::path& dest_dir,
                               const TransferOptions& options);
  void on_manifest(const std::string& peer_id, const nlohmann::json& message);
  void push_event(const std::string& peer_id, const std::string& file_id, ReceiveEvent event);
  void send_abort(const std::string& peer_id, const std::string& file_id, const std::string& reason);
  void report(const TransferOptions& options, const FileTransferInfo& info) const;
  void reap_background_locked();

  TransferLink& link_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<SendSession>> sending_;
  std::unordered_map<std::string, std::shared_ptr<ReceiveSession>> receiving_;
  std::multimap<std::string, std::shared_ptr<ReceiveSession>> waiting_;   // peer -> explicit receiver
  std::optional<std::filesystem::path> auto_dir_;
  TransferOptions auto_options_;
  FinishedCallback auto_finished_;
  std::list<BackgroundReceiver> background_;
  bool shutting_down_ = false;
};
