#include "chunked_transfer.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

#include "chunk_manifest.hpp"
#include "errors.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace {

constexpr const char* kOpManifest = "manifest";
constexpr const char* kOpManifestAck = "manifest_ack";
constexpr const char* kOpChunkAck = "chunk_ack";
constexpr const char* kOpComplete = "complete";
constexpr const char* kOpCompleteAck = "complete_ack";
constexpr const char* kOpAbort = "abort";

uint64_t rate_since(uint64_t bytes, std::chrono::steady_clock::time_point start) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start).count();
  if(elapsed <= 0) return 0;
  return bytes * 1000 / static_cast<uint64_t>(elapsed);
}

class ScopeExit {
public:
  explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
  ~ScopeExit() { if(fn_) fn_(); }
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;
private:
  std::function<void()> fn_;
};

// Calls `tick` every `interval` on its own thread until stopped.
class ProgressMeter {
public:
  ProgressMeter(std::chrono::milliseconds interval, std::function<void()> tick)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(500)),
      tick_(std::move(tick)) {
    if(!tick_) return;
    thread_ = std::thread([this](){
      std::unique_lock lk(mutex_);
      while(!cv_.wait_for(lk, interval_, [this]{ return stop_; })) {
        lk.unlock();
        tick_();
        lk.lock();
      }
    });
  }

  ~ProgressMeter() { stop(); }

  void stop() {
    {
      std::lock_guard lg(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
    if(thread_.joinable()) thread_.join();
  }

private:
  std::chrono::milliseconds interval_;
  std::function<void()> tick_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::thread thread_;
};

} // namespace

ChunkedTransferEngine::ChunkedTransferEngine(TransferLink& link, std::shared_ptr<Logger> logger)
  : link_(link),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")) {}

ChunkedTransferEngine::~ChunkedTransferEngine() {
  shutdown();
}

std::string ChunkedTransferEngine::session_key(const std::string& peer_id, const std::string& file_id) {
  return peer_id + "\n" + file_id;
}

void ChunkedTransferEngine::report(const TransferOptions& options, const FileTransferInfo& info) const {
  if(!options.progress_callback) return;
  try {
    options.progress_callback(info);
  } catch(const std::exception& e) {
    logger_->warn("progress callback failed: {}", e.what());
  }
}

void ChunkedTransferEngine::send_abort(const std::string& peer_id,
                                       const std::string& file_id,
                                       const std::string& reason) {
  auto abort = make_data_transfer(kOpAbort, file_id);
  abort["reason"] = reason;
  try {
    link_.send_control(peer_id, abort);
  } catch(const MeshError& e) {
    logger_->debug("could not tell {} about the abort: {}", peer_id, e.what());
  }
}

FileTransferInfo ChunkedTransferEngine::send_file_chunked(const std::filesystem::path& path,
                                                          const std::string& peer_id,
                                                          const TransferOptions& options) {
  if(options.chunk_size == 0) {
    throw MeshError(ErrorCode::Configuration, "chunk size must be greater than zero");
  }

  FileTransferInfo info;
  info.file_name = path.filename().string();
  info.file_path = path.string();
  info.chunk_size = options.chunk_size;
  info.start_time = std::chrono::steady_clock::now();
  info.status = TransferStatus::Preparing;
  report(options, info);

  try {
    auto manifest = build_manifest(path, options.chunk_size);
    manifest.start_time = info.start_time;
    info = std::move(manifest);
  } catch(const MeshError& e) {
    info.status = TransferStatus::Failed;
    info.error = e.detail();
    report(options, info);
    throw;
  }

  auto session = std::make_shared<SendSession>();
  auto key = session_key(peer_id, info.file_id);
  {
    std::lock_guard lg(mutex_);
    if(shutting_down_) {
      throw MeshError(ErrorCode::NotRunning, "transfer engine is shutting down");
    }
    sending_[key] = session;
  }
  ScopeExit unregister([this, key](){
    std::lock_guard lg(mutex_);
    sending_.erase(key);
  });

  std::mutex info_mutex;
  uint64_t moved_bytes = 0;

  try {
    auto manifest_doc = make_data_transfer(kOpManifest, info.file_id);
    manifest_doc.update(manifest_to_json(info));
    link_.send_control(peer_id, manifest_doc);
    logger_->info("offering {} ({}, {} chunks) to {}",
                  info.file_name, format_bytes(info.file_size), info.total_chunks, peer_id);

    json ack;
    {
      std::unique_lock lk(session->mutex);
      bool answered = session->cv.wait_for(lk, options.ack_timeout, [&]{
        return session->manifest_ack.has_value() || !session->aborted.empty();
      });
      if(!session->aborted.empty()) {
        throw MeshError(ErrorCode::TransferFailed, session->aborted);
      }
      if(!answered) {
        throw MeshError(ErrorCode::Timeout, peer_id + " did not answer the manifest");
      }
      ack = *session->manifest_ack;
    }
    if(!field_bool(ack, "accepted", false)) {
      throw MeshError(ErrorCode::TransferFailed,
                      peer_id + " declined: " + field_string(ack, "error", "no reason given"));
    }
    if(ack.contains("have") && ack["have"].is_array()) {
      for(const auto& entry : ack["have"]) {
        if(!entry.is_number_unsigned()) continue;
        auto index = entry.get<std::size_t>();
        if(index >= info.total_chunks || info.chunks[index].completed) continue;
        info.chunks[index].completed = true;
        ++info.completed_count;
        info.bytes_completed += info.chunks[index].size;
      }
      if(info.completed_count > 0) {
        logger_->info("{} already holds {} of {} chunks", peer_id, info.completed_count, info.total_chunks);
      }
    }

    info.status = TransferStatus::Transferring;
    report(options, info);

    std::deque<std::size_t> queue;
    for(const auto& chunk : info.chunks) {
      if(!chunk.completed) queue.push_back(chunk.index);
    }
    std::optional<MeshError> failure;

    auto fail = [&](ErrorCode code, const std::string& message){
      std::lock_guard lg(info_mutex);
      if(!failure) failure.emplace(code, message);
    };

    auto worker = [&](){
      try {
        std::ifstream in(path, std::ios::binary);
        if(!in) {
          fail(ErrorCode::TransferFailed, "cannot open " + path.string());
          return;
        }
        std::string buffer;
        while(true) {
          std::size_t index = 0;
          {
            std::lock_guard lg(info_mutex);
            if(failure || queue.empty()) return;
            index = queue.front();
            queue.pop_front();
          }
          const auto& chunk = info.chunks[index];
          buffer.resize(static_cast<std::size_t>(chunk.size));
          in.clear();
          in.seekg(static_cast<std::streamoff>(chunk.offset), std::ios::beg);
          in.read(buffer.data(), static_cast<std::streamsize>(chunk.size));
          if(static_cast<uint64_t>(in.gcount()) != chunk.size) {
            fail(ErrorCode::TransferFailed, "short read of chunk " + std::to_string(index));
            return;
          }
          if(options.verify_checksums && sha256_hex(buffer.data(), buffer.size()) != chunk.checksum) {
            fail(ErrorCode::TransferFailed, info.file_name + " changed while it was being sent");
            return;
          }
          auto frame = encode_chunk_frame(info.file_id, static_cast<uint32_t>(index),
                                          buffer.data(), buffer.size());

          bool delivered = false;
          ErrorCode last_code = ErrorCode::TransferFailed;
          std::string last_error;
          for(std::size_t attempt = 0; attempt <= options.retry_count && !delivered; ++attempt) {
            if(attempt > 0) {
              logger_->warn("chunk {} to {} failed ({}), retry {} of {}",
                            index, peer_id, last_error, attempt, options.retry_count);
              std::unique_lock lk(session->mutex);
              if(session->cv.wait_for(lk, options.retry_delay, [&]{ return !session->aborted.empty(); })) {
                last_error = session->aborted;
                break;
              }
            }
            {
              std::lock_guard lg(info_mutex);
              if(failure) return;
            }
            {
              std::lock_guard lg(session->mutex);
              session->chunk_acks.erase(index);
            }
            try {
              link_.send_binary(peer_id, frame);
            } catch(const MeshError& e) {
              last_code = e.code();
              last_error = e.detail();
              continue;
            }

            json chunk_ack;
            {
              std::unique_lock lk(session->mutex);
              session->cv.wait_for(lk, options.ack_timeout, [&]{
                return session->chunk_acks.count(index) > 0 || !session->aborted.empty();
              });
              // An ack that arrived ahead of an abort still counts.
              auto found = session->chunk_acks.find(index);
              if(found == session->chunk_acks.end()) {
                if(!session->aborted.empty()) {
                  last_code = ErrorCode::TransferFailed;
                  last_error = session->aborted;
                  break;
                }
                last_code = ErrorCode::Timeout;
                last_error = "no acknowledgement";
                continue;
              }
              chunk_ack = found->second;
            }
            if(!field_bool(chunk_ack, "ok", false)) {
              last_code = field_bool(chunk_ack, "checksum_mismatch", false)
                ? ErrorCode::ChecksumMismatch : ErrorCode::TransferFailed;
              last_error = field_string(chunk_ack, "error", "rejected by receiver");
              continue;
            }
            if(options.verify_checksums && field_string(chunk_ack, "checksum") != chunk.checksum) {
              last_code = ErrorCode::ChecksumMismatch;
              last_error = "receiver computed a different checksum";
              continue;
            }
            delivered = true;
          }

          if(!delivered) {
            fail(last_code, "chunk " + std::to_string(index) + ": " + last_error);
            return;
          }
          std::lock_guard lg(info_mutex);
          info.chunks[index].completed = true;
          ++info.completed_count;
          info.bytes_completed += chunk.size;
          moved_bytes += chunk.size;
        }
      } catch(const std::exception& e) {
        fail(ErrorCode::TransferFailed, e.what());
      }
    };

    {
      ProgressMeter meter(options.progress_interval,
        options.progress_callback
          ? std::function<void()>([&](){
              FileTransferInfo snapshot;
              {
                std::lock_guard lg(info_mutex);
                info.transfer_rate = rate_since(moved_bytes, info.start_time);
                snapshot = info;
              }
              report(options, snapshot);
            })
          : std::function<void()>());

      std::size_t worker_count = std::min(std::max<std::size_t>(1, options.parallelism), queue.size());
      std::vector<std::thread> workers;
      workers.reserve(worker_count);
      for(std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
      }
      for(auto& thread : workers) {
        if(thread.joinable()) thread.join();
      }
      meter.stop();
    }

    if(failure) throw *failure;

    link_.send_control(peer_id, make_data_transfer(kOpComplete, info.file_id));
    json complete_ack;
    {
      std::unique_lock lk(session->mutex);
      bool answered = session->cv.wait_for(lk, options.ack_timeout, [&]{
        return session->complete_ack.has_value() || !session->aborted.empty();
      });
      if(!session->aborted.empty()) {
        throw MeshError(ErrorCode::TransferFailed, session->aborted);
      }
      if(!answered) {
        throw MeshError(ErrorCode::Timeout, peer_id + " did not confirm completion");
      }
      complete_ack = *session->complete_ack;
    }
    if(!field_bool(complete_ack, "ok", false)) {
      throw MeshError(ErrorCode::TransferFailed,
                      peer_id + " could not finish: " + field_string(complete_ack, "error", "unknown"));
    }

    info.status = TransferStatus::Completed;
    info.transfer_rate = rate_since(moved_bytes, info.start_time);
    report(options, info);
    logger_->info("sent {} to {} ({}/s)", info.file_name, peer_id, format_bytes(info.transfer_rate));
    return info;
  } catch(const MeshError& e) {
    bool peer_aborted = false;
    {
      std::lock_guard lg(session->mutex);
      peer_aborted = !session->aborted.empty();
    }
    if(!peer_aborted) send_abort(peer_id, info.file_id, e.detail());
    info.status = TransferStatus::Failed;
    info.error = e.detail();
    report(options, info);
    logger_->warn("sending {} to {} failed: {}", info.file_name, peer_id, e.what());
    throw;
  }
}

FileTransferInfo ChunkedTransferEngine::receive_file_chunked(const std::string& peer_id,
                                                             const std::filesystem::path& dest_dir,
                                                             const TransferOptions& options) {
  auto session = std::make_shared<ReceiveSession>();
  {
    std::lock_guard lg(mutex_);
    if(shutting_down_) {
      throw MeshError(ErrorCode::NotRunning, "transfer engine is shutting down");
    }
    waiting_.emplace(peer_id, session);
  }

  std::unique_lock lk(session->mutex);
  bool offered = session->cv.wait_for(lk, options.receive_timeout, [&]{
    return session->manifest.has_value() || !session->events.empty();
  });
  bool have_manifest = session->manifest.has_value();
  lk.unlock();

  if(!have_manifest) {
    bool withdrawn = false;
    {
      std::lock_guard lg(mutex_);
      auto range = waiting_.equal_range(peer_id);
      for(auto it = range.first; it != range.second; ++it) {
        if(it->second == session) {
          waiting_.erase(it);
          withdrawn = true;
          break;
        }
      }
    }
    // Not withdrawn means a manifest was claimed for this session meanwhile.
    if(withdrawn) {
      if(offered) {
        throw MeshError(ErrorCode::NotRunning, "transfer engine is shutting down");
      }
      throw MeshError(ErrorCode::Timeout,
                      "no file offered by " + peer_id + " within " +
                      std::to_string(options.receive_timeout.count()) + "ms");
    }
  }
  return run_receive(peer_id, session, dest_dir, options);
}

FileTransferInfo ChunkedTransferEngine::run_receive(const std::string& peer_id,
                                                    const std::shared_ptr<ReceiveSession>& session,
                                                    const std::filesystem::path& dest_dir,
                                                    const TransferOptions& options) {
  json manifest_doc;
  {
    std::lock_guard lg(session->mutex);
    manifest_doc = *session->manifest;
  }
  auto file_id = field_string(manifest_doc, "file_id");
  auto key = session_key(peer_id, file_id);
  ScopeExit unregister([this, key](){
    std::lock_guard lg(mutex_);
    receiving_.erase(key);
  });

  FileTransferInfo info;
  info.file_id = file_id;
  info.start_time = std::chrono::steady_clock::now();
  info.status = TransferStatus::Preparing;

  std::fstream out;
  bool peer_aborted = false;
  uint64_t moved_bytes = 0;

  try {
    auto parsed = manifest_from_json(manifest_doc);
    parsed.start_time = info.start_time;
    info = std::move(parsed);
    info.file_name = safe_file_name(info.file_name);
    report(options, info);

    std::error_code ec;
    std::filesystem::create_directories(dest_dir, ec);
    if(ec) {
      throw MeshError(ErrorCode::TransferFailed, "cannot create " + dest_dir.string() + ": " + ec.message());
    }
    auto final_path = dest_dir / info.file_name;
    auto part_path = final_path;
    part_path += ".part";
    info.file_path = final_path.string();

    json have = json::array();
    bool resumable = std::filesystem::is_regular_file(part_path, ec) &&
                     std::filesystem::file_size(part_path, ec) == info.file_size && !ec;
    if(resumable) {
      for(auto& chunk : info.chunks) {
        try {
          if(sha256_file_range(part_path, chunk.offset, chunk.size) != chunk.checksum) continue;
        } catch(const MeshError& e) {
          logger_->debug("chunk {} of {} not reusable: {}", chunk.index, part_path.string(), e.detail());
          continue;
        }
        chunk.completed = true;
        ++info.completed_count;
        info.bytes_completed += chunk.size;
        have.push_back(chunk.index);
      }
      logger_->info("resuming {}: {} of {} chunks already on disk",
                    info.file_name, info.completed_count, info.total_chunks);
    } else {
      {
        std::ofstream create(part_path, std::ios::binary | std::ios::trunc);
        if(!create) {
          throw MeshError(ErrorCode::TransferFailed, "cannot create " + part_path.string());
        }
      }
      std::filesystem::resize_file(part_path, info.file_size, ec);
      if(ec) {
        throw MeshError(ErrorCode::TransferFailed,
                        "cannot allocate " + format_bytes(info.file_size) + " for " +
                        part_path.string() + ": " + ec.message());
      }
    }
    out.open(part_path, std::ios::in | std::ios::out | std::ios::binary);
    if(!out) {
      throw MeshError(ErrorCode::TransferFailed, "cannot open " + part_path.string());
    }

    auto ack = make_data_transfer(kOpManifestAck, file_id);
    ack["accepted"] = true;
    ack["have"] = have;
    link_.send_control(peer_id, ack);
    logger_->info("receiving {} ({}, {} chunks) from {}",
                  info.file_name, format_bytes(info.file_size), info.total_chunks, peer_id);

    info.status = TransferStatus::Receiving;
    report(options, info);

    std::vector<std::size_t> failures(info.total_chunks, 0);
    auto last_report = std::chrono::steady_clock::now();
    bool finished = false;
    while(!finished) {
      ReceiveEvent event;
      {
        std::unique_lock lk(session->mutex);
        if(!session->cv.wait_for(lk, options.receive_timeout, [&]{ return !session->events.empty(); })) {
          throw MeshError(ErrorCode::Timeout,
                          peer_id + " went silent for " +
                          std::to_string(options.receive_timeout.count()) + "ms");
        }
        event = std::move(session->events.front());
        session->events.pop_front();
      }

      if(event.kind == ReceiveEvent::Kind::Abort) {
        peer_aborted = true;
        throw MeshError(ErrorCode::TransferFailed, "aborted: " + event.reason);
      }

      if(event.kind == ReceiveEvent::Kind::Complete) {
        auto reply = make_data_transfer(kOpCompleteAck, file_id);
        if(info.completed_count != info.total_chunks) {
          auto missing = std::to_string(info.total_chunks - info.completed_count) + " chunk(s) missing";
          reply["ok"] = false;
          reply["error"] = missing;
          link_.send_control(peer_id, reply);
          peer_aborted = true;
          throw MeshError(ErrorCode::TransferFailed, missing);
        }
        out.flush();
        out.close();
        std::filesystem::rename(part_path, final_path, ec);
        if(ec) {
          reply["ok"] = false;
          reply["error"] = "rename failed: " + ec.message();
          link_.send_control(peer_id, reply);
          peer_aborted = true;
          throw MeshError(ErrorCode::TransferFailed, "cannot move " + part_path.string() +
                          " into place: " + ec.message());
        }
        reply["ok"] = true;
        link_.send_control(peer_id, reply);
        finished = true;
        continue;
      }

      const auto& frame = event.chunk;
      auto reply = make_data_transfer(kOpChunkAck, file_id);
      reply["index"] = frame.index;
      if(frame.index >= info.total_chunks || frame.data.size() != info.chunks[frame.index].size) {
        logger_->warn("chunk {} from {} does not fit the manifest", frame.index, peer_id);
        reply["ok"] = false;
        reply["error"] = "chunk does not match the manifest";
        link_.send_control(peer_id, reply);
        continue;
      }
      auto& chunk = info.chunks[frame.index];
      auto checksum = sha256_hex(frame.data.data(), frame.data.size());
      reply["checksum"] = checksum;
      if(options.verify_checksums && checksum != chunk.checksum) {
        auto count = ++failures[frame.index];
        logger_->warn("chunk {} from {} failed verification ({} of {})",
                      frame.index, peer_id, count, options.retry_count + 1);
        reply["ok"] = false;
        reply["checksum_mismatch"] = true;
        reply["error"] = "checksum mismatch";
        link_.send_control(peer_id, reply);
        if(count > options.retry_count) {
          throw MeshError(ErrorCode::ChecksumMismatch,
                          "chunk " + std::to_string(frame.index) + " failed verification " +
                          std::to_string(count) + " times");
        }
        continue;
      }

      out.seekp(static_cast<std::streamoff>(chunk.offset), std::ios::beg);
      out.write(frame.data.data(), static_cast<std::streamsize>(frame.data.size()));
      if(!out) {
        reply["ok"] = false;
        reply["error"] = "write failed";
        link_.send_control(peer_id, reply);
        throw MeshError(ErrorCode::TransferFailed, "write to " + part_path.string() + " failed");
      }
      if(!chunk.completed) {
        chunk.completed = true;
        ++info.completed_count;
        info.bytes_completed += chunk.size;
        moved_bytes += chunk.size;
      }
      reply["ok"] = true;
      link_.send_control(peer_id, reply);

      auto now = std::chrono::steady_clock::now();
      if(now - last_report >= options.progress_interval) {
        info.transfer_rate = rate_since(moved_bytes, info.start_time);
        report(options, info);
        last_report = now;
      }
    }

    info.status = TransferStatus::Completed;
    info.transfer_rate = rate_since(moved_bytes, info.start_time);
    report(options, info);
    logger_->info("received {} from {} into {}", info.file_name, peer_id, info.file_path);
    return info;
  } catch(const MeshError& e) {
    if(out.is_open()) out.close();
    if(!peer_aborted) send_abort(peer_id, file_id, e.detail());
    info.status = TransferStatus::Failed;
    info.error = e.detail();
    report(options, info);
    logger_->warn("receiving from {} failed: {}", peer_id, e.what());
    throw;
  }
}

void ChunkedTransferEngine::enable_auto_receive(std::filesystem::path dest_dir,
                                                TransferOptions options,
                                                FinishedCallback on_finished) {
  std::lock_guard lg(mutex_);
  auto_dir_ = std::move(dest_dir);
  auto_options_ = std::move(options);
  auto_finished_ = std::move(on_finished);
}

void ChunkedTransferEngine::disable_auto_receive() {
  std::lock_guard lg(mutex_);
  auto_dir_.reset();
}

void ChunkedTransferEngine::reap_background_locked() {
  for(auto it = background_.begin(); it != background_.end();) {
    if(it->done->load()) {
      if(it->thread.joinable()) it->thread.join();
      it = background_.erase(it);
    } else {
      ++it;
    }
  }
}

void ChunkedTransferEngine::on_manifest(const std::string& peer_id, const json& message) {
  auto file_id = field_string(message, "file_id");
  if(file_id.empty()) {
    logger_->warn("manifest from {} without file_id", peer_id);
    return;
  }
  auto key = session_key(peer_id, file_id);
  bool accepted = false;
  std::string reason = "not accepting transfers";
  {
    std::lock_guard lg(mutex_);
    if(receiving_.count(key)) {
      logger_->warn("duplicate manifest {} from {}", file_id, peer_id);
      return;
    }
    std::shared_ptr<ReceiveSession> session;
    bool spawn = false;
    if(shutting_down_) {
      reason = "node is shutting down";
    } else if(auto it = waiting_.find(peer_id); it != waiting_.end()) {
      session = it->second;
      waiting_.erase(it);
    } else if(auto_dir_) {
      session = std::make_shared<ReceiveSession>();
      spawn = true;
    }

    if(session) {
      accepted = true;
      receiving_[key] = session;
      {
        std::lock_guard slg(session->mutex);
        session->manifest = message;
      }
      session->cv.notify_all();
    }

    if(spawn) {
      reap_background_locked();
      auto done = std::make_shared<std::atomic<bool>>(false);
      auto dir = *auto_dir_;
      auto options = auto_options_;
      auto finished = auto_finished_;
      BackgroundReceiver receiver;
      receiver.done = done;
      receiver.thread = std::thread([this, peer_id, session, dir, options, finished, done](){
        try {
          auto info = run_receive(peer_id, session, dir, options);
          if(finished) finished(info);
        } catch(const MeshError& e) {
          logger_->debug("background receive from {} ended: {}", peer_id, e.detail());
        } catch(const std::exception& e) {
          logger_->error("background receive from {} crashed: {}", peer_id, e.what());
        }
        done->store(true);
      });
      background_.push_back(std::move(receiver));
    }
  }

  if(!accepted) {
    logger_->info("declined {} from {}: {}", field_string(message, "file_name", file_id), peer_id, reason);
    auto ack = make_data_transfer(kOpManifestAck, file_id);
    ack["accepted"] = false;
    ack["error"] = reason;
    try {
      link_.send_control(peer_id, ack);
    } catch(const MeshError& e) {
      logger_->debug("could not decline {}: {}", file_id, e.detail());
    }
  }
}

void ChunkedTransferEngine::push_event(const std::string& peer_id,
                                       const std::string& file_id,
                                       ReceiveEvent event) {
  std::shared_ptr<ReceiveSession> session;
  {
    std::lock_guard lg(mutex_);
    auto it = receiving_.find(session_key(peer_id, file_id));
    if(it != receiving_.end()) session = it->second;
  }
  if(!session) {
    logger_->debug("dropping data for unknown transfer {} from {}", file_id, peer_id);
    return;
  }
  {
    std::lock_guard lg(session->mutex);
    session->events.push_back(std::move(event));
  }
  session->cv.notify_all();
}

void ChunkedTransferEngine::handle_control(const std::string& peer_id, const json& message) {
  auto op = field_string(message, "op");
  auto file_id = field_string(message, "file_id");

  if(op == kOpManifest) {
    on_manifest(peer_id, message);
    return;
  }

  if(op == kOpManifestAck || op == kOpChunkAck || op == kOpCompleteAck) {
    std::shared_ptr<SendSession> session;
    {
      std::lock_guard lg(mutex_);
      auto it = sending_.find(session_key(peer_id, file_id));
      if(it != sending_.end()) session = it->second;
    }
    if(!session) {
      logger_->debug("{} for unknown transfer {} from {}", op, file_id, peer_id);
      return;
    }
    {
      std::lock_guard lg(session->mutex);
      if(op == kOpManifestAck) {
        session->manifest_ack = message;
      } else if(op == kOpCompleteAck) {
        session->complete_ack = message;
      } else {
        if(!message.contains("index") || !message["index"].is_number_unsigned()) return;
        session->chunk_acks[message["index"].get<std::size_t>()] = message;
      }
    }
    session->cv.notify_all();
    return;
  }

  if(op == kOpComplete) {
    ReceiveEvent event;
    event.kind = ReceiveEvent::Kind::Complete;
    push_event(peer_id, file_id, std::move(event));
    return;
  }

  if(op == kOpAbort) {
    auto reason = field_string(message, "reason", "aborted by peer");
    std::shared_ptr<SendSession> sending;
    bool receiving = false;
    {
      std::lock_guard lg(mutex_);
      auto key = session_key(peer_id, file_id);
      auto it = sending_.find(key);
      if(it != sending_.end()) sending = it->second;
      receiving = receiving_.count(key) > 0;
    }
    if(sending) {
      {
        std::lock_guard lg(sending->mutex);
        sending->aborted = peer_id + " aborted: " + reason;
      }
      sending->cv.notify_all();
    }
    if(receiving) {
      ReceiveEvent event;
      event.kind = ReceiveEvent::Kind::Abort;
      event.reason = reason;
      push_event(peer_id, file_id, std::move(event));
    }
    return;
  }

  logger_->debug("ignoring DATA_TRANSFER op '{}' from {}", op, peer_id);
}

void ChunkedTransferEngine::handle_binary(const std::string& peer_id, const std::string& payload) {
  ChunkFrame frame;
  if(!decode_chunk_frame(payload, frame)) {
    logger_->debug("ignoring {} byte binary payload from {}", payload.size(), peer_id);
    return;
  }
  auto file_id = frame.file_id;
  ReceiveEvent event;
  event.kind = ReceiveEvent::Kind::Chunk;
  event.chunk = std::move(frame);
  push_event(peer_id, file_id, std::move(event));
}

void ChunkedTransferEngine::handle_peer_lost(const std::string& peer_id) {
  auto prefix = peer_id + "\n";
  std::lock_guard lg(mutex_);
  for(auto& kv : sending_) {
    if(kv.first.compare(0, prefix.size(), prefix) != 0) continue;
    {
      std::lock_guard slg(kv.second->mutex);
      kv.second->aborted = peer_id + " disconnected";
    }
    kv.second->cv.notify_all();
  }
  for(auto& kv : receiving_) {
    if(kv.first.compare(0, prefix.size(), prefix) != 0) continue;
    {
      std::lock_guard slg(kv.second->mutex);
      ReceiveEvent event;
      event.kind = ReceiveEvent::Kind::Abort;
      event.reason = peer_id + " disconnected";
      kv.second->events.push_back(std::move(event));
    }
    kv.second->cv.notify_all();
  }
}

void ChunkedTransferEngine::shutdown() {
  std::list<BackgroundReceiver> background;
  {
    std::lock_guard lg(mutex_);
    shutting_down_ = true;
    auto_dir_.reset();
    for(auto& kv : sending_) {
      {
        std::lock_guard slg(kv.second->mutex);
        kv.second->aborted = "node shutting down";
      }
      kv.second->cv.notify_all();
    }
    auto cancel = [](const std::shared_ptr<ReceiveSession>& session){
      {
        std::lock_guard slg(session->mutex);
        ReceiveEvent event;
        event.kind = ReceiveEvent::Kind::Abort;
        event.reason = "node shutting down";
        session->events.push_back(std::move(event));
      }
      session->cv.notify_all();
    };
    for(auto& kv : receiving_) cancel(kv.second);
    for(auto& kv : waiting_) cancel(kv.second);
    background.swap(background_);
  }
  for(auto& receiver : background) {
    if(receiver.thread.joinable()) receiver.thread.join();
  }
}

std::size_t ChunkedTransferEngine::active_sessions() const {
  std::lock_guard lg(mutex_);
  return sending_.size() + receiving_.size();
}

void ChunkedTransferEngine::reopen() {
  std::lock_guard lg(mutex_);
  shutting_down_ = false;
}
