#include "chunk_manifest.hpp"
#include "chunked_transfer.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <fstream>
#include <future>
#include <mutex>
#include <string>
#include <thread>
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

// One direction of an in-process link. Deliveries run in order on a private
// thread, like frames arriving on a channel.
class LoopbackLink : public TransferLink {
public:
  explicit LoopbackLink(std::string self_id)
    : self_id_(std::move(self_id)), work_(asio::make_work_guard(io_)) {
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~LoopbackLink() override {
    stop();
  }

  // Drops undelivered traffic; nothing reaches the remote engine afterwards.
  void stop() {
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  void attach(ChunkedTransferEngine* remote) { remote_ = remote; }
  void set_connected(bool connected) { connected_ = connected; }

  // Applied to every chunk payload before delivery; the argument counts the
  // chunks delivered so far.
  void set_binary_filter(std::function<void(std::size_t, std::string&)> filter) {
    std::lock_guard lg(mutex_);
    filter_ = std::move(filter);
  }

  void send_control(const std::string&, const nlohmann::json& message) override {
    if(!connected_) throw MeshError(ErrorCode::PeerNotConnected, "link down");
    std::lock_guard lg(mutex_);
    controls_.push_back(message);
    asio::post(io_, [this, message]{ if(remote_) remote_->handle_control(self_id_, message); });
  }

  void send_binary(const std::string&, std::string payload) override {
    if(!connected_) throw MeshError(ErrorCode::PeerNotConnected, "link down");
    {
      std::lock_guard lg(mutex_);
      if(filter_) filter_(binaries_, payload);
      ++binaries_;
    }
    asio::post(io_, [this, payload = std::move(payload)]{
      if(remote_) remote_->handle_binary(self_id_, payload);
    });
  }

  std::size_t binaries_sent() const {
    std::lock_guard lg(mutex_);
    return binaries_;
  }

  std::size_t count_op(const std::string& op) const {
    std::lock_guard lg(mutex_);
    std::size_t n = 0;
    for(const auto& message : controls_) {
      if(message.value("op", std::string()) == op) ++n;
    }
    return n;
  }

private:
  std::string self_id_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread thread_;
  ChunkedTransferEngine* remote_ = nullptr;
  std::atomic<bool> connected_{true};
  mutable std::mutex mutex_;
  std::function<void(std::size_t, std::string&)> filter_;
  std::size_t binaries_ = 0;
  std::vector<nlohmann::json> controls_;
};

// Sender "alice" and receiver "bob" wired back to back.
struct TransferPair {
  TransferPair()
    : to_bob("alice"), to_alice("bob"),
      alice(to_bob, std::make_shared<Logger>("alice")),
      bob(to_alice, std::make_shared<Logger>("bob")) {
    to_bob.attach(&bob);
    to_alice.attach(&alice);
  }

  ~TransferPair() {
    alice.shutdown();
    bob.shutdown();
    to_bob.stop();
    to_alice.stop();
  }

  LoopbackLink to_bob;
  LoopbackLink to_alice;
  ChunkedTransferEngine alice;
  ChunkedTransferEngine bob;
};

TransferOptions fast_options() {
  TransferOptions options;
  options.chunk_size = 4096;
  options.parallelism = 3;
  options.retry_count = 2;
  options.retry_delay = 10ms;
  options.ack_timeout = 2s;
  options.receive_timeout = 3s;
  options.progress_interval = 20ms;
  return options;
}

bool test_explicit_receive_end_to_end(TestContext& ctx) {
  auto dir = scratch_dir("transfer_e2e");
  auto source = dir / "photo.raw";
  write_random_file(source, 4096 * 10 + 123);

  TransferPair pair;
  auto options = fast_options();
  std::mutex progress_mutex;
  std::vector<TransferStatus> statuses;
  auto sender_options = options;
  sender_options.progress_callback = [&](const FileTransferInfo& info){
    std::lock_guard lg(progress_mutex);
    statuses.push_back(info.status);
  };

  auto receiving = std::async(std::launch::async, [&]{
    return pair.bob.receive_file_chunked("alice", dir / "inbox", options);
  });
  std::this_thread::sleep_for(50ms);
  auto sent = pair.alice.send_file_chunked(source, "bob", sender_options);
  auto received = receiving.get();

  bool ok = sent.status == TransferStatus::Completed &&
            received.status == TransferStatus::Completed &&
            sent.total_chunks == 11 && sent.completed_count == 11 &&
            received.file_name == "photo.raw" &&
            read_file(dir / "inbox" / "photo.raw") == read_file(source) &&
            !std::filesystem::exists(dir / "inbox" / "photo.raw.part");
  {
    std::lock_guard lg(progress_mutex);
    ok = ok && !statuses.empty() &&
         statuses.front() == TransferStatus::Preparing &&
         statuses.back() == TransferStatus::Completed;
  }
  if(!ok && ctx.verbose) std::cout << "    e2e transfer mismatch\n";
  return ok && pair.alice.active_sessions() == 0 && pair.bob.active_sessions() == 0;
}

bool test_auto_receive_and_decline(TestContext&) {
  auto dir = scratch_dir("transfer_auto");
  auto source = dir / "notes.txt";
  write_random_file(source, 1000);

  TransferPair pair;
  auto options = fast_options();

  // Nobody waiting and no auto receive: the offer is declined.
  std::string detail;
  bool ok = throws_code([&]{ pair.alice.send_file_chunked(source, "bob", options); },
                        ErrorCode::TransferFailed, &detail);
  ok = ok && detail.find("declined") != std::string::npos;

  std::promise<FileTransferInfo> finished;
  pair.bob.enable_auto_receive(dir / "auto", options, [&](const FileTransferInfo& info){
    finished.set_value(info);
  });
  auto sent = pair.alice.send_file_chunked(source, "bob", options);
  auto done = finished.get_future();
  ok = ok && done.wait_for(3s) == std::future_status::ready;
  ok = ok && sent.status == TransferStatus::Completed;
  return ok && read_file(dir / "auto" / "notes.txt") == read_file(source);
}

bool test_empty_file_transfers(TestContext&) {
  auto dir = scratch_dir("transfer_empty");
  auto source = dir / "empty.dat";
  write_random_file(source, 0);

  TransferPair pair;
  auto options = fast_options();
  pair.bob.enable_auto_receive(dir / "inbox", options);
  auto sent = pair.alice.send_file_chunked(source, "bob", options);
  bool ok = sent.status == TransferStatus::Completed && sent.total_chunks == 0;
  return ok && wait_for_condition([&]{
    return std::filesystem::exists(dir / "inbox" / "empty.dat");
  }, 2s) && std::filesystem::file_size(dir / "inbox" / "empty.dat") == 0;
}

bool test_resume_skips_chunks_on_disk(TestContext&) {
  auto dir = scratch_dir("transfer_resume");
  auto source = dir / "movie.bin";
  write_random_file(source, 4096 * 8);
  auto content = read_file(source);

  // A previous attempt left the first five chunks in place.
  std::filesystem::create_directories(dir / "inbox");
  {
    std::string partial = content.substr(0, 4096 * 5);
    partial.resize(content.size(), '\0');
    std::ofstream out(dir / "inbox" / "movie.bin.part", std::ios::binary);
    out.write(partial.data(), static_cast<std::streamsize>(partial.size()));
  }

  TransferPair pair;
  auto options = fast_options();
  pair.bob.enable_auto_receive(dir / "inbox", options);
  auto sent = pair.alice.send_file_chunked(source, "bob", options);

  bool ok = sent.status == TransferStatus::Completed &&
            pair.to_bob.binaries_sent() == 3;
  return ok && wait_for_condition([&]{
    return std::filesystem::exists(dir / "inbox" / "movie.bin");
  }, 2s) && read_file(dir / "inbox" / "movie.bin") == content;
}

bool test_corrupted_chunk_is_resent(TestContext&) {
  auto dir = scratch_dir("transfer_retry");
  auto source = dir / "data.bin";
  write_random_file(source, 4096 * 4);

  TransferPair pair;
  auto options = fast_options();
  options.parallelism = 1;
  // The second frame put on the wire arrives with a flipped byte.
  pair.to_bob.set_binary_filter([](std::size_t sent, std::string& payload){
    if(sent == 1) payload.back() = static_cast<char>(payload.back() ^ 0x5a);
  });
  pair.bob.enable_auto_receive(dir / "inbox", options);
  auto sent = pair.alice.send_file_chunked(source, "bob", options);

  bool ok = sent.status == TransferStatus::Completed && pair.to_bob.binaries_sent() == 5;
  return ok && wait_for_condition([&]{
    return std::filesystem::exists(dir / "inbox" / "data.bin");
  }, 2s) && read_file(dir / "inbox" / "data.bin") == read_file(source);
}

bool test_persistent_corruption_fails_transfer(TestContext&) {
  auto dir = scratch_dir("transfer_corrupt");
  auto source = dir / "data.bin";
  write_random_file(source, 4096 * 2);

  TransferPair pair;
  auto options = fast_options();
  options.parallelism = 1;
  options.retry_count = 1;
  pair.to_bob.set_binary_filter([](std::size_t, std::string& payload){
    payload.back() = static_cast<char>(payload.back() ^ 0x01);
  });

  std::atomic<bool> failed_seen{false};
  options.progress_callback = [&](const FileTransferInfo& info){
    if(info.status == TransferStatus::Failed) failed_seen = true;
  };
  auto receiver_options = fast_options();
  receiver_options.retry_count = 1;
  pair.bob.enable_auto_receive(dir / "inbox", receiver_options);

  bool ok = throws_code([&]{ pair.alice.send_file_chunked(source, "bob", options); },
                        ErrorCode::ChecksumMismatch);
  ok = ok && failed_seen.load() && pair.to_bob.binaries_sent() == 2;
  ok = ok && wait_for_condition([&]{ return pair.bob.active_sessions() == 0; }, 2s);
  return ok && !std::filesystem::exists(dir / "inbox" / "data.bin");
}

bool test_receive_times_out_without_offer(TestContext&) {
  TransferPair pair;
  auto options = fast_options();
  options.receive_timeout = 200ms;
  auto started = std::chrono::steady_clock::now();
  bool ok = throws_code([&]{
    pair.bob.receive_file_chunked("alice", scratch_dir("transfer_timeout"), options);
  }, ErrorCode::Timeout);
  return ok && std::chrono::steady_clock::now() - started < 2s;
}

bool test_peer_loss_fails_both_sides(TestContext&) {
  auto dir = scratch_dir("transfer_lost");
  auto source = dir / "big.bin";
  write_random_file(source, 4096 * 40);

  TransferPair pair;
  auto options = fast_options();
  options.parallelism = 1;
  // Chunks from the fifth on vanish, so the sender stalls on its ack.
  pair.to_bob.set_binary_filter([](std::size_t sent, std::string& payload){
    if(sent >= 4) payload.clear();
  });
  pair.bob.enable_auto_receive(dir / "inbox", options);

  auto sending = std::async(std::launch::async, [&]{
    return pair.alice.send_file_chunked(source, "bob", options);
  });
  bool ok = wait_for_condition([&]{ return pair.to_bob.binaries_sent() >= 5; }, 3s);
  pair.to_bob.set_connected(false);
  pair.alice.handle_peer_lost("bob");
  pair.bob.handle_peer_lost("alice");

  std::string detail;
  ok = ok && throws_code([&]{ sending.get(); }, ErrorCode::TransferFailed, &detail);
  ok = ok && detail.find("disconnected") != std::string::npos;
  ok = ok && wait_for_condition([&]{ return pair.bob.active_sessions() == 0; }, 2s);
  // The partial file stays behind for a later resume.
  return ok && std::filesystem::exists(dir / "inbox" / "big.bin.part");
}

bool test_missing_source_reports_failure(TestContext&) {
  TransferPair pair;
  auto options = fast_options();
  std::atomic<int> failures{0};
  options.progress_callback = [&](const FileTransferInfo& info){
    if(info.status == TransferStatus::Failed) ++failures;
  };
  bool ok = throws_code([&]{
    pair.alice.send_file_chunked(scratch_dir("transfer_missing") / "nope.bin", "bob", options);
  }, ErrorCode::TransferFailed);
  return ok && failures.load() == 1 && pair.to_bob.count_op("manifest") == 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"explicit_receive_end_to_end", test_explicit_receive_end_to_end},
    {"auto_receive_and_decline", test_auto_receive_and_decline},
    {"empty_file_transfers", test_empty_file_transfers},
    {"resume_skips_chunks_on_disk", test_resume_skips_chunks_on_disk},
    {"corrupted_chunk_is_resent", test_corrupted_chunk_is_resent},
    {"persistent_corruption_fails_transfer", test_persistent_corruption_fails_transfer},
    {"receive_times_out_without_offer", test_receive_times_out_without_offer},
    {"peer_loss_fails_both_sides", test_peer_loss_fails_both_sides},
    {"missing_source_reports_failure", test_missing_source_reports_failure}
  };
  return meshshare::test::run_tests("transfer", tests, argc, argv);
}
