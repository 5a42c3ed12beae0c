#include "message_channel.hpp"
#include "net_util.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using meshshare::test::TestCase;
using meshshare::test::TestContext;
using meshshare::test::throws_code;
using meshshare::test::wait_for_condition;
using namespace std::chrono_literals;

class RecordingHandler : public ChannelHandler {
public:
  void on_hello(const std::shared_ptr<MessageChannel>&, const nlohmann::json& hello) override {
    std::lock_guard lg(mutex_);
    hellos.push_back(hello);
  }
  void on_control(const std::shared_ptr<MessageChannel>&, const nlohmann::json& message) override {
    // Strict typed read, as a careless consumer would do it.
    if(strict && message.contains("op")) message.at("op").get<std::string>();
    std::lock_guard lg(mutex_);
    controls.push_back(message);
  }
  void on_binary(const std::shared_ptr<MessageChannel>&, std::string payload) override {
    std::lock_guard lg(mutex_);
    binaries.push_back(std::move(payload));
  }
  void on_closed(const std::shared_ptr<MessageChannel>&, const std::string& why) override {
    std::lock_guard lg(mutex_);
    closed = true;
    reason = why;
  }

  template<typename Fn>
  auto with(Fn fn) {
    std::lock_guard lg(mutex_);
    return fn(*this);
  }

  std::vector<nlohmann::json> hellos;
  std::vector<nlohmann::json> controls;
  std::vector<std::string> binaries;
  bool closed = false;
  std::string reason;
  bool strict = false;

private:
  std::mutex mutex_;
};

// A channel on one end of a local socket pair; the test drives the raw end.
struct ChannelFixture {
  explicit ChannelFixture(MessageChannel::Options options = {})
    : work(asio::make_work_guard(io)), raw(io) {
    asio::local::stream_protocol::socket mine(io);
    asio::local::connect_pair(mine, raw);
    channel = MessageChannel::create(ChannelSocket(std::move(mine)), &handler, options,
                                     std::make_shared<Logger>("channel-test"));
    thread = std::thread([this]{ io.run(); });
  }

  ~ChannelFixture() {
    channel->close("fixture done");
    wait_for_condition([this]{ return handler.with([](RecordingHandler& h){ return h.closed; }); }, 1s);
    std::this_thread::sleep_for(20ms);
    work.reset();
    io.stop();
    if(thread.joinable()) thread.join();
  }

  void write_raw(const std::string& bytes) {
    asio::write(raw, asio::buffer(bytes));
  }

  void write_length(int32_t length) {
    auto value = static_cast<uint32_t>(length);
    std::string header(4, '\0');
    header[0] = static_cast<char>((value >> 24) & 0xff);
    header[1] = static_cast<char>((value >> 16) & 0xff);
    header[2] = static_cast<char>((value >> 8) & 0xff);
    header[3] = static_cast<char>(value & 0xff);
    write_raw(header);
  }

  // Reads one frame written by the channel.
  std::string read_frame() {
    std::array<unsigned char, kFrameHeaderBytes> header{};
    asio::read(raw, asio::buffer(header));
    std::string body(static_cast<std::size_t>(decode_frame_length(header.data())), '\0');
    asio::read(raw, asio::buffer(body));
    return body;
  }

  asio::io_context io;
  asio::executor_work_guard<asio::io_context::executor_type> work;
  asio::local::stream_protocol::socket raw;
  RecordingHandler handler;
  std::shared_ptr<MessageChannel> channel;
  std::thread thread;
};

bool test_hello_first_then_ping_pong(TestContext&) {
  ChannelFixture f;
  f.channel->start(make_hello("node-a", "alpha", "tcp", {"chunked-transfer"}));

  auto hello = nlohmann::json::parse(f.read_frame());
  bool ok = hello["type"] == kMsgHello && hello["node_id"] == "node-a";

  f.write_raw(encode_frame(make_ping().dump()));
  auto pong = nlohmann::json::parse(f.read_frame());
  ok = ok && pong["type"] == kMsgPong;

  f.write_raw(encode_frame(make_hello("node-b", "beta", "tcp", {}).dump()));
  ok = ok && wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.hellos.size() == 1; });
  }, 2s);
  ok = ok && f.channel->peer_id() == "node-b";
  return ok;
}

bool test_control_and_binary_dispatch(TestContext&) {
  ChannelFixture f;
  f.channel->start();
  f.write_raw(encode_frame(make_data_transfer("manifest", "abc").dump()));
  f.write_raw(encode_frame(std::string("\xc4\x01payload", 9)));
  f.write_raw(encode_frame("{not json"));
  f.write_raw(encode_frame("{\"type\":\"SOMETHING_NEW\"}"));

  bool ok = wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){
      return h.controls.size() == 1 && h.binaries.size() == 2;
    });
  }, 2s);
  ok = ok && f.handler.with([](RecordingHandler& h){
    return h.controls[0]["type"] == kMsgDataTransfer &&
           h.binaries[1] == "{not json" && !h.closed;
  });
  return ok;
}

bool test_zero_and_negative_lengths_are_skipped(TestContext&) {
  ChannelFixture f;
  f.channel->start();
  f.write_length(0);
  f.write_length(-5);
  f.write_raw(encode_frame(make_bye("node-b").dump()));

  bool ok = wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.controls.size() == 1; });
  }, 2s);
  return ok && f.channel->frames_skipped() == 2 && f.channel->is_open();
}

bool test_malformed_documents_keep_channel_open(TestContext&) {
  ChannelFixture f;
  f.handler.strict = true;
  f.channel->start();
  f.write_raw(encode_frame("{\"type\":\"HELLO\",\"node_id\":5}"));
  f.write_raw(encode_frame("{\"type\":\"DATA_TRANSFER\",\"op\":7}"));
  f.write_raw(encode_frame("{\"type\":\"MESH_ROUTE\",\"routes\":[{\"hop_count\":\"x\"}]}"));
  f.write_raw(encode_frame(make_data_transfer("manifest", "abc").dump()));
  f.write_raw(encode_frame(make_ping().dump()));

  auto pong = nlohmann::json::parse(f.read_frame());
  bool ok = pong["type"] == kMsgPong;
  ok = ok && wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.controls.size() == 2; });
  }, 2s);
  ok = ok && f.handler.with([](RecordingHandler& h){
    return h.hellos.size() == 1 && h.controls[0]["type"] == kMsgMeshRoute &&
           h.controls[1]["op"] == "manifest" && !h.closed;
  });
  return ok && f.channel->peer_id().empty() && f.channel->frames_rejected() == 1 &&
         f.channel->is_open();
}

bool test_oversized_frame_closes_channel(TestContext&) {
  MessageChannel::Options options;
  options.max_frame_bytes = 1024;
  ChannelFixture f(options);
  f.channel->start();

  // Exactly at the limit is fine.
  f.write_raw(encode_frame(std::string(1024, 'x')));
  bool ok = wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.binaries.size() == 1; });
  }, 2s);

  f.write_length(1025);
  ok = ok && wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.closed; });
  }, 2s);
  ok = ok && f.handler.with([](RecordingHandler& h){
    return h.reason.find("protocol violation") != std::string::npos;
  });
  return ok && !f.channel->is_open();
}

bool test_frames_keep_call_order(TestContext&) {
  ChannelFixture f;
  f.channel->start();
  std::vector<std::string> batch;
  for(int i = 0; i < 50; ++i) batch.push_back("frame-" + std::to_string(i));
  f.channel->send_frames(batch);
  for(int i = 0; i < 50; ++i) {
    if(f.read_frame() != "frame-" + std::to_string(i)) return false;
  }
  return wait_for_condition([&]{ return f.channel->queued_frames() == 0; }, 2s);
}

bool test_idle_timeout_closes(TestContext&) {
  MessageChannel::Options options;
  options.idle_timeout = 200ms;
  ChannelFixture f(options);
  f.channel->start();
  bool ok = wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.closed; });
  }, 3s);
  return ok && f.handler.with([](RecordingHandler& h){ return h.reason == "idle timeout"; });
}

bool test_peer_close_is_reported_once(TestContext&) {
  ChannelFixture f;
  f.channel->start();
  std::error_code ec;
  f.raw.close(ec);
  bool ok = wait_for_condition([&]{
    return f.handler.with([](RecordingHandler& h){ return h.closed; });
  }, 2s);
  f.channel->close("again");
  std::this_thread::sleep_for(50ms);
  return ok && f.handler.with([](RecordingHandler& h){ return h.reason == "peer closed"; });
}

bool test_blocking_client_connects_by_address_and_name(TestContext&) {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();

  BlockingTcpClient by_address;
  by_address.connect("127.0.0.1", port, 2s);
  bool ok = by_address.is_open();

  BlockingTcpClient by_name;
  by_name.connect("localhost", port, 2s);
  ok = ok && by_name.is_open();

  asio::ip::tcp::acceptor closed(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto closed_port = closed.local_endpoint().port();
  closed.close();

  auto started = std::chrono::steady_clock::now();
  BlockingTcpClient refused;
  ok = ok && throws_code([&]{ refused.connect("127.0.0.1", closed_port, 3s); }, ErrorCode::Network);
  return ok && std::chrono::steady_clock::now() - started < 2s;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"hello_first_then_ping_pong", test_hello_first_then_ping_pong},
    {"control_and_binary_dispatch", test_control_and_binary_dispatch},
    {"zero_and_negative_lengths_are_skipped", test_zero_and_negative_lengths_are_skipped},
    {"malformed_documents_keep_channel_open", test_malformed_documents_keep_channel_open},
    {"oversized_frame_closes_channel", test_oversized_frame_closes_channel},
    {"frames_keep_call_order", test_frames_keep_call_order},
    {"idle_timeout_closes", test_idle_timeout_closes},
    {"peer_close_is_reported_once", test_peer_close_is_reported_once},
    {"blocking_client_connects_by_address_and_name", test_blocking_client_connects_by_address_and_name}
  };
  return meshshare::test::run_tests("channel", tests, argc, argv);
}
