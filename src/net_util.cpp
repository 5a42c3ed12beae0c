#include "net_util.hpp"

#include <array>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "errors.hpp"

using json = nlohmann::json;
using asio::ip::tcp;

namespace {

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

struct Resolution {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::error_code ec;
  std::vector<tcp::endpoint> endpoints;
};

// getaddrinfo cannot be interrupted, so name lookups run on a detached thread
// that the caller abandons at the deadline. Numeric hosts skip the lookup.
std::vector<tcp::endpoint> resolve_endpoints(const std::string& host,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout) {
  std::error_code parse_ec;
  auto address = asio::ip::make_address(host, parse_ec);
  if(!parse_ec) return {tcp::endpoint(address, port)};

  auto state = std::make_shared<Resolution>();
  std::thread([state, host, port](){
    asio::io_context io;
    tcp::resolver resolver(io);
    std::error_code ec;
    auto results = resolver.resolve(host, std::to_string(port), ec);
    std::vector<tcp::endpoint> endpoints;
    if(!ec) {
      for(const auto& entry : results) endpoints.push_back(entry.endpoint());
    }
    {
      std::lock_guard lg(state->mutex);
      state->ec = ec;
      state->endpoints = std::move(endpoints);
      state->done = true;
    }
    state->cv.notify_all();
  }).detach();

  std::unique_lock lk(state->mutex);
  if(!state->cv.wait_for(lk, timeout, [&]{ return state->done; })) {
    throw MeshError(ErrorCode::Timeout, "resolving " + host + " timed out");
  }
  if(state->ec) {
    throw MeshError(ErrorCode::Network, "resolve " + host + ": " + state->ec.message());
  }
  if(state->endpoints.empty()) {
    throw MeshError(ErrorCode::Network, "resolve " + host + ": no addresses");
  }
  return state->endpoints;
}

} // namespace

BlockingTcpClient::BlockingTcpClient(uint32_t max_frame_bytes)
  : socket_(io_),
    max_frame_bytes_(max_frame_bytes) {}

BlockingTcpClient::~BlockingTcpClient() {
  close();
}

void BlockingTcpClient::run(std::chrono::milliseconds timeout, const char* what) {
  io_.restart();
  io_.run_for(timeout);
  if(!io_.stopped()) {
    // Closing cancels the outstanding operation; drain its handler.
    std::error_code ec;
    socket_.close(ec);
    io_.run();
    throw MeshError(ErrorCode::Timeout, std::string(what) + " timed out");
  }
}

void BlockingTcpClient::connect(const std::string& host,
                                uint16_t port,
                                std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto endpoints = resolve_endpoints(host, port, timeout);

  std::error_code result = asio::error::would_block;
  asio::async_connect(socket_, endpoints,
    [&](const std::error_code& ec, const tcp::endpoint& ep){
      result = ec;
      if(!ec) protocol_ = ep.protocol();
    });
  run(remaining_until(deadline), "connect");
  if(result) {
    std::error_code ignored;
    socket_.close(ignored);
    throw MeshError(ErrorCode::Network,
                    "connect " + host + ":" + std::to_string(port) + ": " + result.message());
  }
}

void BlockingTcpClient::write(const std::string& bytes, std::chrono::milliseconds timeout) {
  std::error_code result = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(bytes),
    [&](const std::error_code& ec, std::size_t){ result = ec; });
  run(timeout, "write");
  if(result) {
    throw MeshError(ErrorCode::Network, "write: " + result.message());
  }
}

std::string BlockingTcpClient::read_to_eof(std::chrono::milliseconds timeout, std::size_t limit) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string response;
  std::array<char, 512> buf{};
  while(response.size() < limit) {
    std::error_code result = asio::error::would_block;
    std::size_t got = 0;
    socket_.async_read_some(asio::buffer(buf),
      [&](const std::error_code& ec, std::size_t n){
        result = ec;
        got = n;
      });
    run(remaining_until(deadline), "read");
    response.append(buf.data(), got);
    if(result == asio::error::eof) break;
    if(result) {
      throw MeshError(ErrorCode::Network, "read: " + result.message());
    }
  }
  return response;
}

void BlockingTcpClient::write_frame(const json& doc, std::chrono::milliseconds timeout) {
  write(encode_frame(doc.dump()), timeout);
}

json BlockingTcpClient::read_frame(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(true) {
    std::array<unsigned char, kFrameHeaderBytes> header{};
    std::error_code result = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(header),
      [&](const std::error_code& ec, std::size_t){ result = ec; });
    run(remaining_until(deadline), "read frame header");
    if(result) {
      throw MeshError(ErrorCode::Network, "read: " + result.message());
    }

    int32_t length = decode_frame_length(header.data());
    if(length <= 0) continue;
    if(static_cast<uint32_t>(length) > max_frame_bytes_) {
      close();
      throw MeshError(ErrorCode::ProtocolViolation,
                      "frame of " + std::to_string(length) + " bytes exceeds limit");
    }

    std::string payload(static_cast<std::size_t>(length), '\0');
    result = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(payload),
      [&](const std::error_code& ec, std::size_t){ result = ec; });
    run(remaining_until(deadline), "read frame body");
    if(result) {
      throw MeshError(ErrorCode::Network, "read: " + result.message());
    }

    auto doc = json::parse(payload, nullptr, false);
    if(doc.is_discarded() || !doc.is_object()) {
      throw MeshError(ErrorCode::ProtocolViolation, "expected a JSON control frame");
    }
    return doc;
  }
}

int BlockingTcpClient::release_native() {
  std::error_code ec;
  auto fd = socket_.release(ec);
  if(ec) {
    throw MeshError(ErrorCode::Network, "release socket: " + ec.message());
  }
  return fd;
}

void BlockingTcpClient::close() {
  std::error_code ec;
  if(socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}

bool tcp_reachable(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  try {
    BlockingTcpClient client;
    client.connect(host, port, timeout);
    return true;
  } catch(const MeshError&) {
    return false;
  }
}

std::string http_get_body(const std::string& host,
                          const std::string& path,
                          std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  BlockingTcpClient client;
  client.connect(host, 80, timeout);
  std::string request = "GET " + path + " HTTP/1.0\r\nHost: " + host + "\r\n\r\n";
  client.write(request, remaining_until(deadline));
  std::string response = client.read_to_eof(remaining_until(deadline));

  auto pos = response.find("\r\n\r\n");
  if(pos == std::string::npos) return "";
  std::string body = response.substr(pos + 4);
  while(!body.empty() && (body.back() == '\r' || body.back() == '\n')) {
    body.pop_back();
  }
  return body;
}
