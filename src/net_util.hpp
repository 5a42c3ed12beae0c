#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

#include "protocol.hpp"

// Blocking TCP client with per-operation deadlines. Each call runs the private
// io_context until the operation completes or the deadline passes; on timeout
// the socket is closed and MeshError(Timeout) is thrown. Used for short
// request/response exchanges (relay control, reachability and public IP
// lookups) before a socket is handed to the async world.
class BlockingTcpClient {
public:
  explicit BlockingTcpClient(uint32_t max_frame_bytes = kDefaultMaxFrameBytes);
  ~BlockingTcpClient();

  BlockingTcpClient(const BlockingTcpClient&) = delete;
  BlockingTcpClient& operator=(const BlockingTcpClient&) = delete;

  void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
  bool is_open() const { return socket_.is_open(); }

  void write(const std::string& bytes, std::chrono::milliseconds timeout);
  std::string read_to_eof(std::chrono::milliseconds timeout, std::size_t limit = 64 * 1024);

  void write_frame(const nlohmann::json& doc, std::chrono::milliseconds timeout);
  // Skips frames with a non-positive length. Throws ProtocolViolation when
  // the frame is oversized or not a JSON object.
  nlohmann::json read_frame(std::chrono::milliseconds timeout);

  // Detaches the connected descriptor; the client is closed afterwards.
  int release_native();
  asio::ip::tcp remote_protocol() const { return protocol_; }

  void close();

private:
  void run(std::chrono::milliseconds timeout, const char* what);

  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::ip::tcp protocol_ = asio::ip::tcp::v4();
  uint32_t max_frame_bytes_;
};

// True when a TCP connection to host:port completes within the timeout.
bool tcp_reachable(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

// Plain HTTP/1.0 GET returning the response body with trailing CR/LF removed.
std::string http_get_body(const std::string& host,
                          const std::string& path,
                          std::chrono::milliseconds timeout);
