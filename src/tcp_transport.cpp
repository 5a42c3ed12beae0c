#include "tcp_transport.hpp"

#include <functional>
#include <future>
#include <unordered_map>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

using json = nlohmann::json;

TcpTransport::TcpTransport(Options options,
                           MessageChannel::Options channel_options,
                           std::shared_ptr<Logger> logger)
  : TransportAdapter(kProtocolTcp, channel_options, std::move(logger)),
    options_(std::move(options)) {}

TcpTransport::~TcpTransport() {
  stop();
}

void TcpTransport::on_start() {
  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    throw MeshError(ErrorCode::Configuration,
                    "invalid listen_ip '" + options_.listen_ip + "': " + e.what());
  }

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io());
    tcp::endpoint endpoint(listen_address, options_.listen_port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();
  } catch(const std::system_error& e) {
    acceptor_.reset();
    throw MeshError(ErrorCode::Network,
                    "listen on " + options_.listen_ip + ":" +
                    std::to_string(options_.listen_port) + ": " + e.what());
  }

  if(options_.discovery_port != 0) {
    try {
      discovery_socket_ = std::make_unique<udp::socket>(io());
      discovery_socket_->open(udp::v4());
      discovery_socket_->set_option(udp::socket::reuse_address(true));
      discovery_socket_->set_option(asio::socket_base::broadcast(true));
      discovery_socket_->bind(udp::endpoint(asio::ip::address_v4::any(), options_.discovery_port));
    } catch(const std::system_error& e) {
      // Discovery responder is optional; connections still work.
      logger_->warn("discovery responder on udp/{} unavailable: {}", options_.discovery_port, e.what());
      discovery_socket_.reset();
    }
  }

  logger_->info("tcp transport listening on {}:{}", options_.listen_ip, bound_port_.load());
  do_accept();
  if(discovery_socket_) do_receive_discovery();
}

void TcpTransport::on_stop() {
  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  if(discovery_socket_) discovery_socket_->close(ec);
}

void TcpTransport::do_accept() {
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(!is_running() || !acceptor_->is_open()) return;
      if(ec) {
        logger_->error("accept error: {}", ec.message());
      } else {
        std::error_code ep_ec;
        auto remote = socket.remote_endpoint(ep_ec);
        std::string address = ep_ec ? std::string("unknown")
                                    : remote.address().to_string() + ":" + std::to_string(remote.port());
        logger_->debug("accepted connection from {}", address);
        adopt(ChannelSocket(std::move(socket)), "", address);
      }
      do_accept();
    });
}

void TcpTransport::do_receive_discovery() {
  discovery_socket_->async_receive_from(asio::buffer(discovery_buf_), discovery_sender_,
    [this](std::error_code ec, std::size_t bytes){
      if(!is_running() || !discovery_socket_->is_open()) return;
      if(!ec) {
        try {
          auto message = json::parse(discovery_buf_.data(), discovery_buf_.data() + bytes, nullptr, false);
          if(!message.is_discarded() && message.is_object() &&
             field_string(message, "type") == kMsgDiscover) {
            answer_discover(message, discovery_sender_);
          }
        } catch(const std::exception& ex) {
          logger_->warn("discovery datagram from {} rejected: {}",
                        discovery_sender_.address().to_string(), ex.what());
        }
      } else {
        logger_->debug("discovery receive: {}", ec.message());
      }
      do_receive_discovery();
    });
}

void TcpTransport::answer_discover(const json& message, const udp::endpoint& sender) {
  auto from = field_string(message, "node_id");
  if(from == identity().node_id) return;
  auto port = field_int(message, "port", 0);
  if(port <= 0 || port >= 65535) {
    logger_->debug("DISCOVER from {} carries invalid port {}", from, port);
    return;
  }

  auto reply = std::make_shared<std::string>(
    make_discover_message(kMsgDiscoverResponse,
                          identity().node_id,
                          identity().node_name,
                          bound_port_.load(),
                          identity().capabilities).dump());
  udp::endpoint target(sender.address(), static_cast<uint16_t>(port + 1));
  logger_->debug("answering DISCOVER from {} at {}:{}", from, target.address().to_string(), target.port());
  discovery_socket_->async_send_to(asio::buffer(*reply), target,
    [this, reply](std::error_code ec, std::size_t){
      if(ec) logger_->debug("DISCOVER_RESPONSE send failed: {}", ec.message());
    });
}

std::vector<PeerInfo> TcpTransport::discover(std::chrono::milliseconds timeout) {
  std::promise<std::vector<PeerInfo>> mine;
  std::shared_future<std::vector<PeerInfo>> joined;
  {
    std::lock_guard lg(discover_mutex_);
    if(discover_inflight_.valid() &&
       discover_inflight_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
      joined = discover_inflight_;
    } else {
      discover_inflight_ = mine.get_future().share();
    }
  }

  if(joined.valid()) {
    logger_->debug("tcp discovery already running, sharing its results");
    if(joined.wait_for(timeout) != std::future_status::ready) return {};
    return joined.get();
  }

  try {
    auto peers = run_discover(timeout);
    mine.set_value(peers);
    return peers;
  } catch(const std::exception&) {
    mine.set_exception(std::current_exception());
    throw;
  }
}

std::vector<PeerInfo> TcpTransport::run_discover(std::chrono::milliseconds timeout) {
  uint16_t own_port = bound_port_.load() != 0 ? bound_port_.load() : options_.listen_port;
  uint16_t reply_port = static_cast<uint16_t>(own_port + 1);

  asio::io_context scan_io;
  udp::socket socket(scan_io);
  try {
    socket.open(udp::v4());
    socket.set_option(udp::socket::reuse_address(true));
    socket.set_option(asio::socket_base::broadcast(true));
    socket.bind(udp::endpoint(asio::ip::address_v4::any(), reply_port));

    auto request = make_discover_message(kMsgDiscover,
                                         identity().node_id,
                                         identity().node_name,
                                         own_port,
                                         identity().capabilities).dump();
    udp::endpoint target(asio::ip::make_address(options_.broadcast_address),
                         options_.discovery_target_port);
    socket.send_to(asio::buffer(request), target);
  } catch(const std::system_error& e) {
    throw MeshError(ErrorCode::Network, std::string("tcp discovery: ") + e.what());
  }

  std::unordered_map<std::string, PeerInfo> found;
  std::array<char, 2048> buf{};
  udp::endpoint sender;
  std::function<void()> receive = [&](){
    socket.async_receive_from(asio::buffer(buf), sender,
      [&](std::error_code ec, std::size_t bytes){
        if(ec == asio::error::operation_aborted) return;
        if(!ec) {
          auto message = json::parse(buf.data(), buf.data() + bytes, nullptr, false);
          if(!message.is_discarded() && message.is_object() &&
             field_string(message, "type") == kMsgDiscoverResponse) {
            auto port = field_int(message, "port", 0);
            PeerInfo peer;
            peer.id = field_string(message, "node_id");
            peer.name = field_string(message, "node_name");
            peer.address = sender.address().to_string() + ":" + std::to_string(port);
            peer.protocol = kProtocolTcp;
            peer.signal_strength = 100;
            peer.last_seen = std::chrono::system_clock::now();
            if(message.contains("capabilities") && message["capabilities"].is_array()) {
              for(const auto& cap : message["capabilities"]) {
                if(cap.is_string()) peer.capabilities.insert(cap.get<std::string>());
              }
            }
            if(port > 0 && port < 65536 && !peer.id.empty() && peer.id != identity().node_id) {
              found[peer.id] = std::move(peer);
            }
          }
        }
        receive();
      });
  };
  receive();
  scan_io.run_for(timeout);

  std::vector<PeerInfo> out;
  out.reserve(found.size());
  for(auto& kv : found) out.push_back(std::move(kv.second));
  logger_->debug("tcp discovery found {} peer(s)", out.size());
  return out;
}

std::shared_ptr<MessageChannel> TcpTransport::connect(const PeerInfo& target,
                                                      std::chrono::milliseconds timeout) {
  if(!is_running()) {
    throw MeshError(ErrorCode::NotRunning, "tcp transport is not running");
  }
  std::string host;
  uint16_t port = 0;
  if(!split_host_port(target.address, host, port)) {
    throw MeshError(ErrorCode::Network, "no tcp address for " + target.id + " ('" + target.address + "')");
  }

  auto socket = std::make_shared<tcp::socket>(io());
  auto resolver = std::make_shared<tcp::resolver>(io());
  auto result = std::make_shared<std::promise<std::error_code>>();
  auto finished = result->get_future();

  resolver->async_resolve(host, std::to_string(port),
    [socket, resolver, result](std::error_code ec, tcp::resolver::results_type endpoints){
      if(ec) {
        result->set_value(ec);
        return;
      }
      asio::async_connect(*socket, endpoints,
        [socket, result](std::error_code ec, const tcp::endpoint&){
          result->set_value(ec);
        });
    });

  if(finished.wait_for(timeout) != std::future_status::ready) {
    asio::post(io(), [socket, resolver](){
      resolver->cancel();
      std::error_code ec;
      socket->close(ec);
    });
    throw MeshError(ErrorCode::Timeout, "tcp connect to " + target.address + " timed out");
  }
  if(auto ec = finished.get()) {
    throw MeshError(ErrorCode::Network, "tcp connect to " + target.address + ": " + ec.message());
  }

  logger_->info("connected to {} at {}", target.id, target.address);
  return adopt(ChannelSocket(std::move(*socket)), target.id, target.address);
}
