#include "relay_server.hpp"

#include <array>
#include <functional>
#include <future>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

using json = nlohmann::json;
using asio::ip::tcp;

// One accepted socket until its first request has been handled.
struct RelayServer::Connection {
  explicit Connection(tcp::socket s)
    : socket(std::move(s)), timer(socket.get_executor()) {}

  void close() {
    std::error_code ec;
    timer.cancel();
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

  tcp::socket socket;
  asio::steady_timer timer;
  std::array<unsigned char, kFrameHeaderBytes> header{};
  std::string body;
  std::string remote;
};

// Copies bytes both ways until either side closes.
struct RelayServer::Splice : std::enable_shared_from_this<RelayServer::Splice> {
  Splice(std::shared_ptr<Connection> a, std::shared_ptr<Connection> b,
         std::function<void(const std::shared_ptr<Splice>&)> on_done)
    : left(std::move(a)), right(std::move(b)), done(std::move(on_done)) {}

  void start() {
    pump(left, right, left_buf);
    pump(right, left, right_buf);
  }

  void pump(const std::shared_ptr<Connection>& from,
            const std::shared_ptr<Connection>& to,
            std::array<char, 16 * 1024>& buf) {
    auto self = shared_from_this();
    from->socket.async_read_some(asio::buffer(buf),
      [self, from, to, &buf](std::error_code ec, std::size_t n){
        if(ec) {
          self->finish();
          return;
        }
        asio::async_write(to->socket, asio::buffer(buf.data(), n),
          [self, from, to, &buf](std::error_code ec, std::size_t){
            if(ec) {
              self->finish();
              return;
            }
            self->pump(from, to, buf);
          });
      });
  }

  void finish() {
    if(finished) return;
    finished = true;
    left->close();
    right->close();
    if(done) done(shared_from_this());
  }

  std::shared_ptr<Connection> left;
  std::shared_ptr<Connection> right;
  std::array<char, 16 * 1024> left_buf{};
  std::array<char, 16 * 1024> right_buf{};
  std::function<void(const std::shared_ptr<Splice>&)> done;
  bool finished = false;
};

RelayServer::RelayServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("relay-server")) {}

RelayServer::~RelayServer() {
  stop();
}

void RelayServer::start() {
  if(running_.exchange(true)) {
    throw MeshError(ErrorCode::AlreadyRunning, "relay server already started");
  }
  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(asio::ip::make_address(options_.listen_ip), options_.port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();
  } catch(const std::system_error& e) {
    acceptor_.reset();
    running_ = false;
    throw MeshError(ErrorCode::Network,
                    "relay listen on " + options_.listen_ip + ":" +
                    std::to_string(options_.port) + ": " + e.what());
  }

  work_.emplace(asio::make_work_guard(io_));
  do_accept();
  io_thread_ = std::thread([this](){ io_.run(); });
  logger_->info("relay server listening on {}:{}", options_.listen_ip, bound_port_.load());
}

void RelayServer::stop() {
  if(!running_.exchange(false)) return;

  std::promise<void> done;
  auto finished = done.get_future();
  asio::post(io_, [this, &done](){
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
    std::vector<std::shared_ptr<MessageChannel>> channels;
    std::vector<std::shared_ptr<Connection>> connections;
    std::vector<std::shared_ptr<Splice>> splices;
    {
      std::lock_guard lg(mutex_);
      for(auto& kv : registrations_) channels.push_back(kv.second.channel);
      for(auto& kv : pending_) connections.push_back(kv.second.dialer);
      for(auto& c : handshaking_) connections.push_back(c);
      splices.assign(splices_.begin(), splices_.end());
      registrations_.clear();
      pending_.clear();
      handshaking_.clear();
      splices_.clear();
    }
    for(auto& c : channels) c->close("relay stopping");
    for(auto& c : connections) c->close();
    for(auto& s : splices) {
      s->left->close();
      s->right->close();
    }
    done.set_value();
  });
  finished.wait();

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();
  logger_->info("relay server stopped");
}

std::size_t RelayServer::registered_count() const {
  std::lock_guard lg(mutex_);
  return registrations_.size();
}

std::size_t RelayServer::active_splices() const {
  std::lock_guard lg(mutex_);
  return splices_.size();
}

void RelayServer::do_accept() {
  acceptor_->async_accept([this](std::error_code ec, tcp::socket socket){
    if(!running_ || !acceptor_->is_open()) return;
    if(ec) {
      logger_->error("accept error: {}", ec.message());
    } else {
      auto conn = std::make_shared<Connection>(std::move(socket));
      std::error_code ep_ec;
      auto remote = conn->socket.remote_endpoint(ep_ec);
      conn->remote = ep_ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
      {
        std::lock_guard lg(mutex_);
        handshaking_.insert(conn);
      }
      conn->timer.expires_after(options_.handshake_timeout);
      conn->timer.async_wait([this, conn](const std::error_code& ec){
        if(ec) return;
        logger_->debug("{} sent no request in time", conn->remote);
        {
          std::lock_guard lg(mutex_);
          handshaking_.erase(conn);
        }
        conn->close();
      });
      read_request(conn);
    }
    do_accept();
  });
}

void RelayServer::read_request(const std::shared_ptr<Connection>& conn) {
  asio::async_read(conn->socket, asio::buffer(conn->header),
    [this, conn](std::error_code ec, std::size_t){
      if(ec) {
        std::lock_guard lg(mutex_);
        handshaking_.erase(conn);
        return;
      }
      int32_t length = decode_frame_length(conn->header.data());
      if(length <= 0) {
        read_request(conn);
        return;
      }
      if(static_cast<uint32_t>(length) > options_.channel.max_frame_bytes) {
        logger_->warn("protocol violation from {}: {} byte request", conn->remote, length);
        {
          std::lock_guard lg(mutex_);
          handshaking_.erase(conn);
        }
        conn->close();
        return;
      }
      conn->body.assign(static_cast<std::size_t>(length), '\0');
      asio::async_read(conn->socket, asio::buffer(conn->body),
        [this, conn](std::error_code ec, std::size_t){
          {
            std::lock_guard lg(mutex_);
            handshaking_.erase(conn);
          }
          conn->timer.cancel();
          if(ec) {
            conn->close();
            return;
          }
          auto request = json::parse(conn->body, nullptr, false);
          if(request.is_discarded() || !request.is_object()) {
            reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "malformed request"}});
            return;
          }
          try {
            handle_request(conn, request);
          } catch(const std::exception& ex) {
            logger_->warn("request from {} rejected: {}", conn->remote, ex.what());
            conn->close();
          }
        });
    });
}

void RelayServer::handle_request(const std::shared_ptr<Connection>& conn, const json& request) {
  auto type = field_string(request, "type");
  if(type == kMsgRelayRegister) {
    handle_register(conn, request);
  } else if(type == kMsgRelayList) {
    handle_list(conn);
  } else if(type == kMsgRelayConnect) {
    handle_connect(conn, request);
  } else if(type == kMsgRelayAccept) {
    handle_accept(conn, request);
  } else {
    logger_->debug("unexpected request '{}' from {}", type, conn->remote);
    reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "unexpected request " + type}});
  }
}

void RelayServer::handle_register(const std::shared_ptr<Connection>& conn, const json& request) {
  auto node_id = field_string(request, "node_id");
  if(node_id.empty()) {
    reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "node_id required"}});
    return;
  }
  auto channel = MessageChannel::create(ChannelSocket(std::move(conn->socket)),
                                        this,
                                        options_.channel,
                                        logger_->child("control"));
  channel->set_peer_id(node_id);
  channel->set_transport("relay-control");
  channel->set_remote_address(conn->remote);

  Registration registration;
  registration.channel = channel;
  registration.node_name = field_string(request, "node_name");
  registration.capabilities = request.contains("capabilities") ? request["capabilities"] : json::array();

  std::shared_ptr<MessageChannel> previous;
  {
    std::lock_guard lg(mutex_);
    auto it = registrations_.find(node_id);
    if(it != registrations_.end()) previous = it->second.channel;
    registrations_[node_id] = std::move(registration);
  }
  if(previous) previous->close("re-registered");

  json ok;
  ok["type"] = kMsgRelayOk;
  ok["node_id"] = node_id;
  channel->start(ok);
  logger_->info("registered {} ({}) from {}", node_id, field_string(request, "node_name"), conn->remote);
}

void RelayServer::handle_list(const std::shared_ptr<Connection>& conn) {
  json peers = json::array();
  {
    std::lock_guard lg(mutex_);
    for(const auto& kv : registrations_) {
      json entry;
      entry["node_id"] = kv.first;
      entry["node_name"] = kv.second.node_name;
      entry["capabilities"] = kv.second.capabilities;
      peers.push_back(std::move(entry));
    }
  }
  json reply;
  reply["type"] = kMsgRelayPeers;
  reply["peers"] = std::move(peers);
  reply_and_close(conn, reply);
}

void RelayServer::handle_connect(const std::shared_ptr<Connection>& conn, const json& request) {
  auto from = field_string(request, "node_id");
  auto target = field_string(request, "target");
  std::shared_ptr<MessageChannel> target_channel;
  {
    std::lock_guard lg(mutex_);
    auto it = registrations_.find(target);
    if(it != registrations_.end()) target_channel = it->second.channel;
  }
  if(!target_channel || !target_channel->is_open()) {
    reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "target " + target + " is not registered"}});
    return;
  }

  auto session = random_hex(8);
  {
    std::lock_guard lg(mutex_);
    pending_[session] = PendingSession{conn, from, target};
  }
  conn->timer.expires_after(options_.pending_timeout);
  conn->timer.async_wait([this, conn, session](const std::error_code& ec){
    if(ec) return;
    bool expired = false;
    {
      std::lock_guard lg(mutex_);
      expired = pending_.erase(session) > 0;
    }
    if(expired) {
      logger_->info("session {} expired before the target accepted", session);
      reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "target did not accept in time"}});
    }
  });

  json incoming;
  incoming["type"] = kMsgRelayIncoming;
  incoming["session"] = session;
  incoming["from"] = {{"node_id", from}, {"node_name", field_string(request, "node_name")}};
  target_channel->send_json(incoming);
  logger_->debug("session {}: {} -> {} waiting for accept", session, from, target);
}

void RelayServer::handle_accept(const std::shared_ptr<Connection>& conn, const json& request) {
  auto session = field_string(request, "session");
  std::optional<PendingSession> pending;
  {
    std::lock_guard lg(mutex_);
    auto it = pending_.find(session);
    if(it != pending_.end()) {
      pending = it->second;
      pending_.erase(it);
    }
  }
  if(!pending) {
    reply_and_close(conn, {{"type", kMsgRelayError}, {"reason", "unknown session"}});
    return;
  }
  pending->dialer->timer.cancel();

  json ok;
  ok["type"] = kMsgRelayOk;
  ok["session"] = session;
  auto frame = std::make_shared<std::string>(encode_frame(ok.dump()));
  auto dialer = pending->dialer;
  auto writes_left = std::make_shared<int>(2);
  auto failed = std::make_shared<bool>(false);
  auto on_written = [this, frame, dialer, conn, writes_left, failed](std::error_code ec, std::size_t){
    if(ec) *failed = true;
    if(--(*writes_left) > 0) return;
    if(*failed) {
      dialer->close();
      conn->close();
      return;
    }
    start_splice(dialer, conn);
  };
  asio::async_write(dialer->socket, asio::buffer(*frame), on_written);
  asio::async_write(conn->socket, asio::buffer(*frame), on_written);
  logger_->info("session {}: splicing {} <-> {}", session, pending->from, pending->target);
}

void RelayServer::reply_and_close(const std::shared_ptr<Connection>& conn, const json& reply) {
  auto frame = std::make_shared<std::string>(encode_frame(reply.dump()));
  asio::async_write(conn->socket, asio::buffer(*frame),
    [conn, frame](std::error_code, std::size_t){
      conn->close();
    });
}

void RelayServer::start_splice(const std::shared_ptr<Connection>& a, const std::shared_ptr<Connection>& b) {
  auto splice = std::make_shared<Splice>(a, b, [this](const std::shared_ptr<Splice>& s){
    std::lock_guard lg(mutex_);
    splices_.erase(s);
  });
  {
    std::lock_guard lg(mutex_);
    splices_.insert(splice);
  }
  splice->start();
}

void RelayServer::on_closed(const std::shared_ptr<MessageChannel>& channel, const std::string& reason) {
  auto node_id = channel->peer_id();
  bool removed = false;
  {
    std::lock_guard lg(mutex_);
    auto it = registrations_.find(node_id);
    if(it != registrations_.end() && it->second.channel == channel) {
      registrations_.erase(it);
      removed = true;
    }
  }
  if(removed) logger_->info("{} unregistered ({})", node_id, reason);
}
