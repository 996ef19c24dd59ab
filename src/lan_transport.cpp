#include "lan_transport.hpp"

#include <algorithm>
#include <future>

#include "connection.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

LanTransport::LanTransport(LanTransportOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transport")),
    io_guard_(asio::make_work_guard(io_)) {}

LanTransport::~LanTransport() {
  stop();
}

void LanTransport::set_connection_handler(ConnectionHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  connection_handler_ = std::move(handler);
}

void LanTransport::set_stream_handler(const std::string& protocol, StreamHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_handlers_[protocol] = std::move(handler);
}

std::size_t LanTransport::connected_peer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_.size();
}

void LanTransport::start() {
  if(started_) return;

  peer_id_ = options_.peer_id.empty() ? generate_peer_id() : options_.peer_id;
  session_ = generate_session_id();

  try {
    auto address = asio::ip::make_address(options_.listen_ip);
    tcp::endpoint endpoint(address, options_.listen_port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();
  } catch(const std::system_error& e) {
    acceptor_.reset();
    throw TransportInitError("cannot listen on " + options_.listen_ip + ":" +
                             std::to_string(options_.listen_port) + ": " + e.what());
  }

  workers_ = std::make_unique<asio::thread_pool>(options_.worker_threads ? options_.worker_threads : 1);
  if(options_.discovery) {
    try {
      start_discovery();
    } catch(const TransportInitError&) {
      workers_->join();
      throw;
    }
  }

  started_ = true;
  stopping_ = false;
  refuse_streams_ = false;
  start_accept();
  io_thread_ = std::thread([this](){
    io_.run();
  });

  logger_->info("listening on {}:{} as {}", options_.listen_ip, listen_port_, short_peer_id(peer_id_));

  if(!options_.bootstrap_peer.empty()) {
    asio::post(*workers_, [this](){ dial_bootstrap(); });
  }
}

void LanTransport::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!started_ || stopping_) return;
    stopping_ = true;
  }

  abort_streams();

  auto closed = std::make_shared<std::promise<void>>();
  auto closed_future = closed->get_future();
  asio::post(io_, [this, closed](){
    std::error_code ec;
    if(beacon_timer_) beacon_timer_->cancel(ec);
    if(acceptor_) acceptor_->close(ec);
    if(beacon_in_) beacon_in_->close(ec);
    if(beacon_out_) beacon_out_->close(ec);
    closed->set_value();
  });
  closed_future.wait();

  join_inbound();
  workers_->join();

  io_guard_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  started_ = false;
}

void LanTransport::abort_streams() {
  std::vector<std::shared_ptr<Connection>> open;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_streams_ = true;
    for(auto& weak : live_) {
      if(auto conn = weak.lock()) open.push_back(std::move(conn));
    }
    live_.clear();
  }
  for(auto& conn : open) {
    conn->abort();
  }
}

std::shared_ptr<Connection> LanTransport::new_connection(tcp::socket socket) {
  auto conn = Connection::create(io_, std::move(socket), options_.stream_timeout);
  std::lock_guard<std::mutex> lock(mutex_);
  if(stopping_ || refuse_streams_) {
    conn->abort();
    return conn;
  }
  live_.erase(std::remove_if(live_.begin(), live_.end(),
                             [](const std::weak_ptr<Connection>& w){ return w.expired(); }),
              live_.end());
  live_.push_back(conn);
  return conn;
}

void LanTransport::start_accept() {
  if(!acceptor_ || !acceptor_->is_open()) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->warn("accept error: {}", ec.message());
      } else {
        spawn_inbound(new_connection(std::move(socket)));
      }
      start_accept();
    });
}

void LanTransport::spawn_inbound(std::shared_ptr<Connection> conn) {
  std::lock_guard<std::mutex> lock(inbound_mutex_);
  auto finished = std::partition(inbound_.begin(), inbound_.end(),
                                 [](const InboundTask& task){ return !task.done->load(); });
  for(auto it = finished; it != inbound_.end(); ++it) {
    it->thread.join();
  }
  inbound_.erase(finished, inbound_.end());

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, conn, done](){
    handle_inbound(conn);
    *done = true;
  });
  inbound_.push_back(InboundTask{std::move(thread), done});
}

void LanTransport::join_inbound() {
  std::vector<InboundTask> pending;
  {
    std::lock_guard<std::mutex> lock(inbound_mutex_);
    pending.swap(inbound_);
  }
  for(auto& task : pending) {
    if(task.thread.joinable()) task.thread.join();
  }
}

void LanTransport::handle_inbound(std::shared_ptr<Connection> conn) {
  try {
    auto header = decode_stream_header(conn->read_line(kMaxStreamHeaderBytes));
    conn->set_protocol(header.protocol);
    if(header.peer_id == peer_id_) {
      conn->close();
      return;
    }
    if(header.listen_port != 0) {
      remember_address(header.peer_id, tcp::endpoint(conn->remote_endpoint().address(), header.listen_port));
    }

    if(header.protocol == kConnectProtocol) {
      StreamHeader reply{peer_id_, kConnectProtocol, listen_port_, session_};
      conn->write(encode_stream_header(reply));
      conn->close_write();
      conn->close();
      note_connected(header.peer_id, header.session);
      return;
    }

    StreamHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = stream_handlers_.find(header.protocol);
      if(it != stream_handlers_.end()) handler = it->second;
    }
    if(!handler) {
      logger_->debug("no handler for {} from {}", header.protocol, short_peer_id(header.peer_id));
      conn->close();
      return;
    }
    note_connected(header.peer_id, header.session);
    handler(conn, header.peer_id);
    conn->close();
  } catch(const DropError& e) {
    logger_->debug("inbound stream from {}: {}", conn->remote_address(), e.what());
    conn->abort();
  } catch(const std::exception& e) {
    logger_->error("inbound stream from {}: {}", conn->remote_address(), e.what());
    conn->abort();
  }
}

void LanTransport::dial_peer(const tcp::endpoint& endpoint) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopping_ || !dialing_.insert(endpoint).second) return;
  }
  try {
    auto conn = new_connection(tcp::socket(io_));
    conn->connect(endpoint);
    conn->set_protocol(kConnectProtocol);
    StreamHeader hello{peer_id_, kConnectProtocol, listen_port_, session_};
    conn->write(encode_stream_header(hello));
    conn->close_write();
    auto reply = decode_stream_header(conn->read_line(kMaxStreamHeaderBytes));
    conn->close();
    if(reply.peer_id != peer_id_) {
      remember_address(reply.peer_id, endpoint);
      note_connected(reply.peer_id, reply.session);
    }
  } catch(const DropError& e) {
    logger_->debug("dial {}:{} failed: {}", endpoint.address().to_string(), endpoint.port(), e.what());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  dialing_.erase(endpoint);
}

void LanTransport::dial_bootstrap() {
  const auto& target = options_.bootstrap_peer;
  auto pos = target.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 == target.size()) {
    logger_->error("bootstrap peer must be host:port (got '{}')", target);
    return;
  }
  tcp::resolver resolver(io_);
  std::error_code ec;
  auto results = resolver.resolve(target.substr(0, pos), target.substr(pos + 1), ec);
  if(ec || results.empty()) {
    logger_->error("cannot resolve bootstrap peer {}: {}", target, ec ? ec.message() : "no address");
    return;
  }
  auto endpoint = results.begin()->endpoint();
  dial_peer(endpoint);
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& entry : addresses_) {
    if(entry.second == endpoint) return;
  }
  logger_->warn("bootstrap peer {} did not answer", target);
}

void LanTransport::remember_address(const std::string& peer_id, const tcp::endpoint& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  addresses_[peer_id] = endpoint;
}

// Fires the handler once per peer session. A peer that restarts under the
// same id arrives with a new session and is announced again.
void LanTransport::note_connected(const std::string& peer_id, const std::string& session) {
  ConnectionHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopping_ || refuse_streams_) return;
    auto it = connected_.find(peer_id);
    if(it != connected_.end() && it->second == session) return;
    connected_[peer_id] = session;
    handler = connection_handler_;
  }
  logger_->debug("connected to {}", short_peer_id(peer_id));
  if(!handler) return;
  try {
    handler(peer_id);
  } catch(const std::exception& e) {
    logger_->error("connection handler for {}: {}", short_peer_id(peer_id), e.what());
  }
}

std::shared_ptr<Stream> LanTransport::open_stream(const std::string& peer_id,
                                                  const std::string& protocol) {
  tcp::endpoint endpoint;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stopping_ || refuse_streams_) throw ConnectionError("transport is shutting down");
    auto it = addresses_.find(peer_id);
    if(it == addresses_.end()) {
      throw ConnectionError("no address known for peer " + short_peer_id(peer_id));
    }
    endpoint = it->second;
  }
  auto conn = new_connection(tcp::socket(io_));
  conn->connect(endpoint);
  conn->set_protocol(protocol);
  try {
    conn->write(encode_stream_header(StreamHeader{peer_id_, protocol, listen_port_, session_}));
  } catch(const IOError& e) {
    conn->abort();
    throw ConnectionError(std::string("open ") + protocol + ": " + e.what());
  }
  return conn;
}

void LanTransport::start_discovery() {
  try {
    auto group = asio::ip::make_address(options_.discovery_group);
    if(!group.is_v4() || !group.is_multicast()) {
      throw TransportInitError("discovery group " + options_.discovery_group + " is not an IPv4 multicast address");
    }
    group_endpoint_ = udp::endpoint(group, options_.discovery_port);

    beacon_in_ = std::make_unique<udp::socket>(io_);
    beacon_in_->open(udp::v4());
    beacon_in_->set_option(udp::socket::reuse_address(true));
    beacon_in_->bind(udp::endpoint(asio::ip::address_v4::any(), options_.discovery_port));
    beacon_in_->set_option(asio::ip::multicast::join_group(group.to_v4()));

    beacon_out_ = std::make_unique<udp::socket>(io_);
    beacon_out_->open(udp::v4());
    beacon_out_->set_option(asio::ip::multicast::enable_loopback(true));
    beacon_out_->set_option(asio::ip::multicast::hops(1));
    auto local = asio::ip::make_address(options_.listen_ip);
    if(local.is_v4() && !local.is_unspecified()) {
      beacon_out_->set_option(asio::ip::multicast::outbound_interface(local.to_v4()));
    }
  } catch(const std::system_error& e) {
    beacon_in_.reset();
    beacon_out_.reset();
    throw TransportInitError("cannot start discovery on " + options_.discovery_group + ":" +
                             std::to_string(options_.discovery_port) + ": " + e.what());
  }

  beacon_timer_ = std::make_unique<asio::steady_timer>(io_);
  receive_beacon();
  send_beacon();
}

void LanTransport::send_beacon() {
  if(!beacon_out_ || !beacon_out_->is_open()) return;
  auto payload = std::make_shared<std::string>(encode_beacon(DiscoveryBeacon{peer_id_, listen_port_, session_}));
  beacon_out_->async_send_to(asio::buffer(*payload), group_endpoint_,
    [this, payload](std::error_code ec, std::size_t){
      if(ec == asio::error::operation_aborted) return;
      if(ec) logger_->debug("beacon send failed: {}", ec.message());
    });
  schedule_beacon();
}

void LanTransport::schedule_beacon() {
  beacon_timer_->expires_after(options_.discovery_interval);
  beacon_timer_->async_wait([this](const std::error_code& ec){
    if(ec) return;
    send_beacon();
  });
}

void LanTransport::receive_beacon() {
  if(!beacon_in_ || !beacon_in_->is_open()) return;
  beacon_in_->async_receive_from(asio::buffer(beacon_buf_), beacon_sender_,
    [this](std::error_code ec, std::size_t n){
      if(ec == asio::error::operation_aborted) return;
      if(!ec) {
        auto beacon = decode_beacon(std::string(beacon_buf_.data(), n));
        if(beacon && beacon->peer_id != peer_id_) {
          bool known = false;
          {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connected_.find(beacon->peer_id);
            known = stopping_ || (it != connected_.end() && it->second == beacon->session);
          }
          if(!known) {
            tcp::endpoint endpoint(beacon_sender_.address(), beacon->port);
            logger_->debug("beacon from {} at {}:{}", short_peer_id(beacon->peer_id),
                           endpoint.address().to_string(), endpoint.port());
            asio::post(*workers_, [this, endpoint](){ dial_peer(endpoint); });
          }
        }
      } else {
        logger_->debug("beacon receive failed: {}", ec.message());
      }
      receive_beacon();
    });
}
