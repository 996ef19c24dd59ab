#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "transport.hpp"

class Connection;

struct LanTransportOptions {
  std::string peer_id;
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 0;
  bool discovery = true;
  std::string discovery_group = "239.255.77.77";
  uint16_t discovery_port = 47077;
  std::chrono::milliseconds discovery_interval{5000};
  std::string bootstrap_peer;
  std::chrono::milliseconds stream_timeout{30000};
  // Pool for outbound dials. Every inbound stream gets its own thread.
  std::size_t worker_threads = 4;
};

// PeerTransport over plain TCP on the local network. Every logical stream is
// its own TCP connection opened with a one-line JSON header naming the
// sender and the protocol. Peers find each other through multicast beacons
// or a bootstrap address.
class LanTransport : public PeerTransport {
public:
  LanTransport(LanTransportOptions options, std::shared_ptr<Logger> logger);
  ~LanTransport() override;

  LanTransport(const LanTransport&) = delete;
  LanTransport& operator=(const LanTransport&) = delete;

  // Throws TransportInitError if the listener or discovery cannot start.
  void start();
  void stop();
  // Cancels every open stream and refuses new ones; blocked readers and
  // writers throw.
  void abort_streams();

  const std::string& local_peer_id() const override { return peer_id_; }
  void set_connection_handler(ConnectionHandler handler) override;
  void set_stream_handler(const std::string& protocol, StreamHandler handler) override;
  std::shared_ptr<Stream> open_stream(const std::string& peer_id,
                                      const std::string& protocol) override;

  uint16_t listen_port() const { return listen_port_; }
  std::size_t connected_peer_count() const;

private:
  using tcp = asio::ip::tcp;
  using udp = asio::ip::udp;

  void start_accept();
  void spawn_inbound(std::shared_ptr<Connection> conn);
  void join_inbound();
  void handle_inbound(std::shared_ptr<Connection> conn);
  void dial_peer(const tcp::endpoint& endpoint);
  void dial_bootstrap();
  void note_connected(const std::string& peer_id, const std::string& session);
  void remember_address(const std::string& peer_id, const tcp::endpoint& endpoint);
  std::shared_ptr<Connection> new_connection(tcp::socket socket);

  void start_discovery();
  void send_beacon();
  void schedule_beacon();
  void receive_beacon();

  LanTransportOptions options_;
  std::shared_ptr<Logger> logger_;
  std::string peer_id_;
  std::string session_;
  uint16_t listen_port_ = 0;

  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> io_guard_;
  std::thread io_thread_;
  std::unique_ptr<asio::thread_pool> workers_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<udp::socket> beacon_out_;
  std::unique_ptr<udp::socket> beacon_in_;
  std::unique_ptr<asio::steady_timer> beacon_timer_;
  udp::endpoint beacon_sender_;
  std::array<char, 1500> beacon_buf_{};
  udp::endpoint group_endpoint_;

  mutable std::mutex mutex_;
  bool started_ = false;
  bool stopping_ = false;
  bool refuse_streams_ = false;
  ConnectionHandler connection_handler_;
  std::map<std::string, StreamHandler> stream_handlers_;
  std::map<std::string, tcp::endpoint> addresses_;
  // peer id -> session the connection handler last fired for
  std::map<std::string, std::string> connected_;
  std::set<tcp::endpoint> dialing_;
  std::vector<std::weak_ptr<Connection>> live_;

  struct InboundTask {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::mutex inbound_mutex_;
  std::vector<InboundTask> inbound_;
};
