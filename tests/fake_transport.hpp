#pragma once

#include "errors.hpp"
#include "transport.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace drop::test {

// One direction of an in-memory stream.
class Pipe {
public:
  void push(const char* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) throw IOError("write after close");
    buffer_.append(data, size);
    cv_.notify_all();
  }

  std::size_t pop(char* data, std::size_t size) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]{ return !buffer_.empty() || closed_ || broken_; });
    if(broken_) throw IOError("stream reset by peer");
    auto n = std::min(size, buffer_.size());
    std::memcpy(data, buffer_.data(), n);
    buffer_.erase(0, n);
    return n;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  void break_pipe() {
    std::lock_guard<std::mutex> lock(mutex_);
    broken_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::string buffer_;
  bool closed_ = false;
  bool broken_ = false;
};

class PipeStream : public Stream {
public:
  PipeStream(std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out, std::string protocol)
    : in_(std::move(in)), out_(std::move(out)), protocol_(std::move(protocol)) {}

  void write(const char* data, std::size_t size) override { out_->push(data, size); }
  using Stream::write;
  std::size_t read_some(char* data, std::size_t size) override { return in_->pop(data, size); }
  void close_write() override { out_->close(); }
  void close() override { out_->close(); }
  void abort() override { out_->break_pipe(); }
  const std::string& protocol() const override { return protocol_; }

private:
  std::shared_ptr<Pipe> in_;
  std::shared_ptr<Pipe> out_;
  std::string protocol_;
};

inline std::pair<std::shared_ptr<PipeStream>, std::shared_ptr<PipeStream>>
make_stream_pair(const std::string& protocol) {
  auto a_to_b = std::make_shared<Pipe>();
  auto b_to_a = std::make_shared<Pipe>();
  return {std::make_shared<PipeStream>(b_to_a, a_to_b, protocol),
          std::make_shared<PipeStream>(a_to_b, b_to_a, protocol)};
}

class FakeTransport;

// Routes streams between FakeTransports. Inbound handlers run on their own
// threads, joined by drain().
class FakeNetwork {
public:
  ~FakeNetwork() { drain(); }

  void add(FakeTransport* transport);
  FakeTransport* find(const std::string& peer_id);

  void spawn(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.emplace_back(std::move(fn));
  }

  void drain() {
    for(;;) {
      std::vector<std::thread> pending;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(threads_);
      }
      if(pending.empty()) return;
      for(auto& t : pending) {
        if(t.joinable()) t.join();
      }
    }
  }

  // Fires both sides' connection handlers.
  void connect(FakeTransport& a, FakeTransport& b);

private:
  std::mutex mutex_;
  std::map<std::string, FakeTransport*> transports_;
  std::vector<std::thread> threads_;
};

class FakeTransport : public PeerTransport {
public:
  FakeTransport(FakeNetwork& network, std::string peer_id)
    : network_(network), peer_id_(std::move(peer_id)) {
    network_.add(this);
  }

  const std::string& local_peer_id() const override { return peer_id_; }

  void set_connection_handler(ConnectionHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_handler_ = std::move(handler);
  }

  void set_stream_handler(const std::string& protocol, StreamHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_handlers_[protocol] = std::move(handler);
  }

  std::shared_ptr<Stream> open_stream(const std::string& peer_id,
                                      const std::string& protocol) override {
    if(fail_open_) throw ConnectionError("simulated dial failure to " + peer_id);
    auto* remote = network_.find(peer_id);
    if(!remote) throw ConnectionError("unknown peer " + peer_id);
    auto handler = remote->handler_for(protocol);
    if(!handler) throw ConnectionError("protocol " + protocol + " not supported by " + peer_id);

    auto streams = make_stream_pair(protocol);
    auto remote_end = streams.second;
    auto origin = peer_id_;
    network_.spawn([handler, remote_end, origin](){ handler(remote_end, origin); });
    {
      std::lock_guard<std::mutex> lock(mutex_);
      opened_.push_back(streams.first);
    }
    return streams.first;
  }

  StreamHandler handler_for(const std::string& protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stream_handlers_.find(protocol);
    return it == stream_handlers_.end() ? StreamHandler() : it->second;
  }

  void fire_connected(const std::string& peer_id) {
    ConnectionHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = connection_handler_;
    }
    if(handler) handler(peer_id);
  }

  std::vector<std::shared_ptr<PipeStream>> opened_streams() {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
  }

  void set_fail_open(bool fail) { fail_open_ = fail; }

private:
  FakeNetwork& network_;
  std::string peer_id_;
  std::mutex mutex_;
  ConnectionHandler connection_handler_;
  std::map<std::string, StreamHandler> stream_handlers_;
  std::vector<std::shared_ptr<PipeStream>> opened_;
  bool fail_open_ = false;
};

inline void FakeNetwork::add(FakeTransport* transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  transports_[transport->local_peer_id()] = transport;
}

inline FakeTransport* FakeNetwork::find(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transports_.find(peer_id);
  return it == transports_.end() ? nullptr : it->second;
}

inline void FakeNetwork::connect(FakeTransport& a, FakeTransport& b) {
  a.fire_connected(b.local_peer_id());
  b.fire_connected(a.local_peer_id());
}

} // namespace drop::test
