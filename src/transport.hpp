#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

// One logical, ordered byte stream to a remote peer. Calls block until the
// operation completes or its deadline passes; failures throw ConnectionError
// or IOError.
class Stream {
public:
  virtual ~Stream() = default;

  virtual void write(const char* data, std::size_t size) = 0;
  void write(const std::string& data) { write(data.data(), data.size()); }

  // Returns 0 once the remote has finished writing.
  virtual std::size_t read_some(char* data, std::size_t size) = 0;

  // Tells the remote we are done writing; reads stay open.
  virtual void close_write() = 0;
  virtual void close() = 0;
  // Drops the stream so the remote's next read fails instead of seeing a
  // clean end of stream.
  virtual void abort() = 0;

  virtual const std::string& protocol() const = 0;
};

// Everything the drop protocol needs from the network: connection
// notifications, named streams in both directions, and the identity of the
// peer on the other end.
class PeerTransport {
public:
  using ConnectionHandler = std::function<void(const std::string& peer_id)>;
  using StreamHandler = std::function<void(std::shared_ptr<Stream> stream,
                                           const std::string& peer_id)>;

  virtual ~PeerTransport() = default;

  virtual const std::string& local_peer_id() const = 0;

  virtual void set_connection_handler(ConnectionHandler handler) = 0;
  virtual void set_stream_handler(const std::string& protocol, StreamHandler handler) = 0;

  // Throws ConnectionError when the peer is unknown or unreachable.
  virtual std::shared_ptr<Stream> open_stream(const std::string& peer_id,
                                              const std::string& protocol) = 0;
};
