#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "transport.hpp"

// One TCP connection carrying one logical stream. Every socket operation runs
// on the io_context thread; the calling thread blocks on the result until the
// stream deadline and cancels the operation when it passes.
class Connection : public Stream, public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> create(asio::io_context& io,
                                              asio::ip::tcp::socket sock,
                                              std::chrono::milliseconds timeout);

    // Throws ConnectionError if the endpoint does not answer before the deadline.
    static std::shared_ptr<Connection> dial(asio::io_context& io,
                                            const asio::ip::tcp::endpoint& endpoint,
                                            std::chrono::milliseconds timeout);

    ~Connection() override;

    // Connects a socket made by create(). Throws ConnectionError.
    void connect(const asio::ip::tcp::endpoint& endpoint);

    void write(const char* data, std::size_t size) override;
    using Stream::write;
    std::size_t read_some(char* data, std::size_t size) override;
    void close_write() override;
    void close() override;
    const std::string& protocol() const override { return protocol_; }

    void set_protocol(std::string protocol) { protocol_ = std::move(protocol); }

    // Reads through the next '\n' (not returned). At EOF returns what arrived,
    // possibly empty. Throws IOError once more than limit bytes arrive without one.
    std::string read_line(std::size_t limit);

    // Cancels pending work and resets the connection. Later calls throw.
    void abort() override;

    const std::string& remote_address() const { return remote_address_; }
    const asio::ip::tcp::endpoint& remote_endpoint() const { return remote_endpoint_; }

private:
    Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::chrono::milliseconds timeout);

    using Completion = std::function<void(std::error_code, std::size_t)>;
    std::size_t run_with_deadline(std::function<void(Completion)> initiate, const char* what);
    void run_on_io(std::function<void()> fn);
    std::size_t fill_buffer();

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    asio::streambuf read_buf_;
    std::string protocol_;
    std::string remote_address_;
    asio::ip::tcp::endpoint remote_endpoint_;
    std::atomic<bool> aborted_{false};
};
