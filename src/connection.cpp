#include "connection.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cstring>
#include <future>

std::shared_ptr<Connection> Connection::create(asio::io_context& io,
                                               asio::ip::tcp::socket sock,
                                               std::chrono::milliseconds timeout)
{
    auto c = std::shared_ptr<Connection>(new Connection(io, std::move(sock), timeout));
    std::error_code ec;
    auto ep = c->socket_.remote_endpoint(ec);
    if(!ec){
        c->remote_endpoint_ = ep;
        c->remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
    return c;
}

std::shared_ptr<Connection> Connection::dial(asio::io_context& io,
                                             const asio::ip::tcp::endpoint& endpoint,
                                             std::chrono::milliseconds timeout)
{
    auto c = create(io, asio::ip::tcp::socket(io), timeout);
    c->connect(endpoint);
    return c;
}

void Connection::connect(const asio::ip::tcp::endpoint& endpoint){
    remote_endpoint_ = endpoint;
    remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    auto self = shared_from_this();
    try {
        run_with_deadline([self, endpoint](Completion done){
            self->socket_.async_connect(endpoint, [done](std::error_code ec){ done(ec, 0); });
        }, "connect");
    } catch(const IOError& e){
        throw ConnectionError(std::string("dial ") + e.what());
    }
    run_on_io([self]{
        std::error_code ignored;
        self->socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
    });
}

Connection::Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::chrono::milliseconds timeout)
: io_(io), socket_(std::move(sock)), timeout_(timeout)
{
}

Connection::~Connection(){
    std::error_code ignored;
    socket_.close(ignored);
}

void Connection::run_on_io(std::function<void()> fn){
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    asio::post(io_, [fn, done]{
        fn();
        done->set_value();
    });
    if(fut.wait_for(timeout_) == std::future_status::timeout){
        throw ConnectionError("stream " + remote_address_ + ": io thread did not respond");
    }
}

std::size_t Connection::run_with_deadline(std::function<void(Completion)> initiate, const char* what){
    if(aborted_){
        throw ConnectionError(std::string(what) + " " + remote_address_ + ": stream closed");
    }
    using Result = std::pair<std::error_code, std::size_t>;
    auto promise = std::make_shared<std::promise<Result>>();
    auto fut = promise->get_future();
    auto self = shared_from_this();
    asio::post(io_, [self, initiate, promise]{
        initiate([promise](std::error_code ec, std::size_t n){
            promise->set_value(Result{ec, n});
        });
    });

    bool expired = fut.wait_for(timeout_) == std::future_status::timeout;
    if(expired){
        asio::post(io_, [self]{
            std::error_code ignored;
            self->socket_.cancel(ignored);
        });
    }
    // The operation owns caller memory until its handler has run.
    auto result = fut.get();
    if(expired){
        throw ConnectionError(std::string(what) + " " + remote_address_ + ": deadline exceeded");
    }
    if(result.first == asio::error::eof) return 0;
    if(result.first){
        if(aborted_){
            throw ConnectionError(std::string(what) + " " + remote_address_ + ": stream closed");
        }
        throw IOError(std::string(what) + " " + remote_address_ + ": " + result.first.message());
    }
    return result.second;
}

void Connection::write(const char* data, std::size_t size){
    if(size == 0) return;
    auto self = shared_from_this();
    run_with_deadline([self, data, size](Completion done){
        asio::async_write(self->socket_, asio::buffer(data, size), done);
    }, "write");
}

std::size_t Connection::read_some(char* data, std::size_t size){
    if(size == 0) return 0;
    if(read_buf_.size() > 0){
        auto n = std::min(size, read_buf_.size());
        std::memcpy(data, read_buf_.data().data(), n);
        read_buf_.consume(n);
        return n;
    }
    auto self = shared_from_this();
    return run_with_deadline([self, data, size](Completion done){
        self->socket_.async_read_some(asio::buffer(data, size), done);
    }, "read");
}

std::size_t Connection::fill_buffer(){
    auto self = shared_from_this();
    auto space = read_buf_.prepare(4096);
    auto n = run_with_deadline([self, space](Completion done){
        self->socket_.async_read_some(space, done);
    }, "read");
    read_buf_.commit(n);
    return n;
}

std::string Connection::read_line(std::size_t limit){
    std::size_t scanned = 0;
    for(;;){
        auto bytes = read_buf_.data();
        const char* begin = static_cast<const char*>(bytes.data());
        const char* end = begin + bytes.size();
        const char* nl = std::find(begin + scanned, end, '\n');
        if(nl != end){
            std::string line(begin, nl);
            read_buf_.consume(line.size() + 1);
            return line;
        }
        scanned = bytes.size();
        if(scanned > limit){
            throw IOError("line from " + remote_address_ + " exceeds " + std::to_string(limit) + " bytes");
        }
        if(fill_buffer() == 0){
            auto remaining = read_buf_.data();
            std::string rest(static_cast<const char*>(remaining.data()), remaining.size());
            read_buf_.consume(rest.size());
            return rest;
        }
    }
}

void Connection::close_write(){
    if(aborted_) return;
    auto self = shared_from_this();
    run_on_io([self]{
        std::error_code ignored;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
    });
}

void Connection::close(){
    if(aborted_.exchange(true)) return;
    auto self = shared_from_this();
    run_on_io([self]{
        std::error_code ignored;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        self->socket_.close(ignored);
    });
}

void Connection::abort(){
    if(aborted_.exchange(true)) return;
    auto self = shared_from_this();
    asio::post(io_, [self]{
        std::error_code ignored;
        self->socket_.cancel(ignored);
        // Zero linger makes close() send RST.
        self->socket_.set_option(asio::socket_base::linger(true, 0), ignored);
        self->socket_.close(ignored);
    });
}
