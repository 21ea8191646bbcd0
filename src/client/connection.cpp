#include "client/connection.hpp"
#include "protocol/resp_codec.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace respc::client {

using boost::asio::awaitable;

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Unconnected: return "Unconnected";
        case ConnectionState::Connected:   return "Connected";
        case ConnectionState::Closed:      return "Closed";
    }
    return "Unknown";
}

// ── InFlight ──────────────────────────────────────────────────────────────────
//
// Lives for the duration of one exchange.  If the exchange does not reach
// complete() (an exception, or the coroutine frame destroyed while suspended)
// the reply stream is mid-frame and can't be reused, so the connection closes.

class Connection::InFlight {
public:
    explicit InFlight(Connection& conn) noexcept : conn_(conn) {}

    ~InFlight() {
        conn_.disarm_watchdog();
        if (!completed_) {
            conn_.close();
        }
    }

    InFlight(const InFlight&)            = delete;
    InFlight& operator=(const InFlight&) = delete;

    void complete() noexcept { completed_ = true; }

private:
    Connection& conn_;
    bool completed_ = false;
};

// ── Constructor / destructor ──────────────────────────────────────────────────

Connection::Connection(boost::asio::io_context& ioc,
                       ConnectionOptions options,
                       std::shared_ptr<spdlog::logger> logger)
    : strand_(boost::asio::make_strand(ioc)),
      options_(options),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      mutex_(strand_),
      watchdog_(strand_) {}

Connection::~Connection() {
    if (socket_) {
        network::close_socket(*socket_);
    }
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

awaitable<void> Connection::connect(const std::string& host, uint16_t port) {
    if (is_connected()) {
        throw std::logic_error(fmt::format("already connected to {}", peer_));
    }

    // Wait out any command still unwinding on the old stream.
    if (!co_await mutex_.lock()) {
        throw TransportError(fmt::format("connect to {}:{} aborted", host, port));
    }
    AsyncMutex::Guard guard(mutex_);

    if (is_connected()) {
        throw std::logic_error(fmt::format("already connected to {}", peer_));
    }

    boost::system::error_code ec;
    auto socket = co_await network::connect_tcp(strand_, host, port, ec);
    if (ec) {
        logger_->warn("Connection: connect to {}:{} failed: {}", host, port, ec.message());
        throw TransportError(fmt::format("connect to {}:{} failed: {}", host, port, ec.message()));
    }

    adopt(std::move(socket), fmt::format("{}:{}", host, port));
}

void Connection::attach(network::Socket socket, std::string peer) {
    if (is_connected()) {
        throw std::logic_error(fmt::format("already connected to {}", peer_));
    }
    if (mutex_.locked()) {
        throw std::logic_error("cannot attach a stream while a command is in flight");
    }
    if (!socket.is_open()) {
        throw std::invalid_argument("attach() needs an open socket");
    }
    adopt(std::move(socket), std::move(peer));
}

void Connection::adopt(network::Socket socket, std::string peer) {
    reader_.reset();
    socket_ = std::make_unique<network::Socket>(std::move(socket));
    reader_ = std::make_unique<protocol::StreamReader<network::Socket>>(*socket_);
    peer_   = std::move(peer);
    set_state(ConnectionState::Connected);
}

void Connection::close() {
    // The socket object stays alive: a suspended read may still refer to it.
    if (socket_) {
        network::close_socket(*socket_);
    }
    watchdog_.cancel();
    mutex_.abort_waiters();

    if (state() == ConnectionState::Connected) {
        set_state(ConnectionState::Closed);
    }
}

void Connection::ensure_connected() const {
    switch (state()) {
        case ConnectionState::Connected:
            return;
        case ConnectionState::Unconnected:
            throw TransportError("not connected");
        case ConnectionState::Closed:
            throw TransportError(fmt::format("connection to {} is closed", peer_));
    }
}

// ── State helper ──────────────────────────────────────────────────────────────

void Connection::set_state(ConnectionState s) {
    const auto prev = state_.exchange(s, std::memory_order_acq_rel);
    if (prev == s) return; // no change

    logger_->info("Connection [{}] state {} → {}", peer_, to_string(prev), to_string(s));
}

// ── Watchdog ──────────────────────────────────────────────────────────────────

void Connection::arm_watchdog(uint64_t seq) {
    timed_out_ = false;
    if (options_.command_timeout.count() <= 0) {
        return;
    }

    watchdog_seq_ = seq;
    watchdog_.expires_after(options_.command_timeout);
    watchdog_.async_wait(
        [weak = weak_from_this(), seq](const boost::system::error_code& ec) {
            if (ec) return; // cancelled: the command finished in time
            auto self = weak.lock();
            // A handler already queued when the command finished must not fire.
            if (!self || self->watchdog_seq_ != seq) return;

            self->logger_->warn("Connection [{}] command timed out after {}ms, closing",
                                self->peer_, self->options_.command_timeout.count());
            self->timed_out_ = true;
            // Fails the pending read or write; send() turns that into a timeout.
            network::close_socket(*self->socket_);
        });
}

void Connection::disarm_watchdog() {
    watchdog_seq_ = 0;
    watchdog_.cancel();
}

// ── Commands ──────────────────────────────────────────────────────────────────

awaitable<Reply> Connection::send(Command cmd) {
    // Keep the connection alive for as long as this frame exists.
    const auto self = shared_from_this();

    const std::string request = protocol::encode_request(cmd);
    ensure_connected();

    if (!co_await mutex_.lock()) {
        throw TransportError(fmt::format(
            "connection to {} closed while '{}' was queued", peer_, cmd.front()));
    }
    AsyncMutex::Guard guard(mutex_);

    // Closed while we were queued?
    ensure_connected();

    InFlight in_flight(*this);
    arm_watchdog(++command_seq_);

    logger_->trace("Connection [{}] → {} ({} args, {} bytes)",
                   peer_, cmd.front(), cmd.size(), request.size());

    Reply reply;
    try {
        boost::system::error_code ec;
        co_await boost::asio::async_write(
            *socket_, boost::asio::buffer(request),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            throw TransportError(fmt::format("write failed: {}", ec.message()));
        }
        reply = co_await protocol::decode_reply(*reader_);
    } catch (const ProtocolError& e) {
        logger_->warn("Connection [{}] protocol error, closing: {}", peer_, e.what());
        throw;
    } catch (const TransportError& e) {
        if (timed_out_) {
            throw TransportError(fmt::format(
                "'{}' timed out after {}ms", cmd.front(), options_.command_timeout.count()));
        }
        logger_->warn("Connection [{}] transport error, closing: {}", peer_, e.what());
        throw;
    }

    in_flight.complete();
    logger_->trace("Connection [{}] ← {}", peer_, reply_type_name(reply));
    co_return reply;
}

awaitable<Reply> Connection::get(std::string key) {
    Command cmd{"GET", std::move(key)};
    co_return co_await send(std::move(cmd));
}

awaitable<Reply> Connection::set(std::string key, std::string value) {
    Command cmd{"SET", std::move(key), std::move(value)};
    co_return co_await send(std::move(cmd));
}

awaitable<Reply> Connection::incr(std::string key) {
    Command cmd{"INCR", std::move(key)};
    co_return co_await send(std::move(cmd));
}

} // namespace respc::client
