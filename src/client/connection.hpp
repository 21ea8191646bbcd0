#pragma once

#include "client/async_mutex.hpp"
#include "network/socket.hpp"
#include "protocol/reply.hpp"
#include "protocol/stream_reader.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace respc::client {

// ── ConnectionState ───────────────────────────────────────────────────────────

enum class ConnectionState : uint8_t {
    Unconnected = 0,
    Connected   = 1,
    Closed      = 2,
};

[[nodiscard]] const char* to_string(ConnectionState state) noexcept;

struct ConnectionOptions {
    // Upper bound on one command's write + reply.  Zero waits forever.
    std::chrono::milliseconds command_timeout{0};
};

// ── Connection ────────────────────────────────────────────────────────────────
//
// One RESP connection to one server.
//
// Every command is one atomic exchange: encode → write → flush → decode one
// reply.  Concurrent callers are serialized by an AsyncMutex around that
// exchange, so their frames never interleave and each caller gets the reply
// to its own request.
//
// Failure policy:
//   - a "-" reply comes back as a CommandError value; the connection stays up
//   - TransportError / ProtocolError, a timeout, or a command abandoned
//     mid-flight close the connection; later commands throw TransportError
//     until connect() is called again.  There is no automatic reconnect.
//
// Must be owned by a std::shared_ptr (in-flight commands keep it alive).
// All coroutines must run on strand():
//
//   asio::co_spawn(conn->strand(), [conn]() -> asio::awaitable<void> {
//       co_await conn->connect("127.0.0.1", 6379);
//       auto reply = co_await conn->set("first", "1");
//   }, asio::detached);

class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    // Constructor.
    //   ioc      – shared io_context (owned by the application)
    //   options  – per-command timeout
    //   logger   – defaults to spdlog's default logger
    explicit Connection(boost::asio::io_context& ioc,
                        ConnectionOptions options = {},
                        std::shared_ptr<spdlog::logger> logger = {});

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&)                 = delete;
    Connection& operator=(Connection&&)      = delete;

    ~Connection();

    // ── Lifecycle ─────────────────────────────────────────────────────────────

    // Open a TCP connection to host:port.  Valid when Unconnected or Closed;
    // throws std::logic_error when already Connected and TransportError when
    // the server cannot be reached (the state is then left unchanged).
    boost::asio::awaitable<void> connect(const std::string& host, uint16_t port);

    // Adopt an already-connected socket supplied by the caller.  Same state
    // rules as connect(); also throws std::logic_error while a command is in
    // flight and std::invalid_argument if `socket` is not open.
    void attach(network::Socket socket, std::string peer = "<attached>");

    // Close the socket.  In-flight and queued commands fail with
    // TransportError.  Idempotent.
    void close();

    // ── State ────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_connected() const noexcept {
        return state() == ConnectionState::Connected;
    }

    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

    [[nodiscard]] Strand& strand() noexcept { return strand_; }

    // ── Commands ─────────────────────────────────────────────────────────────

    // Send any command and return its reply.  Throws std::invalid_argument
    // for an empty command (without touching the connection).
    [[nodiscard]] boost::asio::awaitable<Reply> send(Command cmd);

    // GET key
    [[nodiscard]] boost::asio::awaitable<Reply> get(std::string key);

    // SET key value
    [[nodiscard]] boost::asio::awaitable<Reply> set(std::string key, std::string value);

    // INCR key
    [[nodiscard]] boost::asio::awaitable<Reply> incr(std::string key);

private:
    // Closes the connection unless the command it guards completes.
    class InFlight;

    // Throw TransportError unless Connected.
    void ensure_connected() const;

    // Install `socket` as the live socket and go to Connected.
    void adopt(network::Socket socket, std::string peer);

    // Start / stop the per-command deadline for command number `seq`.
    void arm_watchdog(uint64_t seq);
    void disarm_watchdog();

    // Update state_ and log the transition.
    void set_state(ConnectionState s);

    // ── Data members ──────────────────────────────────────────────────────────

    Strand                    strand_;
    ConnectionOptions         options_;
    std::shared_ptr<spdlog::logger> logger_;

    // Heap-allocated so a read still suspended on a closed socket keeps a
    // valid object until the next connect() replaces it.
    std::unique_ptr<network::Socket>                         socket_;
    std::unique_ptr<protocol::StreamReader<network::Socket>> reader_;
    std::string                                              peer_;

    AsyncMutex                mutex_;
    boost::asio::steady_timer watchdog_;
    uint64_t                  command_seq_  = 0;
    uint64_t                  watchdog_seq_ = 0; // command the watchdog is armed for
    bool                      timed_out_   = false;

    std::atomic<ConnectionState> state_{ConnectionState::Unconnected};
};

} // namespace respc::client
