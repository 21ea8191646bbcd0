#pragma once

#include "protocol/reply.hpp"

#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace respc::protocol {

// Longest line accepted before the peer is considered broken.
inline constexpr std::size_t kMaxLineBytes = 64u * 1024u;

// Capacity the read buffer may keep once it drains.  Anything above is
// handed back, so one huge bulk reply doesn't pin its memory for the
// lifetime of the connection.
inline constexpr std::size_t kRetainedBufferBytes = 4u * kMaxLineBytes;

// Turn a failed read into a TransportError ("connection closed by peer" for
// eof, "read failed: ..." otherwise).
[[noreturn]] void throw_read_error(const boost::system::error_code& ec);

// ── StreamReader ──────────────────────────────────────────────────────────────
//
// Buffered reads over a Boost.Asio AsyncReadStream (a socket in production,
// an in-memory stream in tests).  Serves the two primitives the RESP grammar
// needs:
//
//   read_line()      – bytes up to '\n', minus "\r\n" (or a bare '\n')
//   read_exact(n)    – exactly n bytes, delimiters included
//
// Both sit on asio::async_read_until / asio::async_read with a dynamic_buffer
// over one persistent std::string, so bytes past the end of one reply stay
// buffered for the next call.  Short reads are absorbed by Asio; only
// end-of-stream or a transport error before the request is satisfied throws
// TransportError.
//
// Not thread-safe: one reader per stream, used from a single strand.

template <typename AsyncReadStream>
class StreamReader {
public:
    explicit StreamReader(AsyncReadStream& stream) : stream_(stream) {}

    StreamReader(const StreamReader&)            = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    // Read one line.  Throws TransportError if the stream ends first and
    // ProtocolError if no '\n' shows up within kMaxLineBytes.
    [[nodiscard]] boost::asio::awaitable<std::string> read_line() {
        // Reads never take the buffer past max_size, so a full buffer without
        // a '\n' in it comes back as not_found.
        boost::system::error_code ec;
        const std::size_t n = co_await boost::asio::async_read_until(
            stream_, boost::asio::dynamic_buffer(buf_, kMaxLineBytes), '\n',
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec == boost::asio::error::not_found) {
            throw ProtocolError(fmt::format(
                "line exceeds {} bytes without a terminator", kMaxLineBytes));
        }
        if (ec) {
            throw_read_error(ec);
        }

        // n includes the '\n'
        std::size_t len = n - 1;
        if (len > 0 && buf_[len - 1] == '\r') {
            --len;
        }
        std::string line = buf_.substr(0, len);
        consume(n);
        co_return line;
    }

    // Read exactly `count` bytes.  Throws TransportError if the stream ends
    // first.
    [[nodiscard]] boost::asio::awaitable<std::string> read_exact(std::size_t count) {
        if (buf_.size() < count) {
            boost::system::error_code ec;
            co_await boost::asio::async_read(
                stream_, boost::asio::dynamic_buffer(buf_),
                boost::asio::transfer_exactly(count - buf_.size()),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                throw_read_error(ec);
            }
        }

        std::string data = buf_.substr(0, count);
        consume(count);
        co_return data;
    }

    // Up to `max` bytes that have already arrived, topping the buffer up
    // from the stream without waiting.  Best effort: used only to attach
    // context to protocol errors.
    [[nodiscard]] std::string_view snippet(std::size_t max) {
        if (buf_.size() < max) {
            boost::system::error_code ec;
            const std::size_t ready = stream_.available(ec);
            if (!ec && ready > 0) {
                std::string extra(std::min(ready, max - buf_.size()), '\0');
                const std::size_t n = stream_.read_some(boost::asio::buffer(extra), ec);
                buf_.append(extra, 0, n);
            }
        }
        return buffered(max);
    }

    // Up to `max` bytes that are already buffered, without touching the stream.
    [[nodiscard]] std::string_view buffered(std::size_t max) const noexcept {
        return std::string_view{buf_}.substr(0, std::min(max, buf_.size()));
    }

    [[nodiscard]] std::size_t buffered_size() const noexcept { return buf_.size(); }

    [[nodiscard]] std::size_t buffer_capacity() const noexcept { return buf_.capacity(); }

    // Drop everything buffered (after a framing desync or a reconnect).
    void reset() {
        buf_.clear();
        buf_.shrink_to_fit();
    }

private:
    void consume(std::size_t n) {
        buf_.erase(0, n);
        if (buf_.empty() && buf_.capacity() > kRetainedBufferBytes) {
            buf_.shrink_to_fit();
        }
    }

    AsyncReadStream& stream_;
    std::string      buf_;
};

} // namespace respc::protocol
