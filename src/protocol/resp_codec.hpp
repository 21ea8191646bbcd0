#pragma once

#include "protocol/reply.hpp"
#include "protocol/stream_reader.hpp"

#include <boost/asio/awaitable.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace respc::protocol {

// Limits applied while decoding.  The byte limits match the defaults a Redis
// server enforces on its own input.
inline constexpr int64_t     kMaxBulkBytes     = 512ll * 1024 * 1024; // 512 MiB
inline constexpr int64_t     kMaxArrayElements = 2147483647ll;        // 2^31 - 1
inline constexpr std::size_t kMaxNestingDepth  = 128;
// How many bytes after an unknown tag to quote in the error.
inline constexpr std::size_t kSnippetBytes     = 32;

// ── Request encoder ──────────────────────────────────────────────────────────

// Serialize a command as a RESP multi-bulk request:
//   *<argc>\r\n  then per argument  $<byte-length>\r\n<bytes>\r\n
// Throws std::invalid_argument if `cmd` is empty.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string encode_request(const Command& cmd);

// ── Reply encoder ────────────────────────────────────────────────────────────

// Serialize a Reply into RESP wire format (the server's direction).
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string encode_reply(const Reply& reply);

// ── Reply decoder ────────────────────────────────────────────────────────────

// Parse a RESP decimal field ("42", "-1", "+7").  Throws ProtocolError naming
// `field` if `text` is empty, has stray characters, or overflows int64.
[[nodiscard]] int64_t parse_integer(std::string_view text, std::string_view field);

namespace detail {

// Render bytes for an error message: printable ASCII as-is, the rest escaped.
[[nodiscard]] std::string printable(std::string_view bytes);

template <typename AsyncReadStream>
boost::asio::awaitable<Reply> decode_at_depth(StreamReader<AsyncReadStream>& reader,
                                              std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        throw ProtocolError(fmt::format(
            "reply nesting deeper than {} levels", kMaxNestingDepth));
    }

    const std::string tag_byte = co_await reader.read_exact(1);
    const char tag = tag_byte[0];

    switch (tag) {
        case '+': {
            // Simple string.
            std::string line = co_await reader.read_line();
            co_return Reply{SimpleString{std::move(line)}};
        }
        case '-': {
            // Error reply: a value for the caller, not a failure of ours.
            std::string line = co_await reader.read_line();
            co_return Reply{CommandError{std::move(line)}};
        }
        case ':': {
            // Integer.
            const std::string line = co_await reader.read_line();
            co_return Reply{Integer{parse_integer(line, "integer reply")}};
        }
        case '$': {
            // Bulk string.
            const std::string line = co_await reader.read_line();
            const int64_t len = parse_integer(line, "bulk length");
            if (len == -1) {
                co_return Reply{BulkString{std::nullopt}};  // null bulk string
            }
            if (len < 0 || len > kMaxBulkBytes) {
                throw ProtocolError(fmt::format("invalid bulk length {}", len));
            }
            std::string data = co_await reader.read_exact(static_cast<std::size_t>(len));
            const std::string trailer = co_await reader.read_exact(2);
            if (trailer != "\r\n") {
                throw ProtocolError(fmt::format(
                    "bulk string of {} bytes not followed by CRLF (got '{}')",
                    len, printable(trailer)));
            }
            co_return Reply{BulkString{std::move(data)}};
        }
        case '*': {
            // Array.
            const std::string line = co_await reader.read_line();
            const int64_t count = parse_integer(line, "array length");
            if (count == -1) {
                co_return Reply{Array{std::nullopt}};  // null array
            }
            if (count < 0 || count > kMaxArrayElements) {
                throw ProtocolError(fmt::format("invalid array length {}", count));
            }
            std::vector<Reply> elements;
            // Don't trust the peer's count for the allocation.
            elements.reserve(static_cast<std::size_t>(std::min<int64_t>(count, 1024)));
            for (int64_t i = 0; i < count; ++i) {
                Reply element = co_await decode_at_depth(reader, depth + 1);
                elements.push_back(std::move(element));
            }
            co_return Reply{Array{std::move(elements)}};
        }
        default:
            throw ProtocolError(fmt::format(
                "unknown RESP type tag '{}', followed by '{}'",
                printable(tag_byte), printable(reader.snippet(kSnippetBytes))));
    }
}

} // namespace detail

// Decode exactly one reply from `reader`, leaving it positioned at the first
// byte of the next reply.
//
// A "-" reply is returned as a CommandError value.  Malformed input throws
// ProtocolError; end-of-stream or a transport failure throws TransportError.
// After either exception the stream position is unknown.
template <typename AsyncReadStream>
[[nodiscard]] boost::asio::awaitable<Reply> decode_reply(StreamReader<AsyncReadStream>& reader) {
    co_return co_await detail::decode_at_depth(reader, 0);
}

} // namespace respc::protocol
