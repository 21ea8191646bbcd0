#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace respc {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// A command is the ordered list of its arguments, name first:
// {"SET", "key", "value"}.  Arguments are raw bytes; nothing here assumes
// they are valid text.

using Command = std::vector<std::string>;

// ── Replies ───────────────────────────────────────────────────────────────────
//
// One decoded RESP reply.  Each tag of the grammar maps to a plain struct and
// Reply wraps them in a std::variant so callers can std::visit over it.

struct Reply;

// "+OK\r\n"
struct SimpleString {
    std::string value;
    bool operator==(const SimpleString&) const = default;
};

// "-ERR wrong type\r\n" – the server rejected this one command.  The
// connection is still usable after receiving it.
struct CommandError {
    std::string message;
    bool operator==(const CommandError&) const = default;
};

// ":42\r\n"
struct Integer {
    int64_t value = 0;
    bool operator==(const Integer&) const = default;
};

// "$5\r\nhello\r\n", or "$-1\r\n" for the null bulk string (nullopt).
struct BulkString {
    std::optional<std::string> value;
    bool operator==(const BulkString&) const = default;

    [[nodiscard]] bool is_null() const noexcept { return !value.has_value(); }
};

// "*2\r\n..." with nested replies, or "*-1\r\n" for the null array (nullopt).
struct Array {
    std::optional<std::vector<Reply>> elements;

    [[nodiscard]] bool is_null() const noexcept { return !elements.has_value(); }
};

struct Reply {
    using Value = std::variant<SimpleString, CommandError, Integer, BulkString, Array>;
    Value value;

    bool operator==(const Reply& other) const;
};

bool operator==(const Array& lhs, const Array& rhs);

// ── Errors ────────────────────────────────────────────────────────────────────
//
// Both are fatal to the connection they were raised on.  A CommandError
// reply is not an exception; it comes back as a Reply value.

// Connection refused, reset, closed mid-frame, timed out, or already closed.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed wire data: unknown tag, unparsable number, broken framing.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Helpers ───────────────────────────────────────────────────────────────────

[[nodiscard]] bool is_error(const Reply& reply) noexcept;

// Short type name for logging: "simple-string", "error", "integer", …
[[nodiscard]] std::string_view reply_type_name(const Reply& reply) noexcept;

// Render a reply for humans the way redis-cli does:
//   OK / "value" / (nil) / (integer) 2 / (error) ERR … / 1) "a"\n2) "b"
[[nodiscard]] std::string format_reply(const Reply& reply);

} // namespace respc
