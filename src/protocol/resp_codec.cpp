#include "protocol/resp_codec.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace respc::protocol {

namespace {

void append_bulk(std::string& out, std::string_view s) {
    out += '$';
    out += std::to_string(s.size());
    out += "\r\n";
    out.append(s.data(), s.size());
    out += "\r\n";
}

// Simple strings and errors are line-delimited, so they cannot carry CR/LF.
void append_line(std::string& out, char tag, std::string_view s) {
    if (s.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument(
            fmt::format("'{}' reply must not contain CR or LF", tag));
    }
    out += tag;
    out.append(s.data(), s.size());
    out += "\r\n";
}

void append_reply(std::string& out, const Reply& reply) {
    std::visit(
        [&out](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                append_line(out, '+', r.value);
            } else if constexpr (std::is_same_v<T, CommandError>) {
                append_line(out, '-', r.message);
            } else if constexpr (std::is_same_v<T, Integer>) {
                out += ':';
                out += std::to_string(r.value);
                out += "\r\n";
            } else if constexpr (std::is_same_v<T, BulkString>) {
                if (r.is_null()) {
                    out += "$-1\r\n";  // null bulk string
                } else {
                    append_bulk(out, *r.value);
                }
            } else if constexpr (std::is_same_v<T, Array>) {
                if (r.is_null()) {
                    out += "*-1\r\n";  // null array
                    return;
                }
                out += '*';
                out += std::to_string(r.elements->size());
                out += "\r\n";
                for (const auto& element : *r.elements) {
                    append_reply(out, element);
                }
            }
        },
        reply.value);
}

} // anonymous namespace

namespace detail {

std::string printable(std::string_view bytes) {
    std::string out;
    for (const char c : bytes) {
        const auto u = static_cast<unsigned char>(c);
        if (c == '\r') {
            out += "\\r";
        } else if (c == '\n') {
            out += "\\n";
        } else if (u < 0x20 || u >= 0x7f) {
            out += fmt::format("\\x{:02x}", u);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace detail

// ── Encoders ─────────────────────────────────────────────────────────────────

std::string encode_request(const Command& cmd) {
    if (cmd.empty()) {
        throw std::invalid_argument("command must have at least one argument");
    }

    std::size_t size = 16;
    for (const auto& arg : cmd) {
        size += arg.size() + 16;
    }

    std::string out;
    out.reserve(size);
    out += '*';
    out += std::to_string(cmd.size());
    out += "\r\n";
    for (const auto& arg : cmd) {
        append_bulk(out, arg);
    }
    return out;
}

std::string encode_reply(const Reply& reply) {
    std::string out;
    append_reply(out, reply);
    return out;
}

// ── Numeric fields ───────────────────────────────────────────────────────────

int64_t parse_integer(std::string_view text, std::string_view field) {
    std::string_view digits = text;
    // from_chars takes '-' but not '+'.
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-') {
            digits = {};
        }
    }

    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw ProtocolError(fmt::format("invalid {}: '{}'", field, detail::printable(text)));
    }
    return value;
}

} // namespace respc::protocol
