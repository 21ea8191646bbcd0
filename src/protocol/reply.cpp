#include "protocol/reply.hpp"

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <variant>

namespace respc {

bool operator==(const Array& lhs, const Array& rhs) {
    return lhs.elements == rhs.elements;
}

bool Reply::operator==(const Reply& other) const {
    return value == other.value;
}

bool is_error(const Reply& reply) noexcept {
    return std::holds_alternative<CommandError>(reply.value);
}

std::string_view reply_type_name(const Reply& reply) noexcept {
    return std::visit(
        [](const auto& r) -> std::string_view {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                return "simple-string";
            } else if constexpr (std::is_same_v<T, CommandError>) {
                return "error";
            } else if constexpr (std::is_same_v<T, Integer>) {
                return "integer";
            } else if constexpr (std::is_same_v<T, BulkString>) {
                return r.is_null() ? "null-bulk-string" : "bulk-string";
            } else if constexpr (std::is_same_v<T, Array>) {
                return r.is_null() ? "null-array" : "array";
            }
        },
        reply.value);
}

namespace {

// Quote a bulk payload, escaping bytes that would garble a terminal.
std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\a': out += "\\a";  break;
            case '\b': out += "\\b";  break;
            default: {
                const auto u = static_cast<unsigned char>(c);
                if (u < 0x20 || u >= 0x7f) {
                    out += fmt::format("\\x{:02x}", u);
                } else {
                    out.push_back(c);
                }
            }
        }
    }
    out.push_back('"');
    return out;
}

// Nested array items are indented to line up under their parent's "N) ".
std::string format_indented(const Reply& reply, std::size_t indent) {
    return std::visit(
        [indent](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                return r.value;
            } else if constexpr (std::is_same_v<T, CommandError>) {
                return "(error) " + r.message;
            } else if constexpr (std::is_same_v<T, Integer>) {
                return fmt::format("(integer) {}", r.value);
            } else if constexpr (std::is_same_v<T, BulkString>) {
                return r.is_null() ? std::string{"(nil)"} : quote(*r.value);
            } else if constexpr (std::is_same_v<T, Array>) {
                if (r.is_null()) return "(nil)";
                if (r.elements->empty()) return "(empty array)";

                const auto& items = *r.elements;
                const std::size_t width = std::to_string(items.size()).size();
                std::string out;
                for (std::size_t i = 0; i < items.size(); ++i) {
                    const std::string prefix =
                        fmt::format("{:>{}}) ", i + 1, width);
                    if (i > 0) {
                        out += '\n';
                        out.append(indent, ' ');
                    }
                    out += prefix;
                    out += format_indented(items[i], indent + prefix.size());
                }
                return out;
            }
        },
        reply.value);
}

} // anonymous namespace

std::string format_reply(const Reply& reply) {
    return format_indented(reply, 0);
}

} // namespace respc
