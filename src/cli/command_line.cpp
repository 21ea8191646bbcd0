#include "cli/command_line.hpp"

#include <utility>

namespace respc::cli {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t'; }

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::optional<std::vector<std::string>> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::size_t i = 0;

    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        if (i == line.size()) break;

        std::string word;
        const char quote = line[i];

        if (quote == '"' || quote == '\'') {
            ++i;
            bool closed = false;
            while (i < line.size()) {
                const char c = line[i];
                if (c == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                if (quote == '"' && c == '\\' && i + 1 < line.size()) {
                    const char e = line[i + 1];
                    if (e == 'x' && i + 3 < line.size() &&
                        hex_value(line[i + 2]) >= 0 && hex_value(line[i + 3]) >= 0) {
                        word.push_back(static_cast<char>(
                            hex_value(line[i + 2]) * 16 + hex_value(line[i + 3])));
                        i += 4;
                        continue;
                    }
                    switch (e) {
                        case 'n': word.push_back('\n'); break;
                        case 'r': word.push_back('\r'); break;
                        case 't': word.push_back('\t'); break;
                        default:  word.push_back(e);    break;
                    }
                    i += 2;
                    continue;
                }
                word.push_back(c);
                ++i;
            }
            // The closing quote must end the word.
            if (!closed || (i < line.size() && !is_space(line[i]))) {
                return std::nullopt;
            }
        } else {
            while (i < line.size() && !is_space(line[i])) {
                word.push_back(line[i]);
                ++i;
            }
        }

        words.push_back(std::move(word));
    }

    return words;
}

} // namespace respc::cli
