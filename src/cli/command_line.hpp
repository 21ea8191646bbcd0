#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respc::cli {

// Split one line of REPL input into command words.
//
// Words are separated by spaces or tabs.  Double quotes group a word that
// contains spaces and understand the escapes \" \\ \n \r \t and \xHH, so
// binary arguments can be typed:   SET "my key" "line1\nline2"
// Single quotes group a word verbatim.
//
// Returns nullopt on an unterminated quote or a quote glued to the next word.
[[nodiscard]] std::optional<std::vector<std::string>> split_words(std::string_view line);

} // namespace respc::cli
