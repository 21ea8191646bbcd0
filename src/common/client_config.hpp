#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace respc {

// ── ClientConfig ──────────────────────────────────────────────────────────────
// Configuration for one resp-cli run.
// Populated by parse_config() from CLI arguments.

struct ClientConfig {
    std::string host;             // Server host name or address
    uint16_t    port       = 6379; // Server port
    uint32_t    timeout_ms = 0;    // Per-command timeout, 0 = none
    std::string log_level;        // spdlog level string
    bool        demo = false;     // Run the built-in SET/GET/INCR demo sequence
    bool        help = false;     // --help given; nothing else is populated

    // One-shot command (name first); empty means interactive mode.
    std::vector<std::string> command;

    // True when neither a command nor --demo was given.
    [[nodiscard]] bool interactive() const noexcept { return !demo && command.empty(); }
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ClientConfig.
//
// On success: returns a fully validated ClientConfig.
// On --help : returns a config with only `help` set (no validation).
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - port in [1, 65535]
//   - host not empty
//   - log level is one spdlog understands
//   - --demo is not combined with a command
//
// Usage: resp-cli [--host H] [--port P] [--timeout-ms N] [--log-level L]
//                 [--demo | COMMAND [ARG ...]]

[[nodiscard]] ClientConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with resp-cli options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace respc
