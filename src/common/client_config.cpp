#include "common/client_config.hpp"
#include "common/logger.hpp"

#include <fmt/format.h>

#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace respc {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Parse an unsigned integer that must fit T.  Rejects signs, stray
// characters and out-of-range values with std::runtime_error.
template <typename T>
[[nodiscard]] T parse_uint(std::string_view sv, std::string_view field_name) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw std::runtime_error(
            fmt::format("{} out of range: '{}'", field_name, sv));
    }
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            fmt::format("Invalid integer for {}: '{}'", field_name, sv));
    }
    return value;
}

// Validate the fully populated ClientConfig.
void validate(const ClientConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (!is_known_log_level(cfg.log_level)) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace, debug, info, warn, error, "
                        "critical, off; got '{}'", cfg.log_level));
    }
    if (cfg.demo && !cfg.command.empty()) {
        throw std::runtime_error("--demo cannot be combined with a command");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Server host")
        ("port,p",
            po::value<std::string>()->default_value("6379"),
            "Server port")
        ("timeout-ms,t",
            po::value<std::string>()->default_value("0"),
            "Per-command timeout in milliseconds (0 = wait forever)")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace, debug, info, warn, error, critical, off")
        ("demo",
            "Run the SET/GET/INCR demo sequence and exit");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ClientConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("resp-cli options");
    add_options(desc);

    // Everything after the options is the command to run.
    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "Command and arguments");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ClientConfig cfg;
    if (vm.count("help")) {
        cfg.help = true;
        return cfg;
    }

    cfg.host       = vm["host"].as<std::string>();
    cfg.port       = parse_uint<uint16_t>(vm["port"].as<std::string>(), "--port");
    cfg.timeout_ms = parse_uint<uint32_t>(vm["timeout-ms"].as<std::string>(), "--timeout-ms");
    cfg.log_level  = vm["log-level"].as<std::string>();
    cfg.demo       = vm.count("demo") > 0;
    if (vm.count("command")) {
        cfg.command = vm["command"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace respc
