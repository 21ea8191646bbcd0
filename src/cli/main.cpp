#include "cli/command_line.hpp"
#include "client/connection.hpp"
#include "common/client_config.hpp"
#include "common/logger.hpp"
#include "protocol/reply.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

namespace asio = boost::asio;

using respc::client::Connection;

namespace {

void print_reply(const respc::Reply& reply) {
    fprintf(stdout, "%s\n", respc::format_reply(reply).c_str());
}

// ── Demo sequence ─────────────────────────────────────────────────────────────

asio::awaitable<int> run_demo(std::shared_ptr<Connection> conn) {
    print_reply(co_await conn->set("first", "1"));
    respc::Command third{"SET", "third", "way after first"};
    print_reply(co_await conn->send(std::move(third)));
    print_reply(co_await conn->get("first"));
    print_reply(co_await conn->incr("first"));
    co_return 0;
}

// ── One-shot command ──────────────────────────────────────────────────────────

asio::awaitable<int> run_command(std::shared_ptr<Connection> conn,
                                 std::vector<std::string> command) {
    const auto reply = co_await conn->send(std::move(command));
    print_reply(reply);
    co_return respc::is_error(reply) ? 1 : 0;
}

// ── REPL ──────────────────────────────────────────────────────────────────────

asio::awaitable<int> run_repl(std::shared_ptr<Connection> conn) {
    std::string line;
    while (true) {
        fprintf(stdout, "%s> ", conn->peer().c_str());
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        const auto words = respc::cli::split_words(line);
        if (!words) {
            fprintf(stdout, "Invalid argument(s)\n");
            continue;
        }
        if (words->empty()) {
            continue;
        }
        if (words->size() == 1 && ((*words)[0] == "quit" || (*words)[0] == "exit")) {
            break;
        }

        // Error replies are printed and the session goes on; transport and
        // protocol errors propagate and end it.
        print_reply(co_await conn->send(*words));
    }
    co_return 0;
}

asio::awaitable<int> run(std::shared_ptr<Connection> conn, respc::ClientConfig cfg) {
    try {
        co_await conn->connect(cfg.host, cfg.port);
    } catch (const respc::TransportError& e) {
        fprintf(stderr, "Could not connect to %s:%u: %s\n",
                cfg.host.c_str(), cfg.port, e.what());
        co_return 1;
    }

    int rc = 0;
    if (cfg.demo) {
        rc = co_await run_demo(conn);
    } else if (!cfg.command.empty()) {
        rc = co_await run_command(conn, std::move(cfg.command));
    } else {
        rc = co_await run_repl(conn);
    }

    conn->close();
    co_return rc;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    respc::ClientConfig cfg;
    try {
        cfg = respc::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    if (cfg.help) {
        boost::program_options::options_description desc("resp-cli options");
        respc::add_options(desc);
        std::ostringstream oss;
        oss << "Usage: resp-cli [options] [--demo | COMMAND [ARG ...]]\n\n" << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto level = respc::parse_log_level(cfg.log_level);
    respc::init_default_logger(level);

    spdlog::debug("resp-cli connecting to {}:{} (timeout {}ms)",
                  cfg.host, cfg.port, cfg.timeout_ms);

    int exit_code = 1;
    try {
        asio::io_context ioc;

        respc::client::ConnectionOptions options;
        options.command_timeout = std::chrono::milliseconds{cfg.timeout_ms};
        auto conn = std::make_shared<Connection>(
            ioc, options,
            respc::make_connection_logger(fmt::format("conn-{}:{}", cfg.host, cfg.port), level));

        asio::co_spawn(
            conn->strand(),
            run(conn, std::move(cfg)),
            [&exit_code](std::exception_ptr ep, int rc) {
                if (!ep) {
                    exit_code = rc;
                    return;
                }
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& ex) {
                    fprintf(stderr, "Error: %s\n", ex.what());
                    exit_code = 1;
                }
            });
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("resp-cli: exception: {}", ex.what());
        return 1;
    }

    return exit_code;
}
