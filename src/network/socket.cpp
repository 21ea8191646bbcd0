#include "network/socket.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace respc::network {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using tcp = boost::asio::ip::tcp;

awaitable<Socket> connect_tcp(boost::asio::any_io_executor executor,
                              const std::string& host,
                              uint16_t port,
                              boost::system::error_code& ec) {
    // Resolve
    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(
        host, std::to_string(port), redirect_error(use_awaitable, ec));
    if (ec) {
        spdlog::debug("connect_tcp: resolve {}:{} failed: {}", host, port, ec.message());
        co_return Socket(executor);
    }

    // Connect
    tcp::socket socket(executor);
    co_await boost::asio::async_connect(
        socket, endpoints, redirect_error(use_awaitable, ec));
    if (ec) {
        spdlog::debug("connect_tcp: connect to {}:{} failed: {}", host, port, ec.message());
        co_return Socket(executor);
    }

    // Requests are small and latency-bound; don't let Nagle hold them back.
    boost::system::error_code opt_ec;
    socket.set_option(tcp::no_delay(true), opt_ec);

    co_return Socket(std::move(socket));
}

void close_socket(Socket& socket) noexcept {
    boost::system::error_code ec;
    socket.shutdown(Socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace respc::network
