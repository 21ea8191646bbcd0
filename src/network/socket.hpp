#pragma once

#include <utility>  // needed before Boost.Asio 1.74 headers (std::exchange)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/generic/stream_protocol.hpp>

#include <cstdint>
#include <string>

namespace respc::network {

// ── Socket ────────────────────────────────────────────────────────────────────
//
// The byte stream a Connection speaks RESP over.  TCP in production; any
// other connected stream socket (e.g. one end of a local::connect_pair) can
// be converted to it and adopted, which is how tests script the peer.

using Socket = boost::asio::generic::stream_protocol::socket;

// Resolve host:port and connect, trying each resolved endpoint in turn.
// Sets TCP_NODELAY.  Returns a closed socket with `ec` set on failure.
[[nodiscard]] boost::asio::awaitable<Socket>
connect_tcp(boost::asio::any_io_executor executor,
            const std::string& host,
            uint16_t port,
            boost::system::error_code& ec);

// Shut down both directions and close.  Pending operations complete with
// operation_aborted.  Errors are ignored: the peer may already be gone.
void close_socket(Socket& socket) noexcept;

} // namespace respc::network
