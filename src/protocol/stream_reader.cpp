#include "protocol/stream_reader.hpp"

namespace respc::protocol {

void throw_read_error(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::eof) {
        throw TransportError("connection closed by peer");
    }
    throw TransportError(fmt::format("read failed: {}", ec.message()));
}

} // namespace respc::protocol
