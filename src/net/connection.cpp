#include "net/connection.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tubedown {

std::string PoolKey::to_string() const {
	return fmt::format("{}://{}:{}", scheme, host, port);
}

namespace net {

Connection::Connection(PoolKey key, std::unique_ptr<PlainStream> stream,
					   bool absolute_form)
	: key_(std::move(key)),
	  stream_(std::move(stream)),
	  absolute_form_(absolute_form) {}

Connection::Connection(PoolKey key, std::unique_ptr<TlsStream> stream)
	: key_(std::move(key)), stream_(std::move(stream)) {}

Connection::~Connection() = default;

beast::tcp_stream &Connection::lowest_layer() {
	return std::visit(
		[](auto &stream) -> beast::tcp_stream & {
			return beast::get_lowest_layer(*stream);
		},
		stream_);
}

void Connection::cancel() { lowest_layer().cancel(); }

void Connection::close() {
	// No TLS close_notify: the peer may already be gone and the socket is
	// dropped either way.
	beast::error_code ec;
	lowest_layer().socket().shutdown(
		boost::asio::ip::tcp::socket::shutdown_both, ec);
	lowest_layer().close();
	spdlog::debug("Closed connection to {} after {} request(s)",
				  key_.to_string(), requests_served_);
}

}  // namespace net

}  // namespace tubedown
