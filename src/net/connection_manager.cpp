#include "net/connection_manager.hpp"

#include <fmt/format.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/scope_exit.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

namespace tubedown::net {

namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

ConnectionManager::ConnectionManager(EngineConfig config,
									 std::shared_ptr<KeepAlivePool> pool)
	: config_(std::move(config)),
	  pool_(pool ? std::move(pool) : std::make_shared<KeepAlivePool>()),
	  ssl_ctx_(ssl::context::tlsv12_client) {
	boost::system::error_code ec;
	ssl_ctx_.set_verify_mode(ssl::verify_none, ec);
	if (ec) {
		spdlog::error("Failed to set SSL verify mode: {}", ec.message());
	}
}

Result<std::unique_ptr<Connection>> ConnectionManager::acquire(
	const PoolKey &key, asio::yield_context yield, InFlightSet *in_flight) {
	if (in_flight && in_flight->cancelled()) {
		return make_error_code(errc::cancelled);
	}
	if (auto conn = pool_->take(key)) return conn;
	return open(key, yield, in_flight);
}

void ConnectionManager::release(std::unique_ptr<Connection> conn,
								bool reusable) {
	if (!conn) return;
	if (reusable) {
		pool_->put(std::move(conn));
	} else {
		conn->close();
	}
}

Result<std::unique_ptr<Connection>> ConnectionManager::open(
	const PoolKey &key, asio::yield_context yield, InFlightSet *in_flight) {
	auto ex = yield.get_executor();
	const bool tls = key.scheme == "https";
	const auto &proxy = config_.proxy;
	const std::string host = proxy ? proxy->host : key.host;
	const std::string port = std::to_string(proxy ? proxy->port : key.port);

	tcp::resolver resolver(ex);
	auto stream = std::make_unique<beast::tcp_stream>(ex);

	// Whatever this setup is waiting on, for cancellation from outside
	beast::tcp_stream *live = stream.get();
	std::size_t pending_id = 0;
	if (in_flight) {
		pending_id = in_flight->add_pending([&resolver, &live] {
			resolver.cancel();
			if (live) live->cancel();
		});
	}
	BOOST_SCOPE_EXIT_ALL(&) {
		if (in_flight) in_flight->remove_pending(pending_id);
	};
	auto aborted = [in_flight] { return in_flight && in_flight->cancelled(); };

	beast::error_code ec;
	auto results = resolver.async_resolve(host, port, yield[ec]);
	if (aborted()) return make_error_code(errc::cancelled);
	if (ec) {
		spdlog::debug("Resolving {} failed: {}", host, ec.message());
		return make_error_code(errc::connect_failed);
	}

	stream->expires_after(config_.idle_timeout);
	stream->async_connect(results, yield[ec]);
	if (aborted()) return make_error_code(errc::cancelled);
	if (ec) {
		spdlog::debug("Connecting to {}:{} failed: {}", host, port,
					  ec.message());
		return make_error_code(errc::connect_failed);
	}
	spdlog::debug("Connected to {}:{}{}", host, port,
				  proxy ? " (proxy)" : "");

	if (!tls) {
		stream->expires_never();
		return std::make_unique<Connection>(
			key, std::move(stream), proxy.has_value());
	}

	if (proxy) {
		auto tunnelled = tunnel(*stream, key, yield);
		if (aborted()) return make_error_code(errc::cancelled);
		if (tunnelled.has_error()) return tunnelled.error();
	}

	auto tls_stream =
		std::make_unique<Connection::TlsStream>(std::move(*stream), ssl_ctx_);
	live = &beast::get_lowest_layer(*tls_stream);

	// Set SNI
	if (!SSL_set_tlsext_host_name(
			tls_stream->native_handle(), key.host.c_str())) {
		return make_error_code(errc::connect_failed);
	}

	beast::get_lowest_layer(*tls_stream).expires_after(config_.idle_timeout);
	tls_stream->async_handshake(ssl::stream_base::client, yield[ec]);
	if (aborted()) return make_error_code(errc::cancelled);
	if (ec) {
		spdlog::debug("TLS handshake with {} failed: {}", key.host,
					  ec.message());
		return make_error_code(errc::connect_failed);
	}
	beast::get_lowest_layer(*tls_stream).expires_never();

	return std::make_unique<Connection>(key, std::move(tls_stream));
}

Result<void> ConnectionManager::tunnel(beast::tcp_stream &stream,
									   const PoolKey &key,
									   asio::yield_context yield) {
	const std::string authority = fmt::format("{}:{}", key.host, key.port);

	http::request<http::empty_body> req{http::verb::connect, authority, 11};
	req.set(http::field::host, authority);
	req.set(http::field::user_agent, config_.user_agent);

	beast::error_code ec;
	stream.expires_after(config_.idle_timeout);
	http::async_write(stream, req, yield[ec]);
	if (ec) return make_error_code(errc::connect_failed);

	beast::flat_buffer buffer;
	http::response_parser<http::empty_body> parser;
	parser.skip(true);	// A CONNECT reply has no body
	http::async_read(stream, buffer, parser, yield[ec]);
	if (ec) {
		spdlog::warn("Proxy dropped CONNECT {}: {}", authority, ec.message());
		return make_error_code(errc::proxy_error);
	}

	const auto status = parser.get().result_int();
	if (status / 100 != 2) {
		spdlog::warn("Proxy refused CONNECT {}: {} {}", authority, status,
					 std::string(parser.get().reason()));
		return make_error_code(errc::proxy_error);
	}
	spdlog::debug("Tunnel to {} established", authority);
	return outcome::success();
}

}  // namespace tubedown::net
