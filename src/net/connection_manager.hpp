#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <tubedown/keepalive_pool.hpp>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>

#include "net/connection.hpp"

namespace tubedown::net {

namespace asio = boost::asio;

// Hands out open connections: pooled ones first, otherwise a fresh TCP
// connection, tunnelled through the proxy with CONNECT for TLS origins and
// wrapped in TLS. Certificates are not verified; media edge nodes present
// certificates that do not validate.
class ConnectionManager {
   public:
	ConnectionManager(EngineConfig config,
					  std::shared_ptr<KeepAlivePool> pool);

	ConnectionManager(const ConnectionManager &) = delete;
	ConnectionManager &operator=(const ConnectionManager &) = delete;

	// connect_failed on resolve/socket/TLS failures, proxy_error when the
	// proxy refuses the tunnel. Never retries. While a new connection is
	// being set up, in_flight->cancel_all() aborts it with cancelled.
	Result<std::unique_ptr<Connection>> acquire(
		const PoolKey &key, asio::yield_context yield,
		InFlightSet *in_flight = nullptr);

	// Back into the pool when reusable, closed otherwise
	void release(std::unique_ptr<Connection> conn, bool reusable);

	[[nodiscard]] const std::shared_ptr<KeepAlivePool> &pool() const {
		return pool_;
	}

   private:
	Result<std::unique_ptr<Connection>> open(const PoolKey &key,
											 asio::yield_context yield,
											 InFlightSet *in_flight);
	Result<void> tunnel(beast::tcp_stream &stream, const PoolKey &key,
						asio::yield_context yield);

	EngineConfig config_;
	std::shared_ptr<KeepAlivePool> pool_;
	asio::ssl::context ssl_ctx_;
};

}  // namespace tubedown::net
