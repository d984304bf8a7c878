#pragma once

#include <boost/asio/spawn.hpp>
#include <functional>
#include <optional>
#include <string>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>

#include "downloader/body_sink.hpp"
#include "downloader/transfer_context.hpp"
#include "net/http_exchange.hpp"
#include "net/request_target.hpp"

namespace tubedown::downloader {

namespace asio = boost::asio;

// "bytes=first-" or "bytes=first-last"
std::string range_header(long long first,
						 std::optional<long long> last = std::nullopt);

net::ExchangeRequest make_request(const net::RequestTarget &target,
								  const std::optional<std::string> &referer,
								  const HeaderList *extra_headers,
								  std::optional<std::string> range,
								  bool accept_compressed = false);

struct OpenedExchange {
	std::unique_ptr<net::HttpExchange> exchange;
	net::ResponseHead head;
};

// Sends request to the origin behind key and reads the response head. A
// pooled connection the peer has already closed is replaced by a fresh one
// without counting as a failure.
Result<OpenedExchange> open_exchange(TransferContext &ctx, const PoolKey &key,
									 const net::ExchangeRequest &request,
									 asio::yield_context yield);

using AfterWrite =
	std::function<Result<void>(std::size_t bytes, asio::yield_context)>;

// Streams the body of exchange into sink at offset + written, in arrival
// order, stopping exactly at quota when one is given. written advances as
// bytes land, so a failed read still tells the caller how far it got.
Result<void> pump_body(net::HttpExchange &exchange, BodySink &sink,
					   long long offset, std::optional<long long> quota,
					   long long &written, const AfterWrite &after_write,
					   asio::yield_context yield);

}  // namespace tubedown::downloader
