#include "downloader/stream_fetcher.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <limits>

namespace tubedown::downloader {

std::string range_header(long long first, std::optional<long long> last) {
	if (last) return fmt::format("bytes={}-{}", first, *last);
	return fmt::format("bytes={}-", first);
}

net::ExchangeRequest make_request(const net::RequestTarget &target,
								  const std::optional<std::string> &referer,
								  const HeaderList *extra_headers,
								  std::optional<std::string> range,
								  bool accept_compressed) {
	net::ExchangeRequest req;
	req.target = target.origin_form;
	req.absolute_url = target.absolute_form;
	req.host = target.host_header;
	req.referer = referer;
	req.extra_headers = extra_headers;
	req.range = std::move(range);
	req.accept_compressed = accept_compressed;
	return req;
}

Result<OpenedExchange> open_exchange(TransferContext &ctx, const PoolKey &key,
									 const net::ExchangeRequest &request,
									 asio::yield_context yield) {
	for (;;) {
		auto conn = ctx.connections.acquire(key, yield, &ctx.in_flight);
		if (conn.has_error()) return conn.error();
		if (ctx.cancelled) return make_error_code(errc::cancelled);

		const bool pooled = conn.value()->requests_served() > 0;
		OpenedExchange opened;
		opened.exchange = std::make_unique<net::HttpExchange>(
			std::move(conn.value()), ctx.config, &ctx.in_flight);

		auto sent = opened.exchange->send(request, yield);
		Result<net::ResponseHead> head =
			sent.has_error() ? Result<net::ResponseHead>(sent.error())
							 : opened.exchange->read_head(yield);
		if (head.has_value()) {
			opened.head = std::move(head.value());
			return opened;
		}

		if (!pooled || ctx.cancelled || head.error() != errc::connect_failed) {
			return head.error();
		}
		spdlog::debug("Pooled connection to {} was closed, reconnecting",
					  key.to_string());
	}
}

Result<void> pump_body(net::HttpExchange &exchange, BodySink &sink,
					   long long offset, std::optional<long long> quota,
					   long long &written, const AfterWrite &after_write,
					   asio::yield_context yield) {
	constexpr auto kNoLimit = std::numeric_limits<std::size_t>::max();

	while (!quota || written < *quota) {
		const std::size_t limit =
			quota ? static_cast<std::size_t>(*quota - written) : kNoLimit;

		auto chunk = exchange.read_some(limit, yield);
		if (chunk.has_error()) return chunk.error();
		if (chunk.value().empty()) break;  // End of body

		auto wrote = sink.write(offset + written, chunk.value());
		if (wrote.has_error()) return wrote.error();
		written += static_cast<long long>(chunk.value().size());

		if (after_write) {
			auto after = after_write(chunk.value().size(), yield);
			if (after.has_error()) return after.error();
		}
	}
	return outcome::success();
}

}  // namespace tubedown::downloader
