#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>
#include <vector>

#include "net/connection.hpp"

namespace tubedown::net {

namespace asio = boost::asio;
namespace http = beast::http;

// Parsed "Content-Range: bytes A-B/TOTAL"; TOTAL may be "*"
struct ContentRange {
	long long first = 0;
	long long last = 0;
	std::optional<long long> total;
};

std::optional<ContentRange> parse_content_range(std::string_view value);

struct ExchangeRequest {
	std::string target;		   // origin-form, "/path?query"
	std::string absolute_url;  // used instead when going through a proxy
	std::string host;		   // Host header value
	std::optional<std::string> referer;
	const HeaderList *extra_headers = nullptr;
	std::optional<std::string> range;  // e.g. "bytes=0-"
	bool accept_compressed = false;
};

struct ResponseHead {
	int status = 0;
	std::string status_line;
	Headers headers;
	std::optional<long long> content_length;
	std::optional<ContentRange> content_range;

	[[nodiscard]] bool is_success() const { return status / 100 == 2; }
	[[nodiscard]] bool is_redirect() const {
		return status == 301 || status == 302 || status == 303 ||
			   status == 307 || status == 308;
	}
	[[nodiscard]] std::optional<std::string> header(
		std::string_view name) const;
};

// One request/response on one connection. Body bytes are handed out as they
// arrive; no read waits longer than the idle timeout.
class HttpExchange {
   public:
	static constexpr std::size_t kErrorBodyLimit = 64 * 1024;

	HttpExchange(std::unique_ptr<Connection> conn, const EngineConfig &config,
				 InFlightSet *in_flight = nullptr);
	~HttpExchange();

	HttpExchange(const HttpExchange &) = delete;
	HttpExchange &operator=(const HttpExchange &) = delete;

	Result<void> send(const ExchangeRequest &request,
					  asio::yield_context yield);

	Result<ResponseHead> read_head(asio::yield_context yield);

	// Next piece of the body, at most limit bytes. Empty at end of body.
	// The view stays valid until the next call.
	Result<std::string_view> read_some(std::size_t limit,
									   asio::yield_context yield);

	// Body of a non-2xx response, capped at kErrorBodyLimit
	std::string read_error_body(asio::yield_context yield);

	[[nodiscard]] bool body_done() const;

	// Finished cleanly with keep-alive and a known length
	[[nodiscard]] bool reusable() const;

	[[nodiscard]] Connection *connection() { return conn_.get(); }

	// Gives up ownership; the exchange can no longer be used
	std::unique_ptr<Connection> release_connection();

   private:
	std::unique_ptr<Connection> conn_;
	InFlightSet *in_flight_;
	std::chrono::milliseconds idle_timeout_;
	std::string user_agent_;

	beast::flat_buffer buffer_;
	std::optional<http::response_parser<http::buffer_body>> parser_;
	std::vector<char> body_buf_;
	bool eof_done_ = false;	 // Body delimited by a TLS close without notify
};

}  // namespace tubedown::net
