#include "net/http_exchange.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/ssl/error.hpp>
#include <set>

#include "utils.hpp"

namespace tubedown::net {

namespace {

std::error_code map_transport_error(const beast::error_code &ec,
									errc otherwise) {
	if (ec == beast::error::timeout) return make_error_code(errc::timed_out);
	if (ec == asio::error::operation_aborted) {
		return make_error_code(errc::cancelled);
	}
	return make_error_code(otherwise);
}

}  // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) {
	value = utils::trim(value);
	constexpr std::string_view kUnit = "bytes";
	if (value.size() <= kUnit.size() ||
		!utils::iequals(value.substr(0, kUnit.size()), kUnit)) {
		return std::nullopt;
	}
	value = utils::trim(value.substr(kUnit.size()));

	auto dash = value.find('-');
	auto slash = value.find('/');
	if (dash == std::string_view::npos || slash == std::string_view::npos ||
		dash > slash) {
		return std::nullopt;
	}

	auto first = utils::to_long(utils::trim(value.substr(0, dash)));
	auto last =
		utils::to_long(utils::trim(value.substr(dash + 1, slash - dash - 1)));
	if (first.has_error() || last.has_error() || last.value() < first.value()) {
		return std::nullopt;
	}

	ContentRange range;
	range.first = first.value();
	range.last = last.value();
	// Non-numeric total ("*") means the length is unknown
	if (auto total = utils::to_long(utils::trim(value.substr(slash + 1)))) {
		range.total = total.value();
	}
	return range;
}

std::optional<std::string> ResponseHead::header(std::string_view name) const {
	auto it = headers.find(name);
	if (it == headers.end()) return std::nullopt;
	return it->second;
}

HttpExchange::HttpExchange(std::unique_ptr<Connection> conn,
						   const EngineConfig &config, InFlightSet *in_flight)
	: conn_(std::move(conn)),
	  in_flight_(in_flight),
	  idle_timeout_(config.idle_timeout),
	  user_agent_(config.user_agent),
	  body_buf_(config.read_buffer_bytes) {
	if (in_flight_ && conn_) in_flight_->insert(conn_.get());
	parser_.emplace();
	parser_->body_limit(boost::none);
	parser_->header_limit(64 * 1024);
}

HttpExchange::~HttpExchange() {
	if (conn_) {
		if (in_flight_) in_flight_->erase(conn_.get());
		conn_->close();
	}
}

std::unique_ptr<Connection> HttpExchange::release_connection() {
	if (in_flight_ && conn_) in_flight_->erase(conn_.get());
	return std::move(conn_);
}

Result<void> HttpExchange::send(const ExchangeRequest &request,
								asio::yield_context yield) {
	const std::string &target =
		conn_->absolute_form() ? request.absolute_url : request.target;

	http::request<http::empty_body> req{http::verb::get, target, 11};
	req.set(http::field::host, request.host);
	req.set(http::field::user_agent, user_agent_);
	req.set(http::field::accept, "*/*");
	if (request.referer) req.set(http::field::referer, *request.referer);
	req.set(http::field::connection, "keep-alive");
	if (request.range) req.set(http::field::range, *request.range);
	if (request.accept_compressed) {
		req.set(http::field::accept_encoding, "gzip, deflate");
	}
	if (request.extra_headers) {
		// The first occurrence of a name replaces a built-in header, later
		// ones are sent alongside it
		std::set<std::string, CaseInsensitiveLess> seen;
		for (const auto &[key, value] : *request.extra_headers) {
			if (seen.insert(key).second) {
				req.set(key, value);
			} else {
				req.insert(key, value);
			}
		}
	}

	spdlog::debug("==> GET {}{}", target,
				  request.range ? fmt::format(" ({})", *request.range) : "");

	beast::error_code ec;
	conn_->lowest_layer().expires_after(idle_timeout_);
	conn_->visit([&](auto &stream) {
		return http::async_write(stream, req, yield[ec]);
	});
	if (ec) {
		spdlog::debug("Write to {} failed: {}", conn_->key().to_string(),
					  ec.message());
		return map_transport_error(ec, errc::connect_failed);
	}
	conn_->count_request();
	return outcome::success();
}

Result<ResponseHead> HttpExchange::read_head(asio::yield_context yield) {
	beast::error_code ec;
	conn_->lowest_layer().expires_after(idle_timeout_);
	conn_->visit([&](auto &stream) {
		return http::async_read_header(stream, buffer_, *parser_, yield[ec]);
	});
	if (ec) {
		spdlog::debug("Reading response from {} failed: {}",
					  conn_->key().to_string(), ec.message());
		return map_transport_error(ec, errc::connect_failed);
	}

	const auto &res = parser_->get();
	ResponseHead head;
	head.status = static_cast<int>(res.result_int());
	head.status_line =
		fmt::format("HTTP/{}.{} {} {}", res.version() / 10, res.version() % 10,
					head.status, std::string(res.reason()));
	for (const auto &field : res) {
		std::string name(field.name_string());
		std::string value(field.value());
		auto [it, inserted] = head.headers.emplace(name, value);
		if (!inserted) it->second += ", " + value;
	}

	if (auto cl = parser_->content_length()) {
		head.content_length = static_cast<long long>(*cl);
	}
	if (auto cr = res.find(http::field::content_range); cr != res.end()) {
		head.content_range = parse_content_range(cr->value());
	}

	spdlog::debug("<== {}", head.status_line);
	return head;
}

Result<std::string_view> HttpExchange::read_some(std::size_t limit,
												 asio::yield_context yield) {
	const std::size_t want = std::min(limit, body_buf_.size());
	for (;;) {
		if (eof_done_ || parser_->is_done() || want == 0) {
			return std::string_view{};
		}

		parser_->get().body().data = body_buf_.data();
		parser_->get().body().size = want;

		beast::error_code ec;
		conn_->lowest_layer().expires_after(idle_timeout_);
		conn_->visit([&](auto &stream) {
			return http::async_read_some(stream, buffer_, *parser_, yield[ec]);
		});
		if (ec == http::error::need_buffer) ec = {};

		const std::size_t got = want - parser_->get().body().size;
		if (ec == asio::ssl::error::stream_truncated && !parser_->chunked() &&
			!parser_->content_length()) {
			// Length delimited by connection close, minus the TLS goodbye
			eof_done_ = true;
			ec = {};
		}
		if (ec) {
			spdlog::debug("Body read from {} failed: {}",
						  conn_->key().to_string(), ec.message());
			return map_transport_error(ec, errc::truncated_transfer);
		}
		if (got > 0) return std::string_view(body_buf_.data(), got);
	}
}

std::string HttpExchange::read_error_body(asio::yield_context yield) {
	std::string body;
	while (body.size() < kErrorBodyLimit) {
		auto chunk = read_some(kErrorBodyLimit - body.size(), yield);
		if (chunk.has_error()) {
			spdlog::debug("Error body cut short: {}", chunk.error().message());
			break;
		}
		if (chunk.value().empty()) break;
		body.append(chunk.value());
	}
	return body;
}

bool HttpExchange::body_done() const {
	return eof_done_ || parser_->is_done();
}

bool HttpExchange::reusable() const {
	return conn_ && parser_->is_done() && parser_->get().keep_alive() &&
		   parser_->content_length().has_value();
}

}  // namespace tubedown::net
