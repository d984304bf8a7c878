#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/scope_exit.hpp>
#include <mutex>
#include <tubedown/engine.hpp>
#include <vector>

#include "downloader/body_sink.hpp"
#include "downloader/segmented_fetch.hpp"
#include "downloader/stream_fetcher.hpp"
#include "downloader/supervisor.hpp"
#include "downloader/transfer_context.hpp"
#include "net/connection_manager.hpp"
#include "net/decompress.hpp"
#include "net/request_target.hpp"
#include "utils.hpp"

namespace tubedown {

namespace {

// Forward declaration for session cancellation interface
class IActiveSession {
   public:
	virtual ~IActiveSession() = default;
	virtual void cancel() = 0;
};

}  // namespace

struct Engine::Impl {
	asio::any_io_executor ex;
	EngineConfig config;
	std::shared_ptr<net::ConnectionManager> connections;

	// Active session tracking for cancellation
	std::mutex sessions_mutex_;
	std::vector<std::weak_ptr<IActiveSession>> active_sessions_;
	std::atomic<bool> shutdown_requested_{false};

	Impl(asio::any_io_executor e, EngineConfig cfg,
		 std::shared_ptr<KeepAlivePool> pool)
		: ex(std::move(e)),
		  config(std::move(cfg)),
		  connections(std::make_shared<net::ConnectionManager>(
			  config, std::move(pool))) {}

	void register_session(std::weak_ptr<IActiveSession> session) {
		std::lock_guard lock(sessions_mutex_);
		// Cleanup expired sessions while we're here
		active_sessions_.erase(
			std::remove_if(active_sessions_.begin(), active_sessions_.end(),
						   [](const auto &wp) { return wp.expired(); }),
			active_sessions_.end());
		active_sessions_.push_back(std::move(session));
	}

	void shutdown() {
		shutdown_requested_.store(true, std::memory_order_release);

		// Cancel all active sessions
		{
			std::lock_guard lock(sessions_mutex_);
			for (auto &wp : active_sessions_) {
				if (auto sp = wp.lock()) { sp->cancel(); }
			}
			active_sessions_.clear();
		}

		connections->pool()->clear();
	}
};

// =============================================================================
// FetchSession: one resource, from first request to verified result
// =============================================================================

class FetchSession : public IActiveSession,
					 public std::enable_shared_from_this<FetchSession> {
   public:
	using CompletionExecutor = Engine::CompletionExecutor;
	using Handler = asio::any_completion_handler<void(Result<TransferResult>)>;

	FetchSession(const asio::any_io_executor &ex, const EngineConfig &config,
				 std::shared_ptr<net::ConnectionManager> connections,
				 ResourceDescriptor resource, ProgressCallback progress_cb,
				 Handler cb, CompletionExecutor handler_ex)
		: config_(config),
		  connections_(std::move(connections)),
		  strand_(asio::make_strand(ex)),
		  retry_timer_(strand_),
		  resource_(std::move(resource)),
		  ctx_(config_, *connections_, std::move(progress_cb)),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)) {
		if (resource_.max_bytes && *resource_.max_bytes <= 0) {
			resource_.max_bytes.reset();
		}
	}

	void cancel() override {
		asio::post(strand_, [self = shared_from_this()] {
			self->ctx_.cancel();
			self->retry_timer_.cancel();
		});
	}

	void run() {
		asio::spawn(
			strand_,
			[self = shared_from_this()](asio::yield_context yield) {
				self->post_result(self->execute_guarded(yield));
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});
	}

   private:
	struct Attempt {
		downloader::AttemptReport report;
		net::ResponseHead head;
		int segments = 1;
	};

	Result<TransferResult> execute_guarded(asio::yield_context yield) {
		try {
			return execute(yield);
		} catch (const std::exception &e) {
			spdlog::error("Fetching {} aborted: {}", resource_.url, e.what());
			return make_error_code(errc::unknown);
		}
	}

	Result<TransferResult> execute(asio::yield_context yield);

	Attempt attempt(const std::string &url,
					const std::optional<std::string> &referer, long long &held,
					downloader::BodySink &sink, bool probe_segments,
					asio::yield_context yield);

	Result<void> wait_before_retry(asio::yield_context yield);

	void release(net::HttpExchange &exchange) {
		const bool reusable = exchange.reusable();
		connections_->release(exchange.release_connection(), reusable);
	}

	[[nodiscard]] bool may_segment() const {
		const auto &policy = config_.segments;
		return policy.enabled && policy.max_workers > 1 &&
			   resource_.output.is_file() && !resource_.max_bytes &&
			   resource_.expected_bytes &&
			   *resource_.expected_bytes >= policy.threshold_bytes;
	}

	void post_result(Result<TransferResult> res) {
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				cb(std::move(res));
			});
	}

	EngineConfig config_;
	std::shared_ptr<net::ConnectionManager> connections_;
	asio::strand<asio::any_io_executor> strand_;
	asio::steady_timer retry_timer_;
	ResourceDescriptor resource_;
	downloader::TransferContext ctx_;
	Handler cb_;
	CompletionExecutor handler_ex_;
};

Result<TransferResult> FetchSession::execute(asio::yield_context yield) {
	using downloader::SupervisorState;

	const auto started = std::chrono::steady_clock::now();
	spdlog::info("Fetching {}", resource_.url);

	auto sink_res = downloader::make_sink(resource_.output);
	if (sink_res.has_error()) return sink_res.error();
	auto &sink = *sink_res.value();

	bool committed = false;
	BOOST_SCOPE_EXIT_ALL(&) {
		if (!committed) sink.discard();
	};

	ctx_.governor.restart();
	ctx_.expected_total = resource_.expected_bytes;
	if (resource_.max_bytes) {
		ctx_.expected_total =
			std::min(resource_.expected_bytes.value_or(*resource_.max_bytes),
					 *resource_.max_bytes);
	}

	const bool segmentable = may_segment();
	downloader::SupervisorCounters counters;
	std::string url = resource_.url;
	std::optional<std::string> referer = resource_.referer;
	long long held = 0;
	int resumes = 0;

	for (;;) {
		if (ctx_.cancelled) return make_error_code(errc::cancelled);

		auto a =
			attempt(url, referer, held, sink, segmentable && held == 0, yield);
		auto next = downloader::classify(a.report, counters, config_.retry);
		spdlog::debug("Attempt on {} -> {}", url,
					  downloader::to_string(next.state));

		switch (next.state) {
			case SupervisorState::success: {
				auto fin = sink.finish(held);
				if (fin.has_error()) return fin.error();

				TransferResult result;
				result.status_line = a.head.status_line;
				result.status_code = a.head.status;
				result.headers = a.head.headers;
				result.bytes_written = held;
				result.document_length = a.report.document_length;
				result.final_url = url;
				result.redirects = counters.hops;
				result.resumes = resumes;
				result.segments = a.segments;

				if (auto *mem = dynamic_cast<downloader::MemorySink *>(&sink)) {
					result.body = mem->take();
					auto encoding = a.head.header("Content-Encoding");
					if (resource_.accept_compressed && encoding) {
						result.body =
							net::decompress_body(result.body, *encoding);
					}
				}

				result.elapsed =
					std::chrono::duration_cast<std::chrono::milliseconds>(
						std::chrono::steady_clock::now() - started);
				spdlog::info(
					"Finished {}: {} in {}", url, utils::fmt_size(held),
					utils::fmt_duration(
						std::chrono::duration_cast<std::chrono::seconds>(
							result.elapsed)));
				committed = true;
				return result;
			}

			case SupervisorState::redirected:
				spdlog::debug("Redirected to {}", *a.report.location);
				referer = url;
				url = *a.report.location;
				held = 0;
				break;

			case SupervisorState::partial_success:
				++resumes;
				spdlog::warn("Transfer of {} stopped at {} of {} ({}), resuming",
							 url, held,
							 a.report.document_length
								 ? std::to_string(*a.report.document_length)
								 : std::string("?"),
							 next.error.message());
				break;

			case SupervisorState::retryable_error: {
				spdlog::warn("Attempt on {} failed: {}; retrying ({}/{})", url,
							 next.error.message(), counters.errors,
							 config_.retry.error_budget);
				auto waited = wait_before_retry(yield);
				if (waited.has_error()) return waited.error();
				break;
			}

			case SupervisorState::fatal_error:
				spdlog::error("Fetching {} failed: {}", url, next.error.message());
				return next.error;

			case SupervisorState::requesting:
				break;
		}
	}
}

FetchSession::Attempt FetchSession::attempt(
	const std::string &url, const std::optional<std::string> &referer,
	long long &held, downloader::BodySink &sink, bool probe_segments,
	asio::yield_context yield) {
	Attempt out;
	out.report.bytes_before = held;
	out.report.bytes_after = held;

	auto target = net::resolve_target(url);
	if (target.has_error()) {
		out.report.error = target.error();
		return out;
	}

	std::optional<std::string> range;
	if (resource_.max_bytes) {
		range = downloader::range_header(held, *resource_.max_bytes - 1);
	} else if (held > 0 || probe_segments) {
		range = downloader::range_header(held);
	}

	auto req = downloader::make_request(target.value(), referer,
										&resource_.extra_headers, range,
										resource_.accept_compressed &&
											!resource_.output.is_file());
	auto opened =
		downloader::open_exchange(ctx_, target.value().key, req, yield);
	if (opened.has_error()) {
		out.report.error = opened.error();
		return out;
	}
	auto exchange = std::move(opened.value().exchange);
	out.head = std::move(opened.value().head);
	const auto &head = out.head;
	out.report.status = head.status;

	if (head.is_redirect()) {
		if (auto location = head.header("Location")) {
			auto resolved = net::resolve_location(url, *location);
			if (resolved.has_value()) {
				out.report.location = std::move(resolved.value());
			} else {
				spdlog::warn("Ignoring unusable Location \"{}\"", *location);
			}
		}
		exchange->read_error_body(yield);
		release(*exchange);
		return out;
	}

	if (!head.is_success()) {
		auto body = exchange->read_error_body(yield);
		out.report.rate_limit_body = downloader::looks_rate_limited(body);
		spdlog::debug("{} answered {} ({} byte body)", url, head.status_line,
					  body.size());
		release(*exchange);
		return out;
	}

	// Where this response's first byte belongs
	long long start = held;
	if (head.status == 206) {
		if (!head.content_range || head.content_range->first != held) {
			spdlog::error("Asked {} for {}, got {}", url,
						  range.value_or("everything"),
						  head.header("Content-Range").value_or("no range"));
			out.report.error = make_error_code(errc::range_not_honored);
			return out;
		}
	} else if (held > 0) {
		spdlog::warn("{} ignored the range, restarting from byte 0", url);
		start = 0;
		held = 0;
		out.report.bytes_before = 0;
		out.report.bytes_after = 0;
	}

	std::optional<long long> length;
	if (head.status == 206) {
		length = head.content_range->total;
	} else if (head.content_length) {
		length = head.content_length;
	}

	std::optional<long long> cap = length;
	if (resource_.max_bytes) {
		cap = std::min(length.value_or(*resource_.max_bytes),
					   *resource_.max_bytes);
		if (length) length = cap;
	}
	out.report.document_length = length;
	if (length) ctx_.expected_total = length;

	if (probe_segments && head.status == 206 && length &&
		*length >= config_.segments.threshold_bytes) {
		out.report.segmented = true;
		downloader::SegmentedFetch fetch(
			ctx_, sink,
			downloader::SegmentRequest{target.value(), referer,
									   &resource_.extra_headers},
			*length);
		auto total = fetch.run(std::move(exchange), yield);
		out.segments = static_cast<int>(fetch.segments().size());
		if (total.has_error()) {
			out.report.error = total.error();
			return out;
		}
		held = total.value();
		out.report.bytes_after = held;
		return out;
	}

	std::optional<long long> quota;
	if (cap) quota = std::max(0LL, *cap - start);

	long long written = 0;
	auto pumped = downloader::pump_body(
		*exchange, sink, start, quota, written,
		[this, start, &written](std::size_t, asio::yield_context y) {
			return ctx_.on_bytes(start + written, y);
		},
		yield);
	held = start + written;
	out.report.bytes_after = held;
	if (pumped.has_error()) {
		out.report.error = pumped.error();
		return out;
	}

	release(*exchange);
	return out;
}

Result<void> FetchSession::wait_before_retry(asio::yield_context yield) {
	if (config_.retry.retry_delay.count() > 0) {
		boost::system::error_code ec;
		retry_timer_.expires_after(config_.retry.retry_delay);
		retry_timer_.async_wait(yield[ec]);
	}
	if (ctx_.cancelled) return make_error_code(errc::cancelled);
	return outcome::success();
}

// =============================================================================
// Engine
// =============================================================================

Engine::Engine(asio::any_io_executor ex, EngineConfig config,
			   std::shared_ptr<KeepAlivePool> pool)
	: m_impl(std::make_unique<Impl>(
		  std::move(ex), std::move(config), std::move(pool))) {}

Engine::~Engine() = default;
Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

asio::any_io_executor Engine::get_executor() const { return m_impl->ex; }

const EngineConfig &Engine::config() const { return m_impl->config; }

const std::shared_ptr<KeepAlivePool> &Engine::pool() const {
	return m_impl->connections->pool();
}

void Engine::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

void Engine::async_fetch_impl(
	ResourceDescriptor resource, ProgressCallback progress_cb,
	asio::any_completion_handler<void(Result<TransferResult>)> handler,
	CompletionExecutor handler_ex) {
	if (m_impl->shutdown_requested_.load(std::memory_order_acquire)) {
		asio::post(m_impl->ex, [handler = std::move(handler),
								handler_ex = std::move(handler_ex)]() mutable {
			asio::dispatch(handler_ex, [handler = std::move(handler)]() mutable {
				handler(make_error_code(errc::cancelled));
			});
		});
		return;
	}

	auto session = std::make_shared<FetchSession>(
		m_impl->ex, m_impl->config, m_impl->connections, std::move(resource),
		std::move(progress_cb), std::move(handler), std::move(handler_ex));
	m_impl->register_session(session);
	session->run();
}

}  // namespace tubedown
