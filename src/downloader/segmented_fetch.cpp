#include "downloader/segmented_fetch.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "downloader/stream_fetcher.hpp"
#include "utils.hpp"

namespace tubedown::downloader {

std::vector<Segment> plan_segments(long long document_length, int max_workers,
								   long long min_chunk) {
	std::vector<Segment> out;
	if (document_length <= 0) return out;

	const long long workers = std::max(1, max_workers);
	const long long chunk = std::max(
		(document_length + workers - 1) / workers, std::max(1LL, min_chunk));

	for (long long start = 0; start < document_length; start += chunk) {
		Segment seg;
		seg.index = static_cast<int>(out.size());
		seg.range_start = start;
		seg.range_len = std::min(chunk, document_length - start);
		out.push_back(seg);
	}
	return out;
}

SegmentedFetch::SegmentedFetch(TransferContext &ctx, BodySink &sink,
							   SegmentRequest request,
							   long long document_length)
	: ctx_(ctx),
	  sink_(sink),
	  request_(std::move(request)),
	  document_length_(document_length) {}

Result<long long> SegmentedFetch::run(std::unique_ptr<net::HttpExchange> probe,
									  asio::yield_context yield) {
	const auto &policy = ctx_.config.segments;
	segments_ = plan_segments(
		document_length_, policy.max_workers, policy.min_chunk_bytes);
	for (std::size_t i = 1; i < segments_.size(); ++i) queue_.push_back(i);
	probe_ = std::move(probe);

	const int workers = std::min(std::max(1, policy.max_workers),
								 static_cast<int>(segments_.size()));
	spdlog::info("Fetching {} in {} segments of {} over {} connections",
				 utils::fmt_size(document_length_), segments_.size(),
				 utils::fmt_size(segments_.front().range_len), workers);

	ctx_.status = fmt::format("downloading ({} segments)", segments_.size());

	auto ex = yield.get_executor();
	all_done_.emplace(ex, asio::steady_timer::time_point::max());
	active_workers_ = workers;
	for (int w = 0; w < workers; ++w) {
		asio::spawn(
			ex,
			[this, take_probe = (w == 0)](asio::yield_context y) {
				worker(take_probe, y);
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});
	}

	if (active_workers_ > 0) {
		boost::system::error_code ec;
		all_done_->async_wait(yield[ec]);  // Cancelled by the last worker
	}

	if (failure_) return failure_;

	long long total = 0;
	for (const auto &seg : segments_) total += seg.bytes_written;
	if (total != document_length_) {
		spdlog::error("Segments delivered {} of {} bytes", total,
					  document_length_);
		return make_error_code(errc::truncated_transfer);
	}
	return total;
}

void SegmentedFetch::worker(bool take_probe, asio::yield_context yield) {
	try {
		if (take_probe && probe_) {
			auto res = fetch_segment(segments_.front(), std::move(probe_), yield);
			if (res.has_error()) fail(segments_.front(), res.error());
		}
		while (!failure_ && !queue_.empty()) {
			auto &seg = segments_[queue_.front()];
			queue_.pop_front();
			auto res = fetch_segment(seg, nullptr, yield);
			if (res.has_error()) fail(seg, res.error());
		}
	} catch (const std::exception &e) {
		spdlog::error("Segment worker exception: {}", e.what());
		if (!failure_) failure_ = make_error_code(errc::unknown);
		ctx_.in_flight.cancel_all();
	}

	if (--active_workers_ == 0) all_done_->cancel();
}

Result<std::unique_ptr<net::HttpExchange>> SegmentedFetch::open_segment(
	const Segment &seg, asio::yield_context yield) {
	auto req = make_request(request_.target, request_.referer,
							request_.extra_headers,
							range_header(seg.range_start, seg.range_end()));
	auto opened = open_exchange(ctx_, request_.target.key, req, yield);
	if (opened.has_error()) return opened.error();
	if (failure_) return failure_;

	const auto &h = opened.value().head;
	if (!h.is_success()) {
		spdlog::error("Segment {} got {}", seg.index, h.status_line);
		return make_error_code(errc::http_error);
	}
	if (h.status != 206 || !h.content_range ||
		h.content_range->first != seg.range_start) {
		spdlog::error("Segment {} asked for {}-, got {} {}", seg.index,
					  seg.range_start, h.status,
					  h.header("Content-Range").value_or("without a range"));
		return make_error_code(errc::range_not_honored);
	}
	return std::move(opened.value().exchange);
}

Result<void> SegmentedFetch::fetch_segment(
	Segment &seg, std::unique_ptr<net::HttpExchange> exchange,
	asio::yield_context yield) {
	seg.state = Segment::State::fetching;

	if (!exchange) {
		spdlog::debug("Dispatching segment {} ({}-{})", seg.index,
					  seg.range_start, seg.range_end());
		auto opened = open_segment(seg, yield);
		if (opened.has_error()) return opened.error();
		exchange = std::move(opened.value());
	}
	seg.connection = exchange->connection();

	auto pumped = pump_body(
		*exchange, sink_, seg.range_start, seg.range_len, seg.bytes_written,
		[this](std::size_t n, asio::yield_context y) -> Result<void> {
			total_written_ += static_cast<long long>(n);
			auto res = ctx_.on_bytes(total_written_, y);
			if (res.has_error()) return res.error();
			if (failure_) return failure_;
			return outcome::success();
		},
		yield);
	seg.connection = nullptr;
	if (pumped.has_error()) return pumped.error();

	// Done at quota or at an in-quota end of body; the total is checked once
	// every segment has finished.
	seg.state = Segment::State::done;
	spdlog::debug("Segment {} done ({} bytes)", seg.index, seg.bytes_written);

	const bool reusable = exchange->reusable();
	ctx_.connections.release(exchange->release_connection(), reusable);
	return outcome::success();
}

void SegmentedFetch::fail(Segment &seg, std::error_code ec) {
	seg.state = Segment::State::failed;
	seg.connection = nullptr;
	if (failure_) return;

	failure_ = ec;
	spdlog::error("Segment {} failed: {}; cancelling the others", seg.index,
				  ec.message());
	ctx_.in_flight.cancel_all();
}

}  // namespace tubedown::downloader
