#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>
#include <vector>

#include "downloader/body_sink.hpp"
#include "downloader/transfer_context.hpp"
#include "net/http_exchange.hpp"
#include "net/request_target.hpp"

namespace tubedown::downloader {

namespace asio = boost::asio;

struct Segment {
	enum class State { pending, fetching, done, failed };

	int index = 0;
	long long range_start = 0;
	long long range_len = 0;
	State state = State::pending;
	long long bytes_written = 0;
	net::Connection *connection = nullptr;	// While fetching

	[[nodiscard]] long long range_end() const {
		return range_start + range_len - 1;
	}
};

// Splits [0, document_length) into chunks of ceil(length / max_workers)
// bytes, never smaller than min_chunk. The last chunk takes the remainder.
std::vector<Segment> plan_segments(long long document_length, int max_workers,
								   long long min_chunk);

struct SegmentRequest {
	net::RequestTarget target;
	std::optional<std::string> referer;
	const HeaderList *extra_headers = nullptr;
};

// Fetches one resource over up to max_workers connections at once, each
// segment landing at its own file offset. Runs on the transfer's strand;
// one coroutine per worker pulls segments from a shared queue.
//
// Any failing segment fails the whole transfer and cancels the others.
class SegmentedFetch {
   public:
	SegmentedFetch(TransferContext &ctx, BodySink &sink,
				   SegmentRequest request, long long document_length);

	SegmentedFetch(const SegmentedFetch &) = delete;
	SegmentedFetch &operator=(const SegmentedFetch &) = delete;

	// probe is the "bytes=0-" exchange whose head has already been read;
	// its body becomes segment 0, cut off at the chunk size.
	// Returns the verified total.
	Result<long long> run(std::unique_ptr<net::HttpExchange> probe,
						  asio::yield_context yield);

	[[nodiscard]] const std::vector<Segment> &segments() const {
		return segments_;
	}

   private:
	void worker(bool take_probe, asio::yield_context yield);
	Result<void> fetch_segment(Segment &seg,
							   std::unique_ptr<net::HttpExchange> exchange,
							   asio::yield_context yield);
	Result<std::unique_ptr<net::HttpExchange>> open_segment(
		const Segment &seg, asio::yield_context yield);
	void fail(Segment &seg, std::error_code ec);

	TransferContext &ctx_;
	BodySink &sink_;
	SegmentRequest request_;
	long long document_length_;

	std::vector<Segment> segments_;
	std::deque<std::size_t> queue_;
	std::unique_ptr<net::HttpExchange> probe_;
	std::optional<asio::steady_timer> all_done_;
	int active_workers_ = 0;
	long long total_written_ = 0;
	std::error_code failure_;
};

}  // namespace tubedown::downloader
