#pragma once

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <optional>
#include <tubedown/result.hpp>

namespace tubedown::downloader {

namespace asio = boost::asio;

// Caps aggregate throughput by measuring the rate achieved since the
// transfer started and sleeping in short ticks while it is above the
// ceiling. Only the calling coroutine sleeps.
class BandwidthGovernor {
   public:
	using clock = std::chrono::steady_clock;
	static constexpr auto kTick = std::chrono::milliseconds(100);

	explicit BandwidthGovernor(std::optional<double> ceiling_bps,
							   clock::time_point start = clock::now());

	// Bits per second; infinite when bytes arrived in no measurable time
	[[nodiscard]] static double achieved_bps(long long bytes,
											 clock::duration elapsed);

	[[nodiscard]] bool over_ceiling(long long bytes,
									clock::time_point now) const;

	// Returns once bytes_so_far is at or below the ceiling. cancelled is
	// polled between ticks.
	Result<void> throttle(long long bytes_so_far, asio::yield_context yield,
						  const bool *cancelled = nullptr) const;

	void restart(clock::time_point start = clock::now()) { start_ = start; }

	[[nodiscard]] clock::time_point start_time() const { return start_; }
	[[nodiscard]] const std::optional<double> &ceiling() const {
		return ceiling_bps_;
	}

   private:
	std::optional<double> ceiling_bps_;
	clock::time_point start_;
};

}  // namespace tubedown::downloader
