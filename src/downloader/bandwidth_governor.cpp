#include "downloader/bandwidth_governor.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/steady_timer.hpp>
#include <limits>

namespace tubedown::downloader {

BandwidthGovernor::BandwidthGovernor(std::optional<double> ceiling_bps,
									 clock::time_point start)
	: ceiling_bps_(ceiling_bps), start_(start) {
	if (ceiling_bps_ && *ceiling_bps_ <= 0) ceiling_bps_.reset();
}

double BandwidthGovernor::achieved_bps(long long bytes,
									   clock::duration elapsed) {
	const double secs = std::chrono::duration<double>(elapsed).count();
	if (secs <= 0) {
		return bytes > 0 ? std::numeric_limits<double>::infinity() : 0.0;
	}
	return static_cast<double>(bytes) * 8.0 / secs;
}

bool BandwidthGovernor::over_ceiling(long long bytes,
									 clock::time_point now) const {
	if (!ceiling_bps_) return false;
	return achieved_bps(bytes, now - start_) > *ceiling_bps_;
}

Result<void> BandwidthGovernor::throttle(long long bytes_so_far,
										 asio::yield_context yield,
										 const bool *cancelled) const {
	if (!ceiling_bps_) return outcome::success();

	asio::steady_timer timer(yield.get_executor());
	int ticks = 0;
	while (over_ceiling(bytes_so_far, clock::now())) {
		if (cancelled && *cancelled) return make_error_code(errc::cancelled);
		timer.expires_after(kTick);
		boost::system::error_code ec;
		timer.async_wait(yield[ec]);
		if (ec) return make_error_code(errc::cancelled);
		++ticks;
	}
	if (ticks > 0) {
		spdlog::trace("Throttled {} tick(s) at {} bytes", ticks, bytes_so_far);
	}
	return outcome::success();
}

}  // namespace tubedown::downloader
