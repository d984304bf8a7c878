#include "downloader/transfer_context.hpp"

namespace tubedown::downloader {

Result<void> TransferContext::on_bytes(long long total,
									   asio::yield_context yield) {
	if (cancelled) return make_error_code(errc::cancelled);
	report(total);
	return governor.throttle(total, yield, &cancelled);
}

void TransferContext::report(long long total) {
	if (!progress) return;

	DownloadProgress prog{};
	prog.total_downloaded_bytes = total;
	prog.total_size_bytes = expected_total.value_or(0);
	if (prog.total_size_bytes > 0) {
		prog.percentage =
			static_cast<double>(total) / prog.total_size_bytes * 100.0;
	}

	const auto elapsed =
		BandwidthGovernor::clock::now() - governor.start_time();
	const auto ms =
		std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
	if (ms > 0) {
		prog.speed_bytes_per_sec = static_cast<double>(total) * 1000.0 / ms;
		if (prog.speed_bytes_per_sec > 0 && prog.total_size_bytes > 0) {
			prog.eta_seconds = static_cast<double>(prog.total_size_bytes - total) /
							   prog.speed_bytes_per_sec;
		}
	}

	progress(status, prog);
}

}  // namespace tubedown::downloader
