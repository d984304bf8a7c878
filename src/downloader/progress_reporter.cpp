#include "downloader/progress_reporter.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "utils.hpp"

namespace tubedown::downloader {

void ProgressReporter::report(std::optional<double> ratio, double bps,
							  bool is_final) {
	if (!out_) return;

	if (ratio) {
		const double r = std::clamp(*ratio, 0.0, 1.0);
		const int ticks = static_cast<int>(kColumns * r);
		if (ticks > ticks_) {
			ticks_ = ticks;
			std::string line(static_cast<std::size_t>(ticks_), '.');
			line += fmt::format(" {:3d}% {}", static_cast<int>(100 * r),
								utils::fmt_bps(bps));
			last_width_ = std::max(last_width_, line.size());
			fmt::print(out_, "\r{}", line);
			std::fflush(out_);
			++redraws_;
		}
	}

	if (is_final) {
		// Erase the line
		if (redraws_ > 0) {
			fmt::print(out_, "\r{}\r", std::string(last_width_, ' '));
			std::fflush(out_);
		}
		ticks_ = 0;
		last_width_ = 0;
	}
}

}  // namespace tubedown::downloader
