#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace tubedown::downloader {

// Textual progress line: one dot per 1/72 of the transfer followed by a
// percentage and throughput label, e.g. "......... 12% 1.3 Mbps".
class ProgressReporter {
   public:
	static constexpr int kColumns = 72;

	explicit ProgressReporter(std::FILE *out = stderr) : out_(out) {}

	// ratio is in [0, 1], or nullopt when the total is unknown. The line is
	// redrawn only when the dot count grows; is_final erases it.
	void report(std::optional<double> ratio, double bps, bool is_final);

	[[nodiscard]] int ticks() const { return ticks_; }
	[[nodiscard]] int redraws() const { return redraws_; }

   private:
	std::FILE *out_;
	int ticks_ = 0;
	int redraws_ = 0;
	std::size_t last_width_ = 0;
};

}  // namespace tubedown::downloader
