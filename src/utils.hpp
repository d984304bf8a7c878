#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <boost/charconv.hpp>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <tubedown/result.hpp>

namespace tubedown::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<int> to_int(std::string_view sv) { return to_number<int>(sv); }

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

// =============================================================================
// String helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
		sv.remove_prefix(1);
	while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
		sv.remove_suffix(1);
	return sv;
}

inline std::string to_lower(std::string_view sv) {
	std::string out(sv);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
	return a.size() == b.size() &&
		   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
			   return std::tolower(static_cast<unsigned char>(x)) ==
					  std::tolower(static_cast<unsigned char>(y));
		   });
}

inline bool icontains(std::string_view haystack, std::string_view needle) {
	return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// =============================================================================
// Human-readable sizes and rates (1024 based)
// =============================================================================

inline std::string fmt_size(long long bytes) {
	constexpr double KB = 1024.0;
	constexpr double MB = KB * 1024.0;
	if (bytes > MB) return fmt::format("{:.0f} MB", bytes / MB);
	if (bytes > KB) return fmt::format("{:.0f} KB", bytes / KB);
	return fmt::format("{} bytes", bytes);
}

inline std::string fmt_bps(double bps) {
	constexpr double K = 1024.0;
	constexpr double M = K * 1024.0;
	if (bps > M) return fmt::format("{:.1f} Mbps", bps / M);
	if (bps > K) return fmt::format("{:.1f} Kbps", bps / K);
	return fmt::format("{:.0f} bps", bps);
}

inline std::string fmt_duration(std::chrono::seconds secs) {
	auto s = secs.count();
	return fmt::format("{}:{:02}:{:02}", s / 3600, (s / 60) % 60, s % 60);
}

}  // namespace tubedown::utils
