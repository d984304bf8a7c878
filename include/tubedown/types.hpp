#pragma once

#include <tubedown/tubedown_export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "result.hpp"

namespace tubedown {

// Case-insensitive ordering for HTTP header names
struct TUBEDOWN_EXPORT CaseInsensitiveLess {
	bool operator()(std::string_view a, std::string_view b) const;
	using is_transparent = void;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Where the body of a transfer ends up
struct TUBEDOWN_EXPORT OutputTarget {
	enum class Kind { file, memory };

	Kind kind = Kind::memory;
	std::string path;  // Only meaningful for Kind::file

	static OutputTarget file(std::string p) {
		return OutputTarget{Kind::file, std::move(p)};
	}
	static OutputTarget memory() { return OutputTarget{}; }

	[[nodiscard]] bool is_file() const { return kind == Kind::file; }
};

// What the discovery layer hands the engine for one fetch
struct TUBEDOWN_EXPORT ResourceDescriptor {
	std::string url;
	std::optional<std::string> referer;
	HeaderList extra_headers;  // Sent in order, after the built-in ones
	std::optional<long long> expected_bytes;  // Hint for segmentation
	std::optional<long long> max_bytes;		  // Fetch only a prefix
	OutputTarget output = OutputTarget::memory();
	bool accept_compressed = false;	 // Memory targets only
};

struct TUBEDOWN_EXPORT TransferResult {
	std::string status_line;  // e.g. "HTTP/1.1 206 Partial Content"
	int status_code = 0;
	Headers headers;
	long long bytes_written = 0;
	std::optional<long long> document_length;
	std::string body;  // Filled for memory targets
	std::string final_url;
	int redirects = 0;
	int resumes = 0;
	int segments = 1;
	std::chrono::milliseconds elapsed{0};
};

struct TUBEDOWN_EXPORT DownloadProgress {
	long long total_downloaded_bytes;
	long long total_size_bytes;	 // 0 when unknown
	double percentage;
	double speed_bytes_per_sec;
	double eta_seconds;
};

using ProgressCallback = std::function<void(
	const std::string &status, const DownloadProgress &progress)>;

// Upstream HTTP proxy
struct TUBEDOWN_EXPORT ProxyConfig {
	std::string scheme = "http";
	std::string host;
	unsigned short port = 80;
};

/// Parses "host:port", "http://host:port" or "https://host:port".
TUBEDOWN_EXPORT Result<ProxyConfig> parse_proxy(std::string_view spec);

struct TUBEDOWN_EXPORT RetryPolicy {
	int max_redirects = 20;
	int max_failed_resumes = 5;
	int error_budget = 5;
	std::chrono::milliseconds retry_delay{1000};
};

struct TUBEDOWN_EXPORT SegmentPolicy {
	bool enabled = true;
	int max_workers = 30;
	long long min_chunk_bytes = 10 * 1024;
	// Roughly the unthrottled burst an origin grants per connection
	long long threshold_bytes = 10 * 1024 * 1024;
};

struct TUBEDOWN_EXPORT EngineConfig {
	std::optional<ProxyConfig> proxy;
	std::optional<double> bandwidth_ceiling_bps;  // bits per second
	std::chrono::milliseconds idle_timeout{std::chrono::seconds(30)};
	std::string user_agent = "tubedown/1.0";
	std::size_t read_buffer_bytes = 256 * 1024;
	RetryPolicy retry;
	SegmentPolicy segments;
};

}  // namespace tubedown
