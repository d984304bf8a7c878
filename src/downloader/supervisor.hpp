#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <tubedown/types.hpp>

namespace tubedown::downloader {

enum class SupervisorState {
	requesting,
	redirected,
	partial_success,
	success,
	retryable_error,
	fatal_error
};

const char *to_string(SupervisorState state);

// What one request/response attempt came back with
struct AttemptReport {
	std::error_code error;	// Transport, framing or sink failure
	int status = 0;			// 0 when no response head arrived
	std::optional<std::string> location;  // Already resolved to absolute
	long long bytes_before = 0;			  // Held when the attempt started
	long long bytes_after = 0;			  // Held when it ended
	std::optional<long long> document_length;
	bool rate_limit_body = false;
	bool segmented = false;	 // Came from the parallel scheduler
};

struct SupervisorCounters {
	int hops = 0;
	int failed_resumes = 0;
	int errors = 0;
};

struct Transition {
	SupervisorState state = SupervisorState::requesting;
	std::error_code error;	// Set for fatal_error and retryable_error
};

// The single decision point between retrying and surfacing an error.
// Updates counters for the hop, resume and error budgets.
Transition classify(const AttemptReport &report, SupervisorCounters &counters,
					const RetryPolicy &policy);

// True for bodies that say the client is being rate limited
bool looks_rate_limited(std::string_view body);

}  // namespace tubedown::downloader
