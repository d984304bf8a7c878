#include "downloader/supervisor.hpp"

#include "net/request_target.hpp"
#include "utils.hpp"

namespace tubedown::downloader {

namespace {

bool is_redirect_status(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

// Errors that another attempt cannot fix
bool is_unrecoverable(const std::error_code &ec) {
	return ec == errc::proxy_error || ec == errc::invalid_url ||
		   ec == errc::file_open_failed || ec == errc::file_write_failed ||
		   ec == errc::range_not_honored || ec == errc::cancelled;
}

Transition fatal(errc e) {
	return {SupervisorState::fatal_error, make_error_code(e)};
}

}  // namespace

const char *to_string(SupervisorState state) {
	switch (state) {
		case SupervisorState::requesting: return "requesting";
		case SupervisorState::redirected: return "redirected";
		case SupervisorState::partial_success: return "partial_success";
		case SupervisorState::success: return "success";
		case SupervisorState::retryable_error: return "retryable_error";
		case SupervisorState::fatal_error: return "fatal_error";
	}
	return "unknown";
}

bool looks_rate_limited(std::string_view body) {
	return utils::icontains(body, "large volume of requests") ||
		   utils::icontains(body, "rate limit") ||
		   utils::icontains(body, "rate-limit");
}

Transition classify(const AttemptReport &report, SupervisorCounters &counters,
					const RetryPolicy &policy) {
	auto retry = [&](std::error_code ec) -> Transition {
		if (++counters.errors > policy.error_budget) {
			return {SupervisorState::fatal_error, ec};
		}
		return {SupervisorState::retryable_error, ec};
	};

	if (report.status == 429 || report.rate_limit_body) {
		return fatal(errc::rate_limited);
	}
	if (report.error &&
		(report.segmented || is_unrecoverable(report.error))) {
		return {SupervisorState::fatal_error, report.error};
	}

	if (!report.error && is_redirect_status(report.status)) {
		if (!report.location) return fatal(errc::http_error);
		if (net::is_captcha_url(*report.location)) {
			return fatal(errc::captcha_required);
		}
		if (++counters.hops > policy.max_redirects) {
			return fatal(errc::too_many_redirects);
		}
		return {SupervisorState::redirected, {}};
	}

	if (report.status != 0 && report.status / 100 != 2) {
		return retry(make_error_code(errc::http_error));
	}

	const bool complete =
		!report.error && (!report.document_length ||
						  report.bytes_after >= *report.document_length);
	if (complete) return {SupervisorState::success, {}};

	const std::error_code why =
		report.error ? report.error : make_error_code(errc::truncated_transfer);

	// Something is on disk: resume from where it stopped
	if (report.bytes_after > 0) {
		if (report.bytes_after <= report.bytes_before &&
			++counters.failed_resumes >= policy.max_failed_resumes) {
			return fatal(errc::truncated_transfer);
		}
		return {SupervisorState::partial_success, why};
	}

	return retry(why);
}

}  // namespace tubedown::downloader
