#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace tubedown {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Connection errors
	connect_failed = 10,
	proxy_error,
	timed_out,

	// HTTP errors
	http_error = 20,
	rate_limited,
	captcha_required,
	too_many_redirects,
	truncated_transfer,
	range_not_honored,
	invalid_url,

	// I/O
	file_open_failed = 40,
	file_write_failed,

	// Conversion
	invalid_number_format = 50,

	// Signature cipher
	unknown_cipher = 60,
	cipher_parse_error,
	cipher_synthesis_failed,

	cancelled = 90,
	unknown = 100
};

std::error_code make_error_code(errc e);

const std::error_category &tubedown_category();

}  // namespace tubedown

namespace std {
template <>
struct is_error_code_enum<tubedown::errc> : true_type {};
}  // namespace std

namespace tubedown {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace tubedown
