#pragma once

#include <string>
#include <string_view>
#include <tubedown/keepalive_pool.hpp>
#include <tubedown/result.hpp>

namespace tubedown::net {

// Everything a request needs to know about its URL
struct RequestTarget {
	PoolKey key;
	std::string origin_form;	// "/path?query"
	std::string absolute_form;	// "http://host:port/path?query"
	std::string host_header;	// "host" or "host:port"
};

// invalid_url for anything that is not an absolute http(s) URL
Result<RequestTarget> resolve_target(std::string_view url);

// Resolves a Location header, relative or absolute, against the URL that
// produced it
Result<std::string> resolve_location(std::string_view base,
									 std::string_view location);

// *.google.com/sorry... pages ask a human to solve a CAPTCHA
bool is_captcha_url(std::string_view url);

}  // namespace tubedown::net
