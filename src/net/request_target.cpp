#include "net/request_target.hpp"

#include <boost/url.hpp>

#include "utils.hpp"

namespace tubedown::net {

Result<RequestTarget> resolve_target(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return make_error_code(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	const std::string scheme = utils::to_lower(u.scheme());
	if (scheme != "http" && scheme != "https") {
		return make_error_code(errc::invalid_url);
	}
	if (!u.has_authority() || u.encoded_host().empty()) {
		return make_error_code(errc::invalid_url);
	}

	RequestTarget t;
	t.key.scheme = scheme;
	t.key.host = u.host_address();
	t.key.port = u.has_port() ? u.port_number()
							  : static_cast<unsigned short>(
									scheme == "https" ? 443 : 80);
	if (t.key.port == 0) return make_error_code(errc::invalid_url);

	t.origin_form = std::string(u.encoded_path());
	if (t.origin_form.empty()) t.origin_form = "/";
	if (u.has_query()) {
		t.origin_form += "?";
		t.origin_form += std::string(u.encoded_query());
	}

	t.host_header = std::string(u.encoded_host_and_port());
	t.absolute_form = scheme + "://" + t.host_header + t.origin_form;
	return t;
}

Result<std::string> resolve_location(std::string_view base,
									 std::string_view location) {
	auto base_res = boost::urls::parse_uri(base);
	if (base_res.has_error()) return make_error_code(errc::invalid_url);
	auto ref_res = boost::urls::parse_uri_reference(utils::trim(location));
	if (ref_res.has_error()) return make_error_code(errc::invalid_url);

	boost::urls::url dest;
	auto resolved =
		boost::urls::resolve(base_res.value(), ref_res.value(), dest);
	if (resolved.has_error()) return make_error_code(errc::invalid_url);
	return std::string(dest.buffer());
}

bool is_captcha_url(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return false;
	const std::string host = utils::to_lower(u_res.value().host());
	constexpr std::string_view kSuffix = ".google.com";
	const bool google =
		host == "google.com" ||
		(host.size() > kSuffix.size() &&
		 host.compare(host.size() - kSuffix.size(), kSuffix.size(), kSuffix) ==
			 0);
	return google && u_res.value().path().rfind("/sorry", 0) == 0;
}

}  // namespace tubedown::net
