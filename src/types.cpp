#include <tubedown/types.hpp>

#include "utils.hpp"

namespace tubedown {

bool CaseInsensitiveLess::operator()(std::string_view a,
									 std::string_view b) const {
	return std::lexicographical_compare(
		a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
			return std::tolower(static_cast<unsigned char>(x)) <
				   std::tolower(static_cast<unsigned char>(y));
		});
}

Result<ProxyConfig> parse_proxy(std::string_view spec) {
	ProxyConfig proxy;
	std::string_view rest = utils::trim(spec);

	if (auto sep = rest.find("://"); sep != std::string_view::npos) {
		proxy.scheme = utils::to_lower(rest.substr(0, sep));
		rest.remove_prefix(sep + 3);
		if (proxy.scheme != "http" && proxy.scheme != "https") {
			return make_error_code(errc::invalid_url);
		}
	}
	proxy.port = proxy.scheme == "https" ? 443 : 80;

	if (auto slash = rest.find('/'); slash != std::string_view::npos) {
		rest = rest.substr(0, slash);
	}
	if (auto colon = rest.rfind(':'); colon != std::string_view::npos) {
		auto port = utils::to_number<unsigned short>(rest.substr(colon + 1));
		if (port.has_error() || port.value() == 0) {
			return make_error_code(errc::invalid_url);
		}
		proxy.port = port.value();
		rest = rest.substr(0, colon);
	}
	if (rest.empty()) return make_error_code(errc::invalid_url);

	proxy.host = std::string(rest);
	return proxy;
}

}  // namespace tubedown
