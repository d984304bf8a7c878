#include <string>
#include <tubedown/result.hpp>

namespace tubedown {

struct tubedown_error_category : std::error_category {
	const char *name() const noexcept override { return "tubedown"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::connect_failed: return "Connection failed";
			case errc::proxy_error: return "Proxy refused tunnel";
			case errc::timed_out: return "Timed out waiting for data";
			case errc::http_error: return "HTTP error";
			case errc::rate_limited: return "Rate limited by origin";
			case errc::captcha_required:
				return "Redirected to a verification page";
			case errc::too_many_redirects: return "Too many redirects";
			case errc::truncated_transfer: return "Transfer truncated";
			case errc::range_not_honored:
				return "Origin did not honor byte range";
			case errc::invalid_url: return "Invalid URL";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::unknown_cipher: return "Unknown cipher version";
			case errc::cipher_parse_error: return "Malformed cipher program";
			case errc::cipher_synthesis_failed:
				return "Could not derive cipher from player script";
			case errc::cancelled: return "Cancelled";
			default: return "Unknown error";
		}
	}
};

const std::error_category &tubedown_category() {
	static tubedown_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), tubedown_category()};
}

}  // namespace tubedown
