#pragma once

#include <tubedown/tubedown_export.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result.hpp"

namespace tubedown::cipher {

enum class CipherOp {
	reverse,		 // "r"
	slice_from,		 // "sN": drop the first N characters
	swap_with_index	 // "wN": exchange index 0 with index N mod length
};

struct TUBEDOWN_EXPORT CipherStep {
	CipherOp op = CipherOp::reverse;
	std::size_t arg = 0;

	bool operator==(const CipherStep &o) const {
		return op == o.op && arg == o.arg;
	}
};

struct TUBEDOWN_EXPORT CipherProgram {
	std::string version_key;
	long long timestamp_param = 0;	// The player's "sts" value
	std::vector<CipherStep> steps;

	// Compact form, e.g. "1588 r s3 w19 r s2"
	[[nodiscard]] std::string to_string() const;
};

/// Parses "<timestamp> op op ..." where op is r, sN or wN.
TUBEDOWN_EXPORT Result<CipherProgram> parse_cipher_program(
	std::string_view version_key, std::string_view text);

/// Applies the program to a token. Pure and total.
TUBEDOWN_EXPORT std::string decipher(const CipherProgram &program,
									 std::string_view token);

/// True for two hex-like groups of at least 30 characters joined by one dot.
TUBEDOWN_EXPORT bool signature_shape_ok(std::string_view signature);

/// Looks the version key up in the recorded table.
TUBEDOWN_EXPORT Result<CipherProgram> lookup_cipher(
	std::string_view version_key);

/// Derives a program by pattern matching a minified player script.
TUBEDOWN_EXPORT Result<CipherProgram> synthesize_cipher(
	std::string_view version_key, std::string_view player_script);

struct TUBEDOWN_EXPORT DecipheredSignature {
	std::string value;
	CipherProgram program;
	// Set when the output does not look like a signature
	std::optional<std::string> mismatch;
};

/// Table lookup, then the synthesizer when a player script is supplied.
TUBEDOWN_EXPORT Result<DecipheredSignature> decipher_signature(
	std::string_view version_key, std::string_view token,
	std::optional<std::string_view> player_script = std::nullopt);

}  // namespace tubedown::cipher
