#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/regex.hpp>
#include <cctype>
#include <map>
#include <tubedown/cipher.hpp>

#include "cipher/cipher_table.hpp"
#include "utils.hpp"

namespace tubedown::cipher {

namespace {

const boost::regex &get_signature_shape_pattern() {
	static const boost::regex pattern(
		R"(^[0-9A-Fa-f]{30,}\.[0-9A-Fa-f]{30,}$)", boost::regex::optimize);
	return pattern;
}

// Parsed once on first use; entries that fail to parse are skipped
const std::map<std::string, CipherProgram, std::less<>> &program_table() {
	static const auto table = [] {
		std::map<std::string, CipherProgram, std::less<>> out;
		for (const auto &entry : recorded_ciphers()) {
			auto res = parse_cipher_program(entry.version_key, entry.program);
			if (res.has_error()) {
				spdlog::warn("Skipping unparsable cipher {}: {}",
							 entry.version_key, entry.program);
				continue;
			}
			out.insert_or_assign(
				std::string(entry.version_key), std::move(res.value()));
		}
		return out;
	}();
	return table;
}

std::string shape_diagnostic(std::string_view key, std::string_view value) {
	auto dot = value.find('.');
	if (dot == std::string_view::npos) {
		return fmt::format(
			"cipher mismatch for {}: {} characters, no dot", key, value.size());
	}
	return fmt::format("cipher mismatch for {}: groups of {}.{} characters",
					   key, dot, value.size() - dot - 1);
}

}  // namespace

std::string CipherProgram::to_string() const {
	std::string out = std::to_string(timestamp_param);
	for (const auto &step : steps) {
		switch (step.op) {
			case CipherOp::reverse:
				out += " r";
				break;
			case CipherOp::slice_from:
				out += fmt::format(" s{}", step.arg);
				break;
			case CipherOp::swap_with_index:
				out += fmt::format(" w{}", step.arg);
				break;
		}
	}
	return out;
}

Result<CipherProgram> parse_cipher_program(std::string_view version_key,
										   std::string_view text) {
	CipherProgram program;
	program.version_key = std::string(version_key);

	bool have_timestamp = false;
	std::size_t pos = 0;
	while (pos < text.size()) {
		while (pos < text.size() &&
			   std::isspace(static_cast<unsigned char>(text[pos])))
			++pos;
		if (pos >= text.size()) break;
		auto end = pos;
		while (end < text.size() &&
			   !std::isspace(static_cast<unsigned char>(text[end])))
			++end;
		std::string_view tok = text.substr(pos, end - pos);
		pos = end;

		if (!have_timestamp) {
			auto ts = utils::to_long(tok);
			if (ts.has_error()) {
				return make_error_code(errc::cipher_parse_error);
			}
			program.timestamp_param = ts.value();
			have_timestamp = true;
			continue;
		}

		if (tok == "r") {
			program.steps.push_back({CipherOp::reverse, 0});
			continue;
		}
		if (tok.size() < 2 || (tok[0] != 's' && tok[0] != 'w')) {
			return make_error_code(errc::cipher_parse_error);
		}
		auto n = utils::to_number<std::size_t>(tok.substr(1));
		if (n.has_error()) return make_error_code(errc::cipher_parse_error);
		program.steps.push_back(
			{tok[0] == 's' ? CipherOp::slice_from : CipherOp::swap_with_index,
			 n.value()});
	}

	if (!have_timestamp) return make_error_code(errc::cipher_parse_error);
	return program;
}

std::string decipher(const CipherProgram &program, std::string_view token) {
	std::string s(token);
	for (const auto &step : program.steps) {
		switch (step.op) {
			case CipherOp::reverse:
				std::reverse(s.begin(), s.end());
				break;
			case CipherOp::slice_from:
				if (step.arg >= s.size()) {
					s.clear();
				} else {
					s.erase(0, step.arg);
				}
				break;
			case CipherOp::swap_with_index:
				if (!s.empty()) std::swap(s[0], s[step.arg % s.size()]);
				break;
		}
	}
	return s;
}

bool signature_shape_ok(std::string_view signature) {
	return boost::regex_match(signature.begin(), signature.end(),
							  get_signature_shape_pattern());
}

Result<CipherProgram> lookup_cipher(std::string_view version_key) {
	const auto &table = program_table();
	auto it = table.find(version_key);
	if (it == table.end()) return make_error_code(errc::unknown_cipher);
	return it->second;
}

Result<DecipheredSignature> decipher_signature(
	std::string_view version_key, std::string_view token,
	std::optional<std::string_view> player_script) {
	auto program = lookup_cipher(version_key);
	if (program.has_error()) {
		if (!player_script) return program.error();
		spdlog::warn("Unknown cipher {}, deriving it from the player script",
					 version_key);
		program = synthesize_cipher(version_key, *player_script);
		if (program.has_error()) return program.error();
		spdlog::info("Current cipher is: '{}' => '{}'", version_key,
					 program.value().to_string());
	}

	DecipheredSignature out;
	out.program = std::move(program.value());
	out.value = decipher(out.program, token);
	if (!signature_shape_ok(out.value)) {
		out.mismatch = shape_diagnostic(version_key, out.value);
		spdlog::warn("{}", *out.mismatch);
	}
	return out;
}

}  // namespace tubedown::cipher
