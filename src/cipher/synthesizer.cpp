#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/regex.hpp>
#include <tubedown/cipher.hpp>

#include "utils.hpp"

namespace tubedown::cipher {

namespace {

// A JS identifier, optionally qualified once ("a" or "a.b"). The player is
// minified, so names change between versions and only the code shape is
// matched.
constexpr const char *kVar =
	R"([$_a-zA-Z][$_a-zA-Z0-9]*(?:\.[$_a-zA-Z][$_a-zA-Z0-9]*)?)";

std::string with_var(const char *fmt_pattern) {
	return fmt::format(fmt::runtime(fmt_pattern), fmt::arg("v", kVar));
}

const boost::regex &get_sts_pattern() {
	static const boost::regex pattern(
		R"(\bsts:(\d+)\b)", boost::regex::optimize | boost::regex::icase);
	return pattern;
}

// Finds "C" in: var A=B.sig||C(B.s)
const boost::regex &get_sig_caller_pattern() {
	static const boost::regex pattern(
		with_var(R"({v}=({v})\.sig\|\|({v})\(\1\.s\))"),
		boost::regex::optimize);
	return pattern;
}

// Inlined swapper: var b=a[0];a[0]=a[63%a.length];a[63]=b;
const boost::regex &get_inline_swap_pattern() {
	static const boost::regex pattern(
		with_var(
			R"(var\s({v})=({v})\[0\];\2\[0\]=\2\[(\d+)%\2\.length\];\2\[\3\]=\1;)"),
		boost::regex::optimize);
	return pattern;
}

const boost::regex &get_split_pattern() {
	static const boost::regex pattern(
		with_var(R"(^({v})=\1\.{v}\(["']{{2}}\)$)"), boost::regex::optimize);
	return pattern;
}

const boost::regex &get_reverse_pattern() {
	static const boost::regex pattern(
		with_var(R"(^({v})=\1\.{v}\(\)$)"), boost::regex::optimize);
	return pattern;
}

const boost::regex &get_slice_pattern() {
	static const boost::regex pattern(
		with_var(R"(^({v})=\1\.{v}\((\d+)\)$)"), boost::regex::optimize);
	return pattern;
}

// A=F(A,N)
const boost::regex &get_assign_call_pattern() {
	static const boost::regex pattern(
		with_var(R"(^({v})=({v})\(\1,(\d+)\)$)"), boost::regex::optimize);
	return pattern;
}

// F(A,N)
const boost::regex &get_bare_call_pattern() {
	static const boost::regex pattern(
		with_var(R"(^()({v})\({v},(\d+)\)$)"), boost::regex::optimize);
	return pattern;
}

const boost::regex &get_join_pattern() {
	static const boost::regex pattern(
		with_var(R"(^return\s+{v}\.{v}\(["']{{2}}\)$)"),
		boost::regex::optimize);
	return pattern;
}

const boost::regex &get_helper_swap_pattern() {
	static const boost::regex pattern(
		with_var(R"(var\s({v})=({v})\[0\];)"), boost::regex::optimize);
	return pattern;
}

const boost::regex &get_helper_reverse_pattern() {
	static const boost::regex pattern(
		with_var(R"(\b{v}\.reverse\()"), boost::regex::optimize);
	return pattern;
}

const boost::regex &get_helper_slice_pattern() {
	static const boost::regex pattern(
		with_var(R"(return\s*{v}\.slice|\b{v}\.splice)"),
		boost::regex::optimize);
	return pattern;
}

Result<std::string> find_function_body(std::string_view script,
									   const std::string &name) {
	// function C(D){...} or var C=function(D){...}
	static constexpr const char *kForms[] = {
		R"(\bfunction\s+\Q{name}\E\s*\({v}\)\s*\{{(.*?)\}})",
		R"(\bvar\s+\Q{name}\E\s*=\s*function\s*\({v}\)\s*\{{(.*?)\}})",
		R"((?:^|[;,\s])\Q{name}\E=function\({v}\)\{{(.*?)\}})",
	};
	for (const char *form : kForms) {
		boost::regex re(fmt::format(fmt::runtime(form), fmt::arg("v", kVar),
									fmt::arg("name", name)));
		boost::match_results<std::string_view::const_iterator> m;
		if (boost::regex_search(script.begin(), script.end(), m, re)) {
			return m[1].str();
		}
	}
	return make_error_code(errc::cipher_synthesis_failed);
}

// Decides what helper "D" does from its body: C={...D:function(a,b){...}}
Result<CipherStep> classify_helper(std::string_view script, std::string name,
								   std::size_t n) {
	if (auto dot = name.rfind('.'); dot != std::string::npos) {
		name = name.substr(dot + 1);
	}
	if (name == "swap") return CipherStep{CipherOp::swap_with_index, n};

	boost::regex re(fmt::format(
		R"(\b\Q{}\E:\s*function\s*\(.*?\)\s*(\{{[^{{}}]+\}}))", name));
	boost::match_results<std::string_view::const_iterator> m;
	if (!boost::regex_search(script.begin(), script.end(), m, re)) {
		spdlog::debug("Cipher helper {} not found", name);
		return make_error_code(errc::cipher_synthesis_failed);
	}
	const std::string body = m[1].str();

	if (boost::regex_search(body, get_helper_swap_pattern())) {
		return CipherStep{CipherOp::swap_with_index, n};
	}
	if (boost::regex_search(body, get_helper_reverse_pattern())) {
		return CipherStep{CipherOp::reverse, 0};
	}
	if (boost::regex_search(body, get_helper_slice_pattern())) {
		return CipherStep{CipherOp::slice_from, n};
	}
	spdlog::debug("Unrecognized cipher helper {}({}) = {}", name, n, body);
	return make_error_code(errc::cipher_synthesis_failed);
}

Result<std::size_t> step_arg(const boost::smatch &m, int group) {
	return utils::to_number<std::size_t>(m[group].str());
}

}  // namespace

Result<CipherProgram> synthesize_cipher(std::string_view version_key,
										std::string_view player_script) {
	if (player_script.empty()) {
		spdlog::error("Player script is empty");
		return make_error_code(errc::cipher_synthesis_failed);
	}
	spdlog::debug("Scanning player script {} ({} bytes)", version_key,
				  player_script.size());

	try {
		CipherProgram program;
		program.version_key = std::string(version_key);

		boost::match_results<std::string_view::const_iterator> m;
		if (!boost::regex_search(player_script.begin(), player_script.end(), m,
								 get_sts_pattern())) {
			spdlog::debug("{}: no sts parameter", version_key);
			return make_error_code(errc::cipher_synthesis_failed);
		}
		auto sts = utils::to_long(m[1].str());
		if (sts.has_error()) {
			return make_error_code(errc::cipher_synthesis_failed);
		}
		program.timestamp_param = sts.value();

		if (!boost::regex_search(player_script.begin(), player_script.end(), m,
								 get_sig_caller_pattern())) {
			spdlog::debug("{}: signature caller not found", version_key);
			return make_error_code(errc::cipher_synthesis_failed);
		}
		const std::string fn_name = m[2].str();
		spdlog::debug("Found signature function name: {}", fn_name);

		auto body = find_function_body(player_script, fn_name);
		if (body.has_error()) {
			spdlog::debug(
				"{}: unparsable function \"{}\"", version_key, fn_name);
			return body.error();
		}

		const std::string fn = boost::regex_replace(
			body.value(), get_inline_swap_pattern(), "$2=swap($2,$3);");

		const boost::regex separator(R"(\s*;\s*)");
		boost::sregex_token_iterator it(fn.begin(), fn.end(), separator, -1);
		for (boost::sregex_token_iterator end; it != end; ++it) {
			const std::string stmt = *it;
			if (stmt.empty()) continue;

			boost::smatch sm;
			if (boost::regex_match(stmt, sm, get_split_pattern())) continue;
			if (boost::regex_match(stmt, sm, get_join_pattern())) continue;

			if (boost::regex_match(stmt, sm, get_reverse_pattern())) {
				program.steps.push_back({CipherOp::reverse, 0});
			} else if (boost::regex_match(stmt, sm, get_slice_pattern())) {
				auto n = step_arg(sm, 2);
				if (n.has_error()) return n.error();
				program.steps.push_back({CipherOp::slice_from, n.value()});
			} else if (boost::regex_match(
						   stmt, sm, get_assign_call_pattern()) ||
					   boost::regex_match(
						   stmt, sm, get_bare_call_pattern())) {
				auto n = step_arg(sm, 3);
				if (n.has_error()) return n.error();
				auto step =
					classify_helper(player_script, sm[2].str(), n.value());
				if (step.has_error()) return step.error();
				program.steps.push_back(step.value());
			} else {
				spdlog::debug("{}: unparsable statement: {}", version_key, stmt);
				return make_error_code(errc::cipher_synthesis_failed);
			}
		}

		return program;

	} catch (const boost::regex_error &e) {
		spdlog::error("Regex error during cipher synthesis: {}", e.what());
		return make_error_code(errc::cipher_synthesis_failed);
	} catch (const std::runtime_error &e) {
		// boost::regex throws on excessive backtracking
		spdlog::error("Cipher synthesis failed: {}", e.what());
		return make_error_code(errc::cipher_synthesis_failed);
	}
}

}  // namespace tubedown::cipher
