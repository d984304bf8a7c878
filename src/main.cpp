#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/program_options.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <tubedown/cipher.hpp>
#include <tubedown/engine.hpp>
#include <tubedown/types.hpp>
#include <utility>
#include <vector>

#include "downloader/progress_reporter.hpp"
#include "utils.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;

// =============================================================================
// CLI Application using Coroutines
// =============================================================================

struct CliOptions {
	std::string url;
	std::optional<std::string> output;
	std::optional<std::string> referer;
	tubedown::HeaderList headers;
	std::optional<long long> expected_bytes;
	std::optional<long long> max_bytes;

	bool progress = false;
	bool quiet = false;
	bool dump_json = false;
};

// "Name: value" as given to -H
std::optional<std::pair<std::string, std::string>> parse_header(
	std::string_view line) {
	auto colon = line.find(':');
	if (colon == std::string_view::npos || colon == 0) return std::nullopt;
	auto name = tubedown::utils::trim(line.substr(0, colon));
	auto value = tubedown::utils::trim(line.substr(colon + 1));
	if (name.empty()) return std::nullopt;
	return std::make_pair(std::string(name), std::string(value));
}

nlohmann::json to_json(const CliOptions &opts,
					   const tubedown::TransferResult &res) {
	nlohmann::json j;
	j["url"] = opts.url;
	j["final_url"] = res.final_url;
	j["status_line"] = res.status_line;
	j["status_code"] = res.status_code;
	j["bytes_written"] = res.bytes_written;
	if (res.document_length) {
		j["document_length"] = *res.document_length;
	} else {
		j["document_length"] = nullptr;
	}
	j["redirects"] = res.redirects;
	j["resumes"] = res.resumes;
	j["segments"] = res.segments;
	j["elapsed_ms"] = res.elapsed.count();
	if (opts.output) j["output"] = *opts.output;

	nlohmann::json headers = nlohmann::json::object();
	for (const auto &[name, value] : res.headers) headers[name] = value;
	j["headers"] = headers;
	return j;
}

void print_stats(const CliOptions &opts, const tubedown::TransferResult &res) {
	using tubedown::utils::fmt_bps;
	using tubedown::utils::fmt_duration;
	using tubedown::utils::fmt_size;

	const double secs = static_cast<double>(res.elapsed.count()) / 1000.0;
	const double bps =
		secs > 0 ? static_cast<double>(res.bytes_written) * 8.0 / secs : 0.0;

	if (opts.output) fmt::print(stderr, "wrote \"{}\"\n", *opts.output);
	fmt::print(stderr, "{}, downloaded in {}, {}\n",
			   fmt_size(res.bytes_written),
			   fmt_duration(std::chrono::duration_cast<std::chrono::seconds>(
				   res.elapsed)),
			   fmt_bps(bps));
}

// Main application logic using yield_context for clean async
int run_app(tubedown::Engine &engine, const CliOptions &opts,
			asio::yield_context yield) {
	tubedown::ResourceDescriptor resource;
	resource.url = opts.url;
	resource.referer = opts.referer;
	resource.extra_headers = opts.headers;
	resource.expected_bytes = opts.expected_bytes;
	resource.max_bytes = opts.max_bytes;
	resource.output = opts.output ? tubedown::OutputTarget::file(*opts.output)
								  : tubedown::OutputTarget::memory();
	resource.accept_compressed = !opts.output.has_value();

	std::optional<tubedown::downloader::ProgressReporter> reporter;
	if (opts.progress && !opts.quiet) reporter.emplace(stderr);

	tubedown::ProgressCallback on_progress;
	if (reporter) {
		on_progress = [&reporter](const std::string &,
								  const tubedown::DownloadProgress &prog) {
			std::optional<double> ratio;
			if (prog.total_size_bytes > 0) {
				ratio = static_cast<double>(prog.total_downloaded_bytes) /
						prog.total_size_bytes;
			}
			reporter->report(ratio, prog.speed_bytes_per_sec * 8.0, false);
		};
	}

	auto result = engine.async_fetch(std::move(resource), on_progress, yield);
	if (reporter) reporter->report(std::nullopt, 0.0, true);

	if (result.has_error()) {
		fmt::print(stderr, "ERROR: Fetching {} failed: {}\n", opts.url,
				   result.error().message());
		return 1;
	}

	const auto &res = result.value();
	if (opts.dump_json) {
		std::cout << to_json(opts, res).dump(2) << "\n";
	} else if (!opts.output) {
		std::fwrite(res.body.data(), 1, res.body.size(), stdout);
		std::fflush(stdout);
	}

	if (!opts.quiet) print_stats(opts, res);
	return 0;
}

// --decipher KEY TOKEN [--player-script FILE]
int run_decipher(const std::vector<std::string> &args,
				 const std::optional<std::string> &script_path) {
	if (args.size() != 2) {
		spdlog::error("Usage: --decipher <version_key> <token>");
		return 1;
	}

	std::optional<std::string> script;
	if (script_path) {
		std::ifstream in(*script_path, std::ios::binary);
		if (!in) {
			spdlog::error("Cannot read player script {}", *script_path);
			return 1;
		}
		std::ostringstream ss;
		ss << in.rdbuf();
		script = ss.str();
	}

	auto res = tubedown::cipher::decipher_signature(
		args[0], args[1],
		script ? std::optional<std::string_view>(*script) : std::nullopt);
	if (res.has_error()) {
		spdlog::error("Cannot decipher with {}: {}", args[0],
					  res.error().message());
		return 1;
	}

	spdlog::debug("Program: {}", res.value().program.to_string());
	fmt::print("{}\n", res.value().value);
	return 0;
}

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[tubedown] %v");

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("url", po::value<std::string>(), "URL to fetch")
			// Request
			("output,o", po::value<std::string>(),
			 "Write the body to FILE instead of stdout")
			("referer", po::value<std::string>(), "Referer header to send")
			("header,H", po::value<std::vector<std::string>>(),
			 "Extra request header \"Name: value\" (repeatable)")
			("expected-bytes", po::value<long long>(),
			 "Size hint; large files are fetched in parallel segments")
			("max-bytes", po::value<long long>(),
			 "Fetch only the first N bytes")
			// Engine
			("workers", po::value<int>(),
			 "Maximum parallel connections per file (default 30)")
			("limit-rate", po::value<double>(),
			 "Bandwidth ceiling in bits per second")
			("proxy", po::value<std::string>(),
			 "HTTP proxy, [http[s]://]host:port (default: $http_proxy)")
			("idle-timeout", po::value<int>(),
			 "Seconds without data before a read gives up (default 30)")
			// Display
			("progress", "Draw a progress line on stderr")
			("quiet,q", "Suppress progress and statistics")
			("dump-json,j", "Print the transfer result as JSON")
			("verbose,v", "Enable verbose logging")
			// Cipher
			("decipher", po::value<std::vector<std::string>>()->multitoken(),
			 "Decipher a signature: --decipher <version_key> <token>")
			("player-script", po::value<std::string>(),
			 "Player script to derive unknown ciphers from");
		// clang-format on

		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: tubedown [options] <url>\n" << desc << "\n";
			return 0;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else if (vm.count("quiet")) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		// Cipher self-test (sync operation, no async needed)
		if (vm.count("decipher")) {
			std::optional<std::string> script;
			if (vm.count("player-script")) {
				script = vm["player-script"].as<std::string>();
			}
			return run_decipher(
				vm["decipher"].as<std::vector<std::string>>(), script);
		}

		if (!vm.count("url")) {
			std::cout << "Usage: tubedown [options] <url>\n" << desc << "\n";
			return 1;
		}

		// Build CLI options
		CliOptions opts;
		opts.url = vm["url"].as<std::string>();
		if (vm.count("output")) opts.output = vm["output"].as<std::string>();
		if (vm.count("referer")) {
			opts.referer = vm["referer"].as<std::string>();
		}
		if (vm.count("header")) {
			for (const auto &h : vm["header"].as<std::vector<std::string>>()) {
				auto parsed = parse_header(h);
				if (!parsed) {
					spdlog::error("Malformed header \"{}\"", h);
					return 1;
				}
				opts.headers.push_back(std::move(*parsed));
			}
		}
		if (vm.count("expected-bytes")) {
			opts.expected_bytes = vm["expected-bytes"].as<long long>();
		}
		if (vm.count("max-bytes")) {
			opts.max_bytes = vm["max-bytes"].as<long long>();
		}
		opts.progress = vm.count("progress") > 0;
		opts.quiet = vm.count("quiet") > 0;
		opts.dump_json = vm.count("dump-json") > 0;

		// Engine configuration
		tubedown::EngineConfig config;
		if (vm.count("workers")) {
			config.segments.max_workers = vm["workers"].as<int>();
		}
		if (vm.count("limit-rate")) {
			config.bandwidth_ceiling_bps = vm["limit-rate"].as<double>();
		}
		if (vm.count("idle-timeout")) {
			config.idle_timeout =
				std::chrono::seconds(vm["idle-timeout"].as<int>());
		}

		std::optional<std::string> proxy;
		if (vm.count("proxy")) {
			proxy = vm["proxy"].as<std::string>();
		} else if (const char *env = std::getenv("http_proxy")) {
			proxy = env;
		} else if (const char *env_upper = std::getenv("HTTP_PROXY")) {
			proxy = env_upper;
		}
		if (proxy && !proxy->empty()) {
			auto parsed = tubedown::parse_proxy(*proxy);
			if (parsed.has_error()) {
				spdlog::error("Invalid proxy \"{}\": {}", *proxy,
							  parsed.error().message());
				return 1;
			}
			config.proxy = parsed.value();
			spdlog::debug("Using proxy {}://{}:{}", config.proxy->scheme,
						  config.proxy->host, config.proxy->port);
		}

		// Setup async context
		asio::io_context ioc;
		tubedown::Engine engine(ioc.get_executor(), config);

		// Setup signal handling using asio::signal_set
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				fmt::print(stderr, "\nExiting, received signal {}.\n", sig);
				engine.shutdown();
			}
		});

		// Run the app in a coroutine
		int exit_code = 0;
		asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				exit_code = run_app(engine, opts, yield);
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});

		ioc.run();

		return exit_code;

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return 1;
	}
}
