#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <iostream>
#include <tubedown/engine.hpp>

using namespace tubedown;

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("tubedown", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	boost::asio::io_context ioc;
	auto work_guard = boost::asio::make_work_guard(ioc);

	EngineConfig config;
	config.bandwidth_ceiling_bps = 8.0 * 1024 * 1024;  // 1 MiB/s
	Engine engine(ioc.get_executor(), config);

	ResourceDescriptor resource;
	resource.url = argc > 1 ? argv[1] : "http://example.com/";
	resource.output = OutputTarget::file(argc > 2 ? argv[2] : "fetched.bin");

	std::cout << "Fetching " << resource.url << "...\n";

	engine.async_fetch(
		resource,
		[](const std::string &status, const DownloadProgress &prog) {
			std::cout << "\r" << status << ": "
					  << prog.total_downloaded_bytes / 1024 << " KB ("
					  << static_cast<int>(prog.percentage) << "%)   "
					  << std::flush;
		},
		[&](Result<TransferResult> res) {
			if (res.has_error()) {
				spdlog::error("Fetch failed: {}", res.error().message());
			} else {
				std::cout << "\n"
						  << res.value().status_line << "\n"
						  << "Final URL: " << res.value().final_url << "\n"
						  << "Bytes: " << res.value().bytes_written << " in "
						  << res.value().segments << " segment(s)\n";
			}
			work_guard.reset();
		});

	ioc.run();
	return 0;
}
