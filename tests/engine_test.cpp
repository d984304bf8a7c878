#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <tubedown/engine.hpp>

#include "fixture_server.hpp"

using namespace tubedown;
using tubedown::test::fixture_bytes;
using tubedown::test::FixtureServer;

namespace fs = std::filesystem;

namespace {

class EngineTest : public ::testing::Test {
   protected:
	void SetUp() override {
		dir_ = fs::temp_directory_path() /
			   fmt::format("tubedown-test-{}-{}",
						   ::testing::UnitTest::GetInstance()
							   ->current_test_info()
							   ->name(),
						   server_.port());
		fs::create_directories(dir_);
		config_.retry.retry_delay = std::chrono::milliseconds(0);
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(dir_, ec);
	}

	std::string file(const std::string &name) const {
		return (dir_ / name).string();
	}

	static std::string slurp(const std::string &path) {
		std::ifstream in(path, std::ios::binary);
		std::ostringstream ss;
		ss << in.rdbuf();
		return ss.str();
	}

	ResourceDescriptor to_file(std::string_view path, const std::string &out) {
		ResourceDescriptor r;
		r.url = server_.url(path);
		r.output = OutputTarget::file(out);
		return r;
	}

	ResourceDescriptor to_memory(std::string_view path) {
		ResourceDescriptor r;
		r.url = server_.url(path);
		return r;
	}

	Result<TransferResult> fetch(Engine &engine, ResourceDescriptor resource,
								 ProgressCallback cb = {}) {
		std::optional<Result<TransferResult>> out;
		engine.async_fetch(std::move(resource), std::move(cb),
						   [&out](Result<TransferResult> res) {
							   out.emplace(std::move(res));
						   });
		ioc_.run();
		ioc_.restart();
		if (!out) return make_error_code(errc::unknown);
		return std::move(*out);
	}

	Result<TransferResult> fetch(ResourceDescriptor resource,
								 ProgressCallback cb = {}) {
		Engine engine(ioc_.get_executor(), config_);
		return fetch(engine, std::move(resource), std::move(cb));
	}

	FixtureServer server_;
	asio::io_context ioc_;
	EngineConfig config_;
	fs::path dir_;
};

}  // namespace

// =============================================================================
// Plain transfers
// =============================================================================

TEST_F(EngineTest, FetchesIntoMemory) {
	auto res = fetch(to_memory("/blob/5000"));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().status_code, 200);
	EXPECT_EQ(res.value().status_line, "HTTP/1.1 200 OK");
	EXPECT_EQ(res.value().bytes_written, 5000);
	EXPECT_EQ(res.value().document_length, 5000);
	EXPECT_EQ(res.value().body, fixture_bytes(0, 5000));
	EXPECT_EQ(res.value().final_url, server_.url("/blob/5000"));
	EXPECT_EQ(res.value().redirects, 0);
	EXPECT_EQ(res.value().resumes, 0);
	EXPECT_EQ(res.value().segments, 1);
	EXPECT_EQ(res.value().headers.count("content-length"), 1u);
}

TEST_F(EngineTest, FetchesIntoFile) {
	const auto out = file("blob.bin");
	auto res = fetch(to_file("/blob/70000", out));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_TRUE(res.value().body.empty());
	EXPECT_EQ(slurp(out), fixture_bytes(0, 70000));
}

TEST_F(EngineTest, SendsRefererAndExtraHeadersInOrder) {
	auto r = to_memory("/blob/10");
	r.referer = "https://www.youtube.com/watch?v=abc";
	r.extra_headers = {{"X-One", "1"}, {"Cookie", "a=b"}};
	ASSERT_TRUE(fetch(std::move(r)).has_value());

	auto log = server_.requests_to("/blob/10");
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].header("Referer"), "https://www.youtube.com/watch?v=abc");
	EXPECT_EQ(log[0].header("X-One"), "1");
	EXPECT_EQ(log[0].header("Cookie"), "a=b");
	EXPECT_EQ(log[0].header("User-Agent"), config_.user_agent);
	EXPECT_TRUE(log[0].header("Range").empty());
}

TEST_F(EngineTest, RepeatedExtraHeadersAreAllSent) {
	auto r = to_memory("/blob/10");
	r.extra_headers = {
		{"User-Agent", "custom/2"}, {"X-Tag", "a"}, {"x-tag", "b"}};
	ASSERT_TRUE(fetch(std::move(r)).has_value());

	auto log = server_.requests_to("/blob/10");
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].header("User-Agent"), "custom/2");
	EXPECT_EQ(log[0].header("X-Tag"), "a, b");
}

TEST_F(EngineTest, ReportsProgressUpToTheTotal) {
	auto r = to_memory("/blob/300000");
	r.expected_bytes = 300000;
	std::vector<long long> seen;
	auto res = fetch(std::move(r), [&seen](const std::string &,
										   const DownloadProgress &p) {
		seen.push_back(p.total_downloaded_bytes);
		EXPECT_EQ(p.total_size_bytes, 300000);
	});
	ASSERT_TRUE(res.has_value()) << res.error().message();
	ASSERT_FALSE(seen.empty());
	EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
	EXPECT_EQ(seen.back(), 300000);
}

TEST_F(EngineTest, DecodesGzipForMemoryTargets) {
	auto r = to_memory("/gzip");
	r.accept_compressed = true;
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().body, FixtureServer::kGzipText);

	auto log = server_.requests_to("/gzip");
	ASSERT_EQ(log.size(), 1u);
	EXPECT_NE(log[0].header("Accept-Encoding").find("gzip"), std::string::npos);
}

TEST_F(EngineTest, RejectsUnsupportedUrl) {
	ResourceDescriptor r;
	r.url = "ftp://example.com/file";
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::invalid_url);
	EXPECT_EQ(server_.requests(), 0);
}

// =============================================================================
// Prefix fetches
// =============================================================================

TEST_F(EngineTest, MaxBytesAsksForAPrefix) {
	auto r = to_memory("/blob/10000");
	r.max_bytes = 1000;
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().body, fixture_bytes(0, 1000));
	EXPECT_EQ(res.value().status_code, 206);

	auto log = server_.requests_to("/blob/10000");
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].header("Range"), "bytes=0-999");
}

TEST_F(EngineTest, MaxBytesStopsWhenRangeIsIgnored) {
	auto r = to_memory("/norange/10000");
	r.max_bytes = 1000;
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().bytes_written, 1000);
	EXPECT_EQ(res.value().body, fixture_bytes(0, 1000));
}

TEST_F(EngineTest, NonPositiveMaxBytesFetchesEverything) {
	auto r = to_memory("/blob/2000");
	r.max_bytes = 0;
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().bytes_written, 2000);
}

// =============================================================================
// Resume
// =============================================================================

TEST_F(EngineTest, ResumesTruncatedTransfer) {
	const auto out = file("truncated.bin");
	auto res = fetch(to_file("/truncate/100000/30000", out));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().resumes, 1);
	EXPECT_EQ(res.value().bytes_written, 100000);
	EXPECT_EQ(slurp(out), fixture_bytes(0, 100000));

	auto log = server_.requests_to("/truncate/");
	ASSERT_EQ(log.size(), 2u);
	EXPECT_TRUE(log[0].header("Range").empty());
	EXPECT_EQ(log[1].header("Range"), "bytes=30000-");
}

TEST_F(EngineTest, RestartsWhenResumeRangeIsIgnored) {
	const auto out = file("restart.bin");
	auto res = fetch(to_file("/truncate-norange/50000/20000", out));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().resumes, 1);
	EXPECT_EQ(res.value().status_code, 200);
	EXPECT_EQ(slurp(out), fixture_bytes(0, 50000));
}

TEST_F(EngineTest, ResumesAfterIdleTimeout) {
	config_.idle_timeout = std::chrono::milliseconds(300);
	auto res = fetch(to_memory("/stall/40000/10000"));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().resumes, 1);
	EXPECT_EQ(res.value().body, fixture_bytes(0, 40000));

	auto log = server_.requests_to("/stall/");
	ASSERT_EQ(log.size(), 2u);
	EXPECT_EQ(log[1].header("Range"), "bytes=10000-");
}

// =============================================================================
// Redirects and errors
// =============================================================================

TEST_F(EngineTest, FollowsRedirect) {
	auto res = fetch(to_memory("/redirect-to/blob/100"));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().redirects, 1);
	EXPECT_EQ(res.value().final_url, server_.url("/blob/100"));
	EXPECT_EQ(res.value().body, fixture_bytes(0, 100));

	auto log = server_.requests_to("/blob/100");
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].header("Referer"), server_.url("/redirect-to/blob/100"));
}

TEST_F(EngineTest, StopsAfterTooManyRedirects) {
	config_.retry.max_redirects = 3;
	auto res = fetch(to_memory("/redirect/0"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::too_many_redirects);
	EXPECT_EQ(server_.requests_to("/redirect/").size(), 4u);
}

TEST_F(EngineTest, CaptchaRedirectIsFatal) {
	auto res = fetch(to_memory("/sorry"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::captcha_required);
	EXPECT_EQ(server_.requests(), 1);
}

TEST_F(EngineTest, TooManyRequestsIsNotRetried) {
	auto res = fetch(to_memory("/ratelimit"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::rate_limited);
	EXPECT_EQ(server_.requests(), 1);
}

TEST_F(EngineTest, RateLimitPageIsNotRetried) {
	auto res = fetch(to_memory("/ratebody"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::rate_limited);
	EXPECT_EQ(server_.requests(), 1);
}

TEST_F(EngineTest, ServerErrorsSpendTheBudget) {
	config_.retry.error_budget = 2;
	auto res = fetch(to_memory("/error500"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::http_error);
	EXPECT_EQ(server_.requests(), 3);
}

TEST_F(EngineTest, TransientErrorIsRetried) {
	auto res = fetch(to_memory("/flaky/800"));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().body, fixture_bytes(0, 800));
	EXPECT_EQ(server_.requests(), 2);
}

TEST_F(EngineTest, ConnectFailureIsReported) {
	config_.retry.error_budget = 0;
	ResourceDescriptor r;
	// Nothing listens on the discard port of the loopback address
	r.url = "http://127.0.0.1:9/x";
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::connect_failed);
}

// =============================================================================
// Existing output
// =============================================================================

TEST_F(EngineTest, RefusedFetchLeavesExistingFileAlone) {
	const auto out = file("existing.bin");
	{
		std::ofstream old(out, std::ios::binary);
		old << "an older download, 27 bytes";
	}
	auto res = fetch(to_file("/ratelimit", out));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::rate_limited);
	EXPECT_EQ(slurp(out), "an older download, 27 bytes");
}

TEST_F(EngineTest, UnreachableOriginLeavesExistingFileAlone) {
	config_.retry.error_budget = 0;
	const auto out = file("existing.bin");
	{
		std::ofstream old(out, std::ios::binary);
		old << "keep me";
	}
	ResourceDescriptor r;
	r.url = "http://127.0.0.1:9/x";
	r.output = OutputTarget::file(out);
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::connect_failed);
	EXPECT_EQ(slurp(out), "keep me");
}

TEST_F(EngineTest, EmptyBodyCreatesEmptyFile) {
	const auto out = file("empty.bin");
	auto res = fetch(to_file("/blob/0", out));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	ASSERT_TRUE(fs::exists(out));
	EXPECT_EQ(fs::file_size(out), 0u);
}

// =============================================================================
// Segmented transfers
// =============================================================================

TEST_F(EngineTest, SplitsLargeFileIntoSegments) {
	config_.segments.max_workers = 4;
	const auto out = file("large.bin");
	auto r = to_file("/blob/25000000", out);
	r.expected_bytes = 25000000;

	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().segments, 4);
	EXPECT_EQ(res.value().bytes_written, 25000000);
	EXPECT_EQ(fs::file_size(out), 25000000u);
	EXPECT_TRUE(slurp(out) == fixture_bytes(0, 25000000));

	std::set<std::string> ranges;
	for (const auto &req : server_.requests_to("/blob/25000000")) {
		ranges.insert(req.header("Range"));
	}
	EXPECT_EQ(ranges, (std::set<std::string>{"bytes=0-",
											 "bytes=6250000-12499999",
											 "bytes=12500000-18749999",
											 "bytes=18750000-24999999"}));
}

TEST_F(EngineTest, SmallFileIsNotSegmented) {
	config_.segments.max_workers = 4;
	auto r = to_file("/blob/4000", file("small.bin"));
	r.expected_bytes = 4000;
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().segments, 1);
	EXPECT_EQ(server_.requests(), 1);
}

TEST_F(EngineTest, FailingSegmentFailsTheTransfer) {
	config_.segments.max_workers = 4;
	config_.segments.threshold_bytes = 1000;
	config_.segments.min_chunk_bytes = 100;
	const auto out = file("segfail.bin");
	auto r = to_file("/segfail/8000", out);
	r.expected_bytes = 8000;

	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::http_error);
	EXPECT_FALSE(fs::exists(out));
}

TEST_F(EngineTest, MisplacedSegmentFailsTheTransfer) {
	config_.segments.max_workers = 4;
	config_.segments.threshold_bytes = 1000;
	config_.segments.min_chunk_bytes = 100;
	const auto out = file("badrange.bin");
	auto r = to_file("/badrange/8000", out);
	r.expected_bytes = 8000;

	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::range_not_honored);
	EXPECT_FALSE(fs::exists(out));
}

// =============================================================================
// Connections
// =============================================================================

TEST_F(EngineTest, ReusesKeepAliveConnection) {
	Engine engine(ioc_.get_executor(), config_);
	ASSERT_TRUE(fetch(engine, to_memory("/blob/1000")).has_value());
	EXPECT_EQ(engine.pool()->size(), 1u);
	ASSERT_TRUE(fetch(engine, to_memory("/blob/2000")).has_value());
	EXPECT_EQ(server_.requests(), 2);
	EXPECT_EQ(server_.connections(), 1);
}

TEST_F(EngineTest, PlainHttpThroughProxyUsesAbsoluteForm) {
	config_.proxy = ProxyConfig{"http", "127.0.0.1", server_.port()};
	ResourceDescriptor r;
	r.url = "http://origin.test:8000/blob/64?id=7";
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_value()) << res.error().message();
	EXPECT_EQ(res.value().body, fixture_bytes(0, 64));

	auto log = server_.log();
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].target, "http://origin.test:8000/blob/64?id=7");
	EXPECT_EQ(log[0].header("Host"), "origin.test:8000");
}

TEST_F(EngineTest, RefusedTunnelIsProxyError) {
	config_.proxy = ProxyConfig{"http", "127.0.0.1", server_.port()};
	ResourceDescriptor r;
	r.url = "https://origin.test/blob/64";
	auto res = fetch(std::move(r));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::proxy_error);

	auto log = server_.log();
	ASSERT_EQ(log.size(), 1u);
	EXPECT_EQ(log[0].method, "CONNECT");
	EXPECT_EQ(log[0].target, "origin.test:443");
}

// =============================================================================
// Bandwidth and shutdown
// =============================================================================

TEST_F(EngineTest, HoldsToBandwidthCeiling) {
	config_.bandwidth_ceiling_bps = 800000.0;
	const auto started = std::chrono::steady_clock::now();
	auto res = fetch(to_memory("/blob/50000"));
	const auto took = std::chrono::steady_clock::now() - started;
	ASSERT_TRUE(res.has_value()) << res.error().message();
	// 400,000 bits at 800,000 bits per second
	EXPECT_GE(took, std::chrono::milliseconds(450));
}

TEST_F(EngineTest, ShutdownCancelsTransfer) {
	config_.idle_timeout = std::chrono::seconds(10);
	Engine engine(ioc_.get_executor(), config_);
	const auto out = file("cancelled.bin");

	asio::steady_timer timer(ioc_, std::chrono::milliseconds(200));
	timer.async_wait([&engine](const boost::system::error_code &ec) {
		if (!ec) engine.shutdown();
	});

	auto res = fetch(engine, to_file("/stall/40000/10000", out));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::cancelled);
	EXPECT_FALSE(fs::exists(out));

	auto again = fetch(engine, to_memory("/blob/10"));
	ASSERT_TRUE(again.has_error());
	EXPECT_EQ(again.error(), errc::cancelled);
}

namespace {

// Completes TCP handshakes through the listen backlog but never answers
struct SilentListener {
	explicit SilentListener(asio::io_context &ioc)
		: acceptor(ioc, asio::ip::tcp::endpoint(
							asio::ip::make_address("127.0.0.1"), 0)) {}

	[[nodiscard]] unsigned short port() const {
		return acceptor.local_endpoint().port();
	}

	asio::ip::tcp::acceptor acceptor;
};

}  // namespace

TEST_F(EngineTest, ShutdownInterruptsTlsHandshake) {
	config_.idle_timeout = std::chrono::seconds(10);
	SilentListener silent(ioc_);
	Engine engine(ioc_.get_executor(), config_);

	asio::steady_timer timer(ioc_, std::chrono::milliseconds(200));
	timer.async_wait([&engine](const boost::system::error_code &ec) {
		if (!ec) engine.shutdown();
	});

	ResourceDescriptor r;
	r.url = fmt::format("https://127.0.0.1:{}/video", silent.port());
	const auto started = std::chrono::steady_clock::now();
	auto res = fetch(engine, std::move(r));
	const auto took = std::chrono::steady_clock::now() - started;

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::cancelled);
	EXPECT_LT(took, std::chrono::seconds(2));
}

TEST_F(EngineTest, ShutdownInterruptsProxyTunnel) {
	config_.idle_timeout = std::chrono::seconds(10);
	SilentListener silent(ioc_);
	config_.proxy = ProxyConfig{"http", "127.0.0.1", silent.port()};
	Engine engine(ioc_.get_executor(), config_);
	const auto out = file("tunnel.bin");

	asio::steady_timer timer(ioc_, std::chrono::milliseconds(200));
	timer.async_wait([&engine](const boost::system::error_code &ec) {
		if (!ec) engine.shutdown();
	});

	ResourceDescriptor r;
	r.url = "https://origin.test/blob/10";
	r.output = OutputTarget::file(out);
	const auto started = std::chrono::steady_clock::now();
	auto tunnelled = fetch(engine, std::move(r));
	const auto took = std::chrono::steady_clock::now() - started;

	ASSERT_TRUE(tunnelled.has_error());
	EXPECT_EQ(tunnelled.error(), errc::cancelled);
	EXPECT_LT(took, std::chrono::seconds(2));
	EXPECT_FALSE(fs::exists(out));
}
