#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <optional>
#include <tubedown/engine.hpp>
#include <tubedown/keepalive_pool.hpp>

#include "net/connection.hpp"
#include "net/connection_manager.hpp"

using namespace tubedown;

namespace beast = boost::beast;

namespace {

PoolKey key(std::string host, unsigned short port = 80) {
	return PoolKey{"http", std::move(host), port};
}

class KeepAlivePoolTest : public ::testing::Test {
   protected:
	std::unique_ptr<net::Connection> make_conn(const PoolKey &k) {
		return std::make_unique<net::Connection>(
			k, std::make_unique<beast::tcp_stream>(ioc_));
	}

	asio::io_context ioc_;
	KeepAlivePool pool_;
};

}  // namespace

TEST_F(KeepAlivePoolTest, TakeFromEmptyPool) {
	EXPECT_EQ(pool_.take(key("a.example")), nullptr);
	EXPECT_EQ(pool_.size(), 0u);
}

TEST_F(KeepAlivePoolTest, PutThenTakeRemoves) {
	auto conn = make_conn(key("a.example"));
	auto *raw = conn.get();
	pool_.put(std::move(conn));
	EXPECT_EQ(pool_.size(), 1u);

	auto back = pool_.take(key("a.example"));
	EXPECT_EQ(back.get(), raw);
	EXPECT_EQ(pool_.size(), 0u);
	EXPECT_EQ(pool_.take(key("a.example")), nullptr);
}

TEST_F(KeepAlivePoolTest, KeyIncludesSchemeAndPort) {
	pool_.put(make_conn(key("a.example", 80)));
	EXPECT_EQ(pool_.take(key("a.example", 8080)), nullptr);
	EXPECT_EQ(pool_.take(PoolKey{"https", "a.example", 80}), nullptr);
	EXPECT_EQ(pool_.take(key("b.example", 80)), nullptr);
	EXPECT_NE(pool_.take(key("a.example", 80)), nullptr);
}

TEST_F(KeepAlivePoolTest, PutReplacesExistingEntry) {
	auto first = make_conn(key("a.example"));
	auto second = make_conn(key("a.example"));
	auto *second_raw = second.get();

	pool_.put(std::move(first));
	pool_.put(std::move(second));
	EXPECT_EQ(pool_.size(), 1u);
	EXPECT_EQ(pool_.take(key("a.example")).get(), second_raw);
}

TEST_F(KeepAlivePoolTest, PutNullIsIgnored) {
	pool_.put(nullptr);
	EXPECT_EQ(pool_.size(), 0u);
}

TEST_F(KeepAlivePoolTest, ClearEmptiesEveryKey) {
	pool_.put(make_conn(key("a.example")));
	pool_.put(make_conn(key("b.example")));
	pool_.put(make_conn(key("c.example", 81)));
	EXPECT_EQ(pool_.size(), 3u);

	pool_.clear();
	EXPECT_EQ(pool_.size(), 0u);
	EXPECT_EQ(pool_.take(key("a.example")), nullptr);
}

TEST(PoolKeyTest, ToString) {
	EXPECT_EQ(key("media.example", 8080).to_string(),
			  "http://media.example:8080");
}

// =============================================================================
// In-flight tracking
// =============================================================================

TEST(InFlightSetTest, CancelAllRunsPendingHooks) {
	net::InFlightSet set;
	int first = 0;
	int second = 0;
	set.add_pending([&first] { ++first; });
	auto id = set.add_pending([&second] { ++second; });
	set.remove_pending(id);
	EXPECT_EQ(set.pending(), 1u);
	EXPECT_FALSE(set.cancelled());

	set.cancel_all();
	EXPECT_TRUE(set.cancelled());
	EXPECT_EQ(first, 1);
	EXPECT_EQ(second, 0);
}

TEST_F(KeepAlivePoolTest, CancelledSetStopsNewConnections) {
	net::InFlightSet set;
	set.cancel_all();

	net::ConnectionManager manager(EngineConfig{}, nullptr);
	std::optional<std::error_code> got;
	asio::spawn(
		ioc_,
		[&](asio::yield_context yield) {
			auto conn = manager.acquire(key("127.0.0.1", 9), yield, &set);
			got = conn.has_error() ? conn.error() : std::error_code{};
		},
		[](std::exception_ptr e) {
			if (e) std::rethrow_exception(e);
		});
	ioc_.run();

	ASSERT_TRUE(got.has_value());
	EXPECT_EQ(*got, errc::cancelled);
}

// =============================================================================
// Shared pools
// =============================================================================

namespace {

class CountingPool : public KeepAlivePool {
   public:
	void clear() override {
		++clears;
		KeepAlivePool::clear();
	}

	std::atomic<int> clears{0};
};

}  // namespace

TEST(SharedPoolTest, EngineUsesInjectedPool) {
	asio::io_context ioc;
	auto pool = std::make_shared<CountingPool>();

	Engine a(ioc.get_executor(), EngineConfig{}, pool);
	Engine b(ioc.get_executor(), EngineConfig{}, pool);
	EXPECT_EQ(a.pool().get(), pool.get());
	EXPECT_EQ(b.pool().get(), pool.get());

	a.shutdown();
	EXPECT_EQ(pool->clears.load(), 1);
}

TEST(SharedPoolTest, EngineMakesPrivatePoolByDefault) {
	asio::io_context ioc;
	Engine a(ioc.get_executor(), EngineConfig{});
	Engine b(ioc.get_executor(), EngineConfig{});
	ASSERT_NE(a.pool(), nullptr);
	EXPECT_NE(a.pool().get(), b.pool().get());
}
