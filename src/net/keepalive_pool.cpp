#include <spdlog/spdlog.h>

#include <tubedown/keepalive_pool.hpp>

#include "net/connection.hpp"

namespace tubedown {

KeepAlivePool::KeepAlivePool() = default;

KeepAlivePool::~KeepAlivePool() = default;

std::unique_ptr<net::Connection> KeepAlivePool::take(const PoolKey &key) {
	std::lock_guard lock(mutex_);
	auto it = idle_.find(key);
	if (it == idle_.end()) return nullptr;
	auto conn = std::move(it->second);
	idle_.erase(it);
	spdlog::debug("Reusing pooled connection for {}", key.to_string());
	return conn;
}

void KeepAlivePool::put(std::unique_ptr<net::Connection> conn) {
	if (!conn) return;
	std::unique_ptr<net::Connection> replaced;
	{
		std::lock_guard lock(mutex_);
		auto &slot = idle_[conn->key()];
		replaced = std::move(slot);
		slot = std::move(conn);
		spdlog::debug("Returned connection to pool for {} (pool size: {})",
					  slot->key().to_string(), idle_.size());
	}
	if (replaced) replaced->close();
}

std::size_t KeepAlivePool::size() const {
	std::lock_guard lock(mutex_);
	return idle_.size();
}

void KeepAlivePool::clear() {
	std::map<PoolKey, std::unique_ptr<net::Connection>> dropped;
	{
		std::lock_guard lock(mutex_);
		dropped.swap(idle_);
	}
	for (auto &[key, conn] : dropped) {
		if (conn) conn->close();
	}
}

}  // namespace tubedown
