#pragma once

#include <tubedown/tubedown_export.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace tubedown {

namespace net {
class Connection;
}

struct TUBEDOWN_EXPORT PoolKey {
	std::string scheme;
	std::string host;
	unsigned short port = 0;

	bool operator<(const PoolKey &o) const {
		return std::tie(scheme, host, port) < std::tie(o.scheme, o.host, o.port);
	}
	bool operator==(const PoolKey &o) const {
		return scheme == o.scheme && host == o.host && port == o.port;
	}

	[[nodiscard]] std::string to_string() const;
};

// Idle connections waiting for their next request, at most one per key.
// A connection is removed on take() and only comes back through put(), so it
// is never shared by two requests in flight. Every operation holds the mutex
// for its whole duration.
class TUBEDOWN_EXPORT KeepAlivePool {
   public:
	KeepAlivePool();
	virtual ~KeepAlivePool();

	KeepAlivePool(const KeepAlivePool &) = delete;
	KeepAlivePool &operator=(const KeepAlivePool &) = delete;

	// Removes and returns the idle connection for key, or nullptr
	virtual std::unique_ptr<net::Connection> take(const PoolKey &key);

	// Stores conn under its key, closing any entry it replaces
	virtual void put(std::unique_ptr<net::Connection> conn);

	[[nodiscard]] virtual std::size_t size() const;

	// Closes every idle connection
	virtual void clear();

   private:
	mutable std::mutex mutex_;
	std::map<PoolKey, std::unique_ptr<net::Connection>> idle_;
};

}  // namespace tubedown
