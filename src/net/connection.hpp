#pragma once

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <tubedown/keepalive_pool.hpp>
#include <variant>

namespace tubedown::net {

namespace beast = boost::beast;

// One open socket to an origin (or to a proxy on its behalf), either plain
// or TLS.
class Connection {
   public:
	using PlainStream = beast::tcp_stream;
	using TlsStream = beast::ssl_stream<beast::tcp_stream>;

	Connection(PoolKey key, std::unique_ptr<PlainStream> stream,
			   bool absolute_form = false);
	Connection(PoolKey key, std::unique_ptr<TlsStream> stream);
	~Connection();

	Connection(const Connection &) = delete;
	Connection &operator=(const Connection &) = delete;

	// Calls f with the stream to read from and write to
	template <typename F>
	decltype(auto) visit(F &&f) {
		return std::visit(
			[&](auto &stream) -> decltype(auto) { return f(*stream); },
			stream_);
	}

	beast::tcp_stream &lowest_layer();

	[[nodiscard]] const PoolKey &key() const { return key_; }
	[[nodiscard]] bool is_tls() const {
		return std::holds_alternative<std::unique_ptr<TlsStream>>(stream_);
	}
	// Plain HTTP through a proxy: the request target is the full URL
	[[nodiscard]] bool absolute_form() const { return absolute_form_; }

	[[nodiscard]] int requests_served() const { return requests_served_; }
	void count_request() { ++requests_served_; }

	// Aborts pending operations; completion handlers see operation_aborted
	void cancel();
	void close();

   private:
	PoolKey key_;
	std::variant<std::unique_ptr<PlainStream>, std::unique_ptr<TlsStream>>
		stream_;
	bool absolute_form_ = false;
	int requests_served_ = 0;
};

// Connections currently carrying a request for one transfer, so that the
// transfer can be torn down from outside its coroutines. Connections still
// being set up register an abort hook instead.
class InFlightSet {
   public:
	using AbortHook = std::function<void()>;

	void insert(Connection *conn) { conns_.insert(conn); }
	void erase(Connection *conn) { conns_.erase(conn); }
	[[nodiscard]] std::size_t size() const { return conns_.size(); }

	std::size_t add_pending(AbortHook hook) {
		pending_.emplace(++next_pending_, std::move(hook));
		return next_pending_;
	}
	void remove_pending(std::size_t id) { pending_.erase(id); }
	[[nodiscard]] std::size_t pending() const { return pending_.size(); }

	// Set once cancel_all() has run; later setups give up between steps
	[[nodiscard]] bool cancelled() const { return cancelled_; }

	void cancel_all() {
		cancelled_ = true;
		for (auto *conn : conns_) conn->cancel();
		for (auto &[id, hook] : pending_) hook();
	}

   private:
	std::set<Connection *> conns_;
	std::map<std::size_t, AbortHook> pending_;
	std::size_t next_pending_ = 0;
	bool cancelled_ = false;
};

}  // namespace tubedown::net
