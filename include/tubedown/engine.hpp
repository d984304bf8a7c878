#pragma once

#include <tubedown/tubedown_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>

#include "keepalive_pool.hpp"
#include "result.hpp"
#include "types.hpp"

namespace tubedown {

namespace asio = boost::asio;

// Fetches resources handed over by the discovery layer: redirects, resumes
// after stalls and truncation, parallel segments for large files, all
// behind a single completion.
//
// One Engine may run many transfers at once; they share the keep-alive pool
// but nothing else.
class TUBEDOWN_EXPORT Engine {
   public:
	Engine(const Engine &) = delete;
	Engine &operator=(const Engine &) = delete;
	Engine(Engine &&) noexcept;
	Engine &operator=(Engine &&) noexcept;
	~Engine();

	// pool may be shared between engines; a private one is made when null
	Engine(asio::any_io_executor ex, EngineConfig config,
		   std::shared_ptr<KeepAlivePool> pool = nullptr);

	[[nodiscard]] asio::any_io_executor get_executor() const;
	[[nodiscard]] const EngineConfig &config() const;
	[[nodiscard]] const std::shared_ptr<KeepAlivePool> &pool() const;

	using CompletionExecutor = asio::any_completion_executor;

	// Async Fetch. The handler runs on its associated executor; progress_cb
	// runs on the transfer's strand.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<TransferResult>))
				  CompletionToken>
	auto async_fetch(ResourceDescriptor resource, ProgressCallback progress_cb,
					 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<TransferResult>)>(
			[this, ex, resource = std::move(resource),
			 progress_cb = std::move(progress_cb)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<TransferResult>)>{
						std::forward<decltype(handler)>(handler)};

				async_fetch_impl(std::move(resource), std::move(progress_cb),
								 std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

	// Cancels every transfer in flight (they complete with errc::cancelled)
	// and closes the pooled connections. Later fetches fail immediately.
	void shutdown();

   private:
	struct Impl;

	void async_fetch_impl(
		ResourceDescriptor resource, ProgressCallback progress_cb,
		asio::any_completion_handler<void(Result<TransferResult>)> handler,
		CompletionExecutor handler_ex);

	std::unique_ptr<Impl> m_impl;
};

}  // namespace tubedown
