#pragma once

#include <boost/asio/spawn.hpp>
#include <optional>
#include <string>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>

#include "downloader/bandwidth_governor.hpp"
#include "net/connection.hpp"
#include "net/connection_manager.hpp"

namespace tubedown::downloader {

// State shared by every coroutine working on one transfer. All of them run
// on the transfer's strand, so nothing here is locked.
struct TransferContext {
	TransferContext(const EngineConfig &cfg, net::ConnectionManager &conns,
					ProgressCallback progress_cb)
		: config(cfg),
		  connections(conns),
		  governor(cfg.bandwidth_ceiling_bps),
		  progress(std::move(progress_cb)) {}

	const EngineConfig &config;
	net::ConnectionManager &connections;
	net::InFlightSet in_flight;
	BandwidthGovernor governor;
	ProgressCallback progress;
	std::optional<long long> expected_total;  // For progress only
	std::string status = "downloading";
	bool cancelled = false;

	void cancel() {
		cancelled = true;
		in_flight.cancel_all();
	}

	// Called after every write with the bytes held across the transfer:
	// reports progress, then lets the governor hold the caller back.
	Result<void> on_bytes(long long total, asio::yield_context yield);

	void report(long long total);
};

}  // namespace tubedown::downloader
