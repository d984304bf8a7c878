#include "downloader/body_sink.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace tubedown::downloader {

Result<void> FileSink::open() {
	if (created_) return outcome::success();
	out_.open(path_, std::ios::binary | std::ios::in | std::ios::out |
						 std::ios::trunc);
	if (!out_.is_open()) {
		spdlog::error("Cannot open {} for writing", path_);
		return make_error_code(errc::file_open_failed);
	}
	created_ = true;
	spdlog::debug("Writing to {}", path_);
	return outcome::success();
}

Result<void> FileSink::write(long long offset, std::string_view data) {
	auto opened = open();
	if (opened.has_error()) return opened.error();

	out_.seekp(offset);
	out_.write(data.data(), static_cast<std::streamsize>(data.size()));
	if (!out_) {
		spdlog::error("Write of {} bytes at {} to {} failed", data.size(),
					  offset, path_);
		return make_error_code(errc::file_write_failed);
	}
	return outcome::success();
}

Result<void> FileSink::finish(long long length) {
	// An empty body still leaves an empty file behind
	auto opened = open();
	if (opened.has_error()) return opened.error();

	out_.flush();
	const bool flushed = static_cast<bool>(out_);
	out_.close();
	if (!flushed) return make_error_code(errc::file_write_failed);

	// A restart from byte 0 may leave a longer tail behind
	std::error_code ec;
	auto size = fs::file_size(path_, ec);
	if (!ec && size > static_cast<std::uintmax_t>(length)) {
		fs::resize_file(path_, static_cast<std::uintmax_t>(length), ec);
	}
	if (ec) {
		spdlog::error("Cannot finalize {}: {}", path_, ec.message());
		return make_error_code(errc::file_write_failed);
	}
	return outcome::success();
}

void FileSink::discard() {
	if (out_.is_open()) out_.close();
	if (!created_) return;
	std::error_code ec;
	if (fs::remove(path_, ec)) {
		spdlog::debug("Removed partial file {}", path_);
	} else if (ec) {
		spdlog::warn("Could not remove partial file {}: {}", path_,
					 ec.message());
	}
}

Result<void> MemorySink::write(long long offset, std::string_view data) {
	const auto at = static_cast<std::size_t>(offset);
	if (at != body_.size()) body_.resize(at);
	body_.append(data);
	return outcome::success();
}

Result<void> MemorySink::finish(long long length) {
	if (body_.size() > static_cast<std::size_t>(length)) {
		body_.resize(static_cast<std::size_t>(length));
	}
	return outcome::success();
}

Result<std::unique_ptr<BodySink>> make_sink(const OutputTarget &target) {
	if (!target.is_file()) {
		return std::unique_ptr<BodySink>(std::make_unique<MemorySink>());
	}
	return std::unique_ptr<BodySink>(std::make_unique<FileSink>(target.path));
}

}  // namespace tubedown::downloader
