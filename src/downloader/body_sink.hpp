#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <tubedown/result.hpp>
#include <tubedown/types.hpp>

namespace tubedown::downloader {

// Destination of response bodies. Writes carry their absolute offset so
// parallel segments and restarts can land anywhere in the target.
class BodySink {
   public:
	virtual ~BodySink() = default;

	virtual Result<void> write(long long offset, std::string_view data) = 0;

	// Trims the target to length once the transfer has been verified
	virtual Result<void> finish(long long length) = 0;

	// Drops whatever was written (a failed or cancelled transfer)
	virtual void discard() = 0;
};

// The file is created (or truncated) by the first write, so a transfer
// that never receives a body leaves whatever was at path untouched.
class FileSink : public BodySink {
   public:
	explicit FileSink(std::string path) : path_(std::move(path)) {}

	Result<void> write(long long offset, std::string_view data) override;
	Result<void> finish(long long length) override;

	// Removes the file only if this sink created it
	void discard() override;

	[[nodiscard]] const std::string &path() const { return path_; }
	[[nodiscard]] bool created() const { return created_; }

   private:
	Result<void> open();

	std::string path_;
	std::fstream out_;
	bool created_ = false;
};

class MemorySink : public BodySink {
   public:
	Result<void> write(long long offset, std::string_view data) override;
	Result<void> finish(long long length) override;
	void discard() override { body_.clear(); }

	std::string take() { return std::move(body_); }
	[[nodiscard]] const std::string &body() const { return body_; }

   private:
	std::string body_;
};

Result<std::unique_ptr<BodySink>> make_sink(const OutputTarget &target);

}  // namespace tubedown::downloader
