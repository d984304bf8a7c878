#include <fmt/format.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "downloader/body_sink.hpp"

using namespace tubedown;
using namespace tubedown::downloader;

namespace fs = std::filesystem;

namespace {

class FileSinkTest : public ::testing::Test {
   protected:
	void SetUp() override {
		path_ = (fs::temp_directory_path() /
				 fmt::format("tubedown-sink-{}.bin",
							 ::testing::UnitTest::GetInstance()
								 ->current_test_info()
								 ->name()))
					.string();
		fs::remove(path_);
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove(path_, ec);
	}

	void put(const std::string &text) {
		std::ofstream out(path_, std::ios::binary);
		out << text;
	}

	std::string contents() const {
		std::ifstream in(path_, std::ios::binary);
		std::ostringstream ss;
		ss << in.rdbuf();
		return ss.str();
	}

	std::string path_;
};

}  // namespace

TEST_F(FileSinkTest, NothingHappensBeforeFirstWrite) {
	put("an older download, 27 bytes");
	{
		auto sink = make_sink(OutputTarget::file(path_));
		ASSERT_TRUE(sink.has_value());
		sink.value()->discard();
	}
	ASSERT_TRUE(fs::exists(path_));
	EXPECT_EQ(contents(), "an older download, 27 bytes");
}

TEST_F(FileSinkTest, FirstWriteReplacesOldContents) {
	put("an older download, 27 bytes");
	FileSink sink(path_);
	EXPECT_FALSE(sink.created());
	ASSERT_TRUE(sink.write(0, "new").has_value());
	EXPECT_TRUE(sink.created());
	ASSERT_TRUE(sink.finish(3).has_value());
	EXPECT_EQ(contents(), "new");
}

TEST_F(FileSinkTest, DiscardRemovesWhatItCreated) {
	FileSink sink(path_);
	ASSERT_TRUE(sink.write(0, "partial").has_value());
	sink.discard();
	EXPECT_FALSE(fs::exists(path_));
}

TEST_F(FileSinkTest, WritesLandAtTheirOffsets) {
	FileSink sink(path_);
	ASSERT_TRUE(sink.write(4, "efgh").has_value());
	ASSERT_TRUE(sink.write(0, "abcd").has_value());
	ASSERT_TRUE(sink.finish(8).has_value());
	EXPECT_EQ(contents(), "abcdefgh");
}

TEST_F(FileSinkTest, FinishTrimsLongerTail) {
	FileSink sink(path_);
	ASSERT_TRUE(sink.write(0, "0123456789").has_value());
	// Restarted from byte 0 with a shorter body
	ASSERT_TRUE(sink.write(0, "xyz").has_value());
	ASSERT_TRUE(sink.finish(3).has_value());
	EXPECT_EQ(contents(), "xyz");
}

TEST_F(FileSinkTest, EmptyBodyLeavesEmptyFile) {
	put("old");
	FileSink sink(path_);
	ASSERT_TRUE(sink.finish(0).has_value());
	ASSERT_TRUE(fs::exists(path_));
	EXPECT_EQ(fs::file_size(path_), 0u);
}

TEST_F(FileSinkTest, UnwritableDirectoryFailsOnWrite) {
	FileSink sink((fs::path(path_) / "no-such-dir" / "out.bin").string());
	auto res = sink.write(0, "x");
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::file_open_failed);
}

TEST(MemorySinkTest, RestartOverwrites) {
	MemorySink sink;
	ASSERT_TRUE(sink.write(0, "hello world").has_value());
	ASSERT_TRUE(sink.write(0, "bye").has_value());
	ASSERT_TRUE(sink.finish(3).has_value());
	EXPECT_EQ(sink.take(), "bye");
}
