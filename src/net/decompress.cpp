#include "net/decompress.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <optional>

#include "utils.hpp"

namespace tubedown::net {

namespace {

// 16 + MAX_WBITS decodes gzip, 32 + MAX_WBITS detects zlib or gzip,
// -MAX_WBITS is raw deflate without a header
constexpr int kGzipWindow = 16 + MAX_WBITS;
constexpr int kZlibOrGzipWindow = 32 + MAX_WBITS;
constexpr int kRawDeflateWindow = -MAX_WBITS;

std::optional<std::string> inflate_with(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		decompressed.append(outbuffer, kChunkSize - zs.avail_out);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

}  // namespace

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	const std::string encoding = utils::to_lower(utils::trim(content_encoding));
	if (encoding.empty() || encoding == "identity") return body;

	if (encoding == "gzip" || encoding == "x-gzip") {
		if (auto result = inflate_with(body, kGzipWindow)) {
			spdlog::debug("Decompressed gzip: {} -> {} bytes", body.size(),
						  result->size());
			return *result;
		}
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (encoding == "deflate") {
		// Usually zlib wrapped, sometimes gzip sent as deflate
		if (auto result = inflate_with(body, kZlibOrGzipWindow)) {
			return *result;
		}
		if (auto result = inflate_with(body, kRawDeflateWindow)) {
			spdlog::debug("Decompressed deflate: {} -> {} bytes", body.size(),
						  result->size());
			return *result;
		}
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug("Unknown Content-Encoding: {}, returning raw body", encoding);
	return body;
}

}  // namespace tubedown::net
