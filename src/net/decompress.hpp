#pragma once

#include <string>

namespace tubedown::net {

// Decodes a gzip or deflate encoded body according to its Content-Encoding.
// Unknown encodings and corrupt data come back unchanged.
std::string decompress_body(const std::string &body,
							const std::string &content_encoding);

}  // namespace tubedown::net
