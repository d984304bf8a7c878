#pragma once

#include <string_view>
#include <vector>

namespace tubedown::cipher {

struct RecordedCipher {
	std::string_view version_key;
	std::string_view program;
};

const std::vector<RecordedCipher> &recorded_ciphers();

}  // namespace tubedown::cipher
