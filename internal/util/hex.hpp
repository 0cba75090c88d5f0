#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaultsync::util {

std::string ToHex(const uint8_t* data, std::size_t size);
std::string ToHex(std::string_view bytes);

// Throws std::invalid_argument on odd length or non-hex characters.
std::string FromHex(std::string_view hex);

} // namespace vaultsync::util
