#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atomicswap::util {

std::string ToHex(const std::uint8_t* data, std::size_t size);
std::string ToHex(const std::vector<std::uint8_t>& bytes);

// Accepts upper or lower case. nullopt on odd length or non-hex characters.
std::optional<std::vector<std::uint8_t>> FromHex(std::string_view hex);

std::string ToLower(std::string_view s);

} // namespace atomicswap::util
