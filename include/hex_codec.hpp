#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rf::hex {

// Lowercase, two characters per byte.
std::string encode(const unsigned char* data, std::size_t len);
std::string encode(const std::vector<unsigned char>& bytes);

// Accepts either case. Throws std::invalid_argument on odd length or a
// non-hex character.
std::vector<unsigned char> decode(const std::string& text);

} // namespace rf::hex
