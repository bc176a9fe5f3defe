#include "hex_codec.hpp"

#include <stdexcept>

namespace rf::hex {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

int nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string encode(const unsigned char* data, std::size_t len) {
    std::string out(len * 2, '0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kDigits[data[i] >> 4];
        out[2 * i + 1] = kDigits[data[i] & 0x0f];
    }
    return out;
}

std::string encode(const std::vector<unsigned char>& bytes) {
    return encode(bytes.data(), bytes.size());
}

std::vector<unsigned char> decode(const std::string& text) {
    if (text.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out(text.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int high = nibble(text[2 * i]);
        int low = nibble(text[2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out[i] = static_cast<unsigned char>((high << 4) | low);
    }
    return out;
}

} // namespace rf::hex
