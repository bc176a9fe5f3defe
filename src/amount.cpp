#include "amount.hpp"

#include <cctype>
#include <sstream>

namespace rf {

namespace {

constexpr std::size_t kFractionDigits = 6;

std::uint64_t parseDigits(const std::string& digits, const std::string& source) {
    std::uint64_t value = 0;
    for (char c : digits) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            throw std::invalid_argument("Amount must be a decimal number: \"" + source + "\"");
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw std::overflow_error("Amount out of range: \"" + source + "\"");
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

Amount Amount::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Amount must not be empty");
    }

    const auto dot = text.find('.');
    std::string wholePart = text.substr(0, dot);
    std::string fracPart = (dot == std::string::npos) ? std::string() : text.substr(dot + 1);

    if (wholePart.empty() && fracPart.empty()) {
        throw std::invalid_argument("Amount must contain digits: \"" + text + "\"");
    }
    if (dot != std::string::npos && fracPart.empty()) {
        throw std::invalid_argument("Amount has a dangling decimal point: \"" + text + "\"");
    }
    if (fracPart.size() > kFractionDigits) {
        throw std::invalid_argument("Amount supports at most 6 fractional digits: \"" + text + "\"");
    }

    std::uint64_t whole = wholePart.empty() ? 0 : parseDigits(wholePart, text);
    fracPart.append(kFractionDigits - fracPart.size(), '0');
    std::uint64_t frac = parseDigits(fracPart, text);

    return fromUnits(whole) + fromMicros(frac);
}

std::string Amount::toString() const {
    std::ostringstream oss;
    oss << micros_ / kScale;
    std::uint64_t frac = micros_ % kScale;
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, kFractionDigits - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        oss << '.' << digits;
    }
    return oss.str();
}

} // namespace rf
