#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace rf {

// Unsigned fixed-point money amount in microunits.
class Amount {
public:
    static constexpr std::uint64_t kScale = 1'000'000; // microunits per unit
    static constexpr std::uint64_t kMaxWhole = std::numeric_limits<std::uint64_t>::max() / kScale;

    Amount() : micros_(0) {}
    static Amount fromMicros(std::uint64_t micros) { return Amount(micros); }
    static Amount fromUnits(std::uint64_t whole) {
        if (whole > kMaxWhole) {
            throw std::overflow_error("Amount whole value out of range");
        }
        return Amount(whole * kScale);
    }
    // Accepts "12", "0.01", "3.500000"; at most six fractional digits.
    static Amount parse(const std::string& text);

    std::uint64_t micros() const { return micros_; }
    bool isZero() const { return micros_ == 0; }
    std::string toString() const;

    Amount operator+(Amount other) const {
        if (other.micros_ > std::numeric_limits<std::uint64_t>::max() - micros_) {
            throw std::overflow_error("Amount addition overflow");
        }
        return Amount(micros_ + other.micros_);
    }
    Amount operator-(Amount other) const {
        if (other.micros_ > micros_) {
            throw std::underflow_error("Amount subtraction below zero");
        }
        return Amount(micros_ - other.micros_);
    }
    Amount operator*(std::uint64_t factor) const {
        unsigned __int128 wide =
            static_cast<unsigned __int128>(micros_) * static_cast<unsigned __int128>(factor);
        if (wide > static_cast<unsigned __int128>(std::numeric_limits<std::uint64_t>::max())) {
            throw std::overflow_error("Amount multiplication overflow");
        }
        return Amount(static_cast<std::uint64_t>(wide));
    }

    Amount& operator+=(Amount other) {
        *this = *this + other;
        return *this;
    }
    Amount& operator-=(Amount other) {
        *this = *this - other;
        return *this;
    }

    bool operator<(Amount other) const { return micros_ < other.micros_; }
    bool operator>(Amount other) const { return micros_ > other.micros_; }
    bool operator<=(Amount other) const { return micros_ <= other.micros_; }
    bool operator>=(Amount other) const { return micros_ >= other.micros_; }
    bool operator==(Amount other) const { return micros_ == other.micros_; }
    bool operator!=(Amount other) const { return micros_ != other.micros_; }

private:
    explicit Amount(std::uint64_t micros) : micros_(micros) {}

    std::uint64_t micros_;
};

} // namespace rf
