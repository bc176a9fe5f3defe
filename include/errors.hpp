#pragma once

#include "amount.hpp"
#include "raffle_types.hpp"
#include "round_state.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rf {

class RaffleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Admission errors.

class InsufficientFee : public RaffleError {
public:
    InsufficientFee(Amount paid, Amount required);

    Amount paid() const { return paid_; }
    Amount required() const { return required_; }

private:
    Amount paid_;
    Amount required_;
};

class RoundNotOpen : public RaffleError {
public:
    explicit RoundNotOpen(RoundPhase phase);

    RoundPhase phase() const { return phase_; }

private:
    RoundPhase phase_;
};

class InvalidEntrant : public RaffleError {
public:
    using RaffleError::RaffleError;
};

// Precondition errors.

class UpkeepNotNeeded : public RaffleError {
public:
    UpkeepNotNeeded(Amount balance, std::size_t numPlayers, RoundPhase phase);

    Amount balance() const { return balance_; }
    std::size_t numPlayers() const { return numPlayers_; }
    RoundPhase phase() const { return phase_; }

private:
    Amount balance_;
    std::size_t numPlayers_;
    RoundPhase phase_;
};

class OracleRequestFailed : public RaffleError {
public:
    using RaffleError::RaffleError;
};

class NoStalledRequest : public RaffleError {
public:
    using RaffleError::RaffleError;
};

// Correlation errors.

class UnknownOrStaleRequest : public RaffleError {
public:
    explicit UnknownOrStaleRequest(RequestToken token);

    RequestToken token() const { return token_; }

private:
    RequestToken token_;
};

class InvalidFulfillment : public RaffleError {
public:
    using RaffleError::RaffleError;
};

// Fund-movement errors.

class PayoutFailed : public RaffleError {
public:
    PayoutFailed(Identity winner, Amount amount);

    const Identity& winner() const { return winner_; }
    Amount amount() const { return amount_; }

private:
    Identity winner_;
    Amount amount_;
};

class NoUnpaidPrize : public RaffleError {
public:
    explicit NoUnpaidPrize(const Identity& identity);
};

} // namespace rf
