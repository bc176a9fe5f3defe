#pragma once

#include "amount.hpp"
#include "raffle_types.hpp"

#include <map>

namespace rf {

// Pooled entry fees of the current round, plus prizes whose transfer failed.
// Moves no funds itself; the owner calls the payout gateway.
class Treasury {
public:
    // Throws std::overflow_error if the pool would exceed the Amount range.
    void deposit(Amount amount);
    Amount balance() const { return balance_; }

    // Takes a prize out of the pool ahead of its transfer.
    void withdraw(Amount amount);

    void holdUnpaid(const Identity& winner, Amount amount);
    Amount unpaidFor(const Identity& identity) const;
    // Removes and returns the prize held for `identity`. Throws NoUnpaidPrize
    // if nothing is held.
    Amount releaseUnpaid(const Identity& identity);

private:
    Amount balance_;
    std::map<Identity, Amount> unpaid_;
};

} // namespace rf
