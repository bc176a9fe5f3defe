#include "treasury.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace rf {

namespace {

log::Logger logger() {
    static log::Logger instance = log::createLogger("treasury");
    return instance;
}

} // namespace

void Treasury::deposit(Amount amount) {
    balance_ += amount;
}

void Treasury::withdraw(Amount amount) {
    if (amount > balance_) {
        throw std::logic_error("Withdrawal exceeds pooled balance");
    }
    balance_ -= amount;
}

void Treasury::holdUnpaid(const Identity& winner, Amount amount) {
    unpaid_[winner] += amount;
    logger()->warn("holding unpaid prize {} for {} (now {})",
                   amount.toString(),
                   winner,
                   unpaid_[winner].toString());
}

Amount Treasury::unpaidFor(const Identity& identity) const {
    auto it = unpaid_.find(identity);
    if (it == unpaid_.end()) {
        return Amount();
    }
    return it->second;
}

Amount Treasury::releaseUnpaid(const Identity& identity) {
    auto it = unpaid_.find(identity);
    if (it == unpaid_.end()) {
        throw NoUnpaidPrize(identity);
    }
    Amount held = it->second;
    unpaid_.erase(it);
    return held;
}

} // namespace rf
