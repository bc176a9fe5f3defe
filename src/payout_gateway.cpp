#include "payout_gateway.hpp"

namespace rf {

bool InMemoryLedger::transfer(const Identity& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_ || to.empty()) {
        return false;
    }
    balances_[to] += amount;
    totalTransferred_ += amount;
    ++transferCount_;
    return true;
}

Amount InMemoryLedger::balanceOf(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(identity);
    if (it == balances_.end()) {
        return Amount();
    }
    return it->second;
}

Amount InMemoryLedger::totalTransferred() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalTransferred_;
}

std::size_t InMemoryLedger::transferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferCount_;
}

void InMemoryLedger::setFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
}

} // namespace rf
