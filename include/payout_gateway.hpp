#pragma once

#include "amount.hpp"
#include "raffle_types.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace rf {

// Moves funds out of the raffle. transfer() must be all-or-nothing and report
// false (or throw) when nothing was moved.
class PayoutGateway {
public:
    virtual ~PayoutGateway() = default;
    virtual bool transfer(const Identity& to, Amount amount) = 0;
};

using PayoutGatewayPtr = std::shared_ptr<PayoutGateway>;

// Wallet balances held in memory. Used by the CLI and tests; setFailing()
// makes every transfer bounce.
class InMemoryLedger : public PayoutGateway {
public:
    bool transfer(const Identity& to, Amount amount) override;

    Amount balanceOf(const Identity& identity) const;
    Amount totalTransferred() const;
    std::size_t transferCount() const;
    void setFailing(bool failing);

private:
    mutable std::mutex mutex_;
    std::map<Identity, Amount> balances_;
    Amount totalTransferred_;
    std::size_t transferCount_ = 0;
    bool failing_ = false;
};

} // namespace rf
