// =============================================================================
// treasury.cpp - VXTreasury custody balances
// =============================================================================

#include "vox/treasury.hpp"
#include <mutex>

namespace vox {

VXTreasury::VXTreasury() = default;

int32_t VXTreasury::deposit(const Address& owner, const Currency& token, U128 amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    U128& balance = balances_[{owner, token}];
    if (balance > U128_MAX - amount) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    balance += amount;
    return errors::OK;
}

int32_t VXTreasury::withdraw(const Address& owner, const Currency& token, U128 amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = balances_.find({owner, token});
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    it->second -= amount;
    return errors::OK;
}

int32_t VXTreasury::transfer(const Address& from, const Address& to,
                             const Currency& token, U128 amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    // Hold the lock through check and update
    std::unique_lock lock(mutex_);
    auto it = balances_.find({from, token});
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    U128& dest = balances_[{to, token}];
    if (from != to && dest > U128_MAX - amount) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    it->second -= amount;
    dest += amount;
    return errors::OK;
}

int32_t VXTreasury::settle(const Address& payer, const Address& payee,
                           const Currency& pay_token, U128 pay_amount,
                           const Currency& receive_token, U128 receive_amount) {
    if (pay_amount == 0 && receive_amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);

    // Stage both legs on copies, commit only if every step succeeds
    std::map<AccountKey, U128> staged;
    auto stage = [&](const AccountKey& key) -> U128& {
        auto it = staged.find(key);
        if (it == staged.end()) {
            auto current = balances_.find(key);
            it = staged.emplace(key, current != balances_.end() ? current->second : 0).first;
        }
        return it->second;
    };
    auto move = [&](const Address& from, const Address& to,
                    const Currency& token, U128 amount) -> int32_t {
        if (amount == 0) return errors::OK;
        U128& src = stage({from, token});
        if (src < amount) return errors::INSUFFICIENT_BALANCE;
        src -= amount;
        U128& dst = stage({to, token});
        if (dst > U128_MAX - amount) return errors::ARITHMETIC_OVERFLOW;
        dst += amount;
        return errors::OK;
    };

    int32_t rc = move(payer, payee, pay_token, pay_amount);
    if (rc != errors::OK) return rc;
    rc = move(payee, payer, receive_token, receive_amount);
    if (rc != errors::OK) return rc;

    for (const auto& [key, value] : staged) {
        balances_[key] = value;
    }
    return errors::OK;
}

U128 VXTreasury::balance(const Address& owner, const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find({owner, token});
    return it != balances_.end() ? it->second : 0;
}

} // namespace vox
