#ifndef VOX_TREASURY_HPP
#define VOX_TREASURY_HPP

#include <map>
#include <shared_mutex>
#include <utility>

#include "types.hpp"

namespace vox {

// =============================================================================
// VXTreasury - Token custody for settlement and rescue
// =============================================================================

class VXTreasury {
public:
    VXTreasury();
    ~VXTreasury() = default;

    // Non-copyable
    VXTreasury(const VXTreasury&) = delete;
    VXTreasury& operator=(const VXTreasury&) = delete;

    int32_t deposit(const Address& owner, const Currency& token, U128 amount);
    int32_t withdraw(const Address& owner, const Currency& token, U128 amount);
    int32_t transfer(const Address& from, const Address& to,
                     const Currency& token, U128 amount);

    // Two-leg exchange applied atomically: `payer` sends pay_amount of
    // pay_token to `payee` and receives receive_amount of receive_token.
    // Either amount may be zero, not both.
    int32_t settle(const Address& payer, const Address& payee,
                   const Currency& pay_token, U128 pay_amount,
                   const Currency& receive_token, U128 receive_amount);

    U128 balance(const Address& owner, const Currency& token) const;

private:
    using AccountKey = std::pair<Address, Currency>;

    std::map<AccountKey, U128> balances_;
    mutable std::shared_mutex mutex_;
};

} // namespace vox

#endif // VOX_TREASURY_HPP
