#ifndef VOX_LEDGER_HPP
#define VOX_LEDGER_HPP

#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"

namespace vox {

// =============================================================================
// Option Token
// =============================================================================

struct OptionToken {
    bool is_void;
    uint64_t token_id;
    U256 strike_price;
    U256 expiry_price;
};

// =============================================================================
// IdSet - insertion/removal in O(1), swap-and-pop on removal
//
// Removal moves the last id into the freed slot, so positions are not stable
// across removals.
// =============================================================================

class IdSet {
public:
    bool add(uint64_t id);
    bool remove(uint64_t id);
    bool contains(uint64_t id) const { return index_.count(id) != 0; }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    uint64_t at(size_t i) const { return values_.at(i); }
    const std::vector<uint64_t>& values() const { return values_; }

private:
    std::vector<uint64_t> values_;
    std::unordered_map<uint64_t, size_t> index_;  // id -> position in values_
};

// =============================================================================
// VXLedger - Option identity, balances and void lifecycle
//
// Each (strike, expiry) pair has at most one live id. Voiding is permanent;
// minting a voided pair again allocates a fresh id.
// =============================================================================

class VXLedger {
public:
    VXLedger();
    ~VXLedger() = default;

    // Non-copyable
    VXLedger(const VXLedger&) = delete;
    VXLedger& operator=(const VXLedger&) = delete;

    // =========================================================================
    // Mint / Burn
    // =========================================================================

    // Credit `amount` of the live id for (strike, expiry), creating it if the
    // pair is absent or its id is void. Returns the id credited.
    // Throws VoxError(INVALID_AMOUNT | ARITHMETIC_OVERFLOW); no state change on failure.
    uint64_t mint(const Address& to, U128 amount, const U256& strike_price,
                  const U256& expiry_price);

    // Throws VoxError(INVALID_AMOUNT | INSUFFICIENT_BALANCE)
    void burn(const Address& from, uint64_t token_id, U128 amount);

    // =========================================================================
    // Voiding
    // =========================================================================

    // Void every live id under expiry_price and drop the bucket.
    // Returns the number of ids voided (0 when nothing is live).
    size_t void_by_expiry_price(const U256& expiry_price);

    // Returns true if the id transitioned to void; false for unknown or
    // already-void ids.
    bool void_by_token_id(uint64_t token_id);

    // =========================================================================
    // Queries
    // =========================================================================

    bool is_valid(uint64_t token_id) const;
    std::optional<OptionToken> token(uint64_t token_id) const;
    std::optional<uint64_t> token_id_for(const U256& strike_price, const U256& expiry_price) const;

    U128 balance_of(const Address& owner, uint64_t token_id) const;
    U128 total_supply(uint64_t token_id) const;

    size_t count_live_for_expiry(const U256& expiry_price) const;

    // Page of live ids under expiry_price. Order is unspecified and may change
    // after any void; treat each page as a snapshot.
    std::vector<uint64_t> live_ids_for_expiry(const U256& expiry_price,
                                              size_t offset, size_t limit) const;

    // Expiry prices that currently hold live ids, ascending
    std::vector<U256> live_expiries() const;

    uint64_t next_token_id() const;

private:
    struct PairKey {
        U256 strike_price;
        U256 expiry_price;

        bool operator<(const PairKey& other) const {
            if (strike_price != other.strike_price) return strike_price < other.strike_price;
            return expiry_price < other.expiry_price;
        }
    };

    struct U256Less {
        bool operator()(const U256& a, const U256& b) const { return a < b; }
    };

    // id -> token metadata
    std::unordered_map<uint64_t, OptionToken> tokens_;
    // (strike, expiry) -> most recent id for the pair
    std::map<PairKey, uint64_t> pair_index_;
    // expiry -> live ids
    std::map<U256, IdSet, U256Less> expiry_index_;
    // id -> owner -> balance
    std::unordered_map<uint64_t, std::map<Address, U128>> balances_;
    std::unordered_map<uint64_t, U128> supply_;

    uint64_t next_token_id_{1};
    mutable std::shared_mutex mutex_;

    bool is_valid_locked(uint64_t token_id) const;
    bool void_locked(uint64_t token_id);
};

} // namespace vox

#endif // VOX_LEDGER_HPP
