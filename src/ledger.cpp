// =============================================================================
// ledger.cpp - VXLedger option identity and lifecycle
// =============================================================================

#include "vox/ledger.hpp"
#include <algorithm>
#include <mutex>

namespace vox {

// =============================================================================
// IdSet
// =============================================================================

bool IdSet::add(uint64_t id) {
    if (contains(id)) return false;
    index_[id] = values_.size();
    values_.push_back(id);
    return true;
}

bool IdSet::remove(uint64_t id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    size_t pos = it->second;
    uint64_t last = values_.back();
    values_[pos] = last;
    index_[last] = pos;

    values_.pop_back();
    index_.erase(id);
    return true;
}

// =============================================================================
// Constructor
// =============================================================================

VXLedger::VXLedger() = default;

// =============================================================================
// Mint / Burn
// =============================================================================

uint64_t VXLedger::mint(const Address& to, U128 amount, const U256& strike_price,
                        const U256& expiry_price) {
    if (amount == 0) {
        throw VoxError(errors::INVALID_AMOUNT, "mint amount is zero");
    }

    std::unique_lock lock(mutex_);

    PairKey key{strike_price, expiry_price};
    auto pair_it = pair_index_.find(key);

    if (pair_it != pair_index_.end() && is_valid_locked(pair_it->second)) {
        uint64_t id = pair_it->second;
        U128 supply = supply_[id];
        if (supply > U128_MAX - amount) {
            throw VoxError(errors::ARITHMETIC_OVERFLOW, "option supply overflow");
        }
        // balance <= supply, so it cannot overflow either
        supply_[id] = supply + amount;
        balances_[id][to] += amount;
        return id;
    }

    // Absent pair, or its id was voided: allocate a fresh id
    uint64_t id = next_token_id_++;

    tokens_[id] = OptionToken{false, id, strike_price, expiry_price};
    expiry_index_[expiry_price].add(id);
    pair_index_[key] = id;

    supply_[id] = amount;
    balances_[id][to] = amount;

    return id;
}

void VXLedger::burn(const Address& from, uint64_t token_id, U128 amount) {
    if (amount == 0) {
        throw VoxError(errors::INVALID_AMOUNT, "burn amount is zero");
    }

    std::unique_lock lock(mutex_);

    auto holders = balances_.find(token_id);
    if (holders == balances_.end()) {
        throw VoxError(errors::INSUFFICIENT_BALANCE);
    }
    auto it = holders->second.find(from);
    if (it == holders->second.end() || it->second < amount) {
        throw VoxError(errors::INSUFFICIENT_BALANCE);
    }

    it->second -= amount;
    if (it->second == 0) {
        holders->second.erase(it);
    }
    supply_[token_id] -= amount;
}

// =============================================================================
// Voiding
// =============================================================================

bool VXLedger::void_locked(uint64_t token_id) {
    auto it = tokens_.find(token_id);
    if (it == tokens_.end() || it->second.is_void) {
        return false;
    }

    it->second.is_void = true;

    auto bucket = expiry_index_.find(it->second.expiry_price);
    if (bucket != expiry_index_.end()) {
        bucket->second.remove(token_id);
        if (bucket->second.empty()) {
            expiry_index_.erase(bucket);
        }
    }
    return true;
}

size_t VXLedger::void_by_expiry_price(const U256& expiry_price) {
    std::unique_lock lock(mutex_);

    auto bucket = expiry_index_.find(expiry_price);
    if (bucket == expiry_index_.end()) {
        return 0;
    }

    // Removal reorders the set; iterate a copy so no id is skipped
    std::vector<uint64_t> ids = bucket->second.values();

    size_t voided = 0;
    for (uint64_t id : ids) {
        if (void_locked(id)) ++voided;
    }
    expiry_index_.erase(expiry_price);
    return voided;
}

bool VXLedger::void_by_token_id(uint64_t token_id) {
    std::unique_lock lock(mutex_);
    return void_locked(token_id);
}

// =============================================================================
// Queries
// =============================================================================

bool VXLedger::is_valid_locked(uint64_t token_id) const {
    if (token_id == 0) return false;
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return false;
    return !it->second.is_void;
}

bool VXLedger::is_valid(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    return is_valid_locked(token_id);
}

std::optional<OptionToken> VXLedger::token(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> VXLedger::token_id_for(const U256& strike_price,
                                               const U256& expiry_price) const {
    std::shared_lock lock(mutex_);
    auto it = pair_index_.find(PairKey{strike_price, expiry_price});
    if (it == pair_index_.end()) return std::nullopt;
    return it->second;
}

U128 VXLedger::balance_of(const Address& owner, uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto holders = balances_.find(token_id);
    if (holders == balances_.end()) return 0;
    auto it = holders->second.find(owner);
    return it != holders->second.end() ? it->second : 0;
}

U128 VXLedger::total_supply(uint64_t token_id) const {
    std::shared_lock lock(mutex_);
    auto it = supply_.find(token_id);
    return it != supply_.end() ? it->second : 0;
}

size_t VXLedger::count_live_for_expiry(const U256& expiry_price) const {
    std::shared_lock lock(mutex_);
    auto it = expiry_index_.find(expiry_price);
    return it != expiry_index_.end() ? it->second.size() : 0;
}

std::vector<uint64_t> VXLedger::live_ids_for_expiry(const U256& expiry_price,
                                                    size_t offset, size_t limit) const {
    std::shared_lock lock(mutex_);
    auto it = expiry_index_.find(expiry_price);
    if (it == expiry_index_.end() || offset >= it->second.size()) {
        return {};
    }

    const auto& ids = it->second.values();
    size_t end = std::min(ids.size(), offset + std::min(limit, ids.size()));
    return std::vector<uint64_t>(ids.begin() + offset, ids.begin() + end);
}

std::vector<U256> VXLedger::live_expiries() const {
    std::shared_lock lock(mutex_);
    std::vector<U256> out;
    out.reserve(expiry_index_.size());
    for (const auto& [expiry, ids] : expiry_index_) {
        out.push_back(expiry);
    }
    return out;
}

uint64_t VXLedger::next_token_id() const {
    std::shared_lock lock(mutex_);
    return next_token_id_;
}

} // namespace vox
