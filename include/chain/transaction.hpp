// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Total supply, allocated to the genesis wallet. No amount or balance may
// exceed it.
static constexpr int64_t MAX_MONEY = 21'000'000LL * 100'000'000LL;

inline bool MoneyRange(int64_t value) { return value >= 0 && value <= MAX_MONEY; }

// CTransaction - value transfer between two wallets
// hashLastTx chains a wallet's transactions together (replay protection):
// it must equal the owner's last transaction id at the time it is applied.
class CTransaction
{
public:
    uint256 id{};           // ComputeId() of the remaining fields
    uint256 owner{};        // Sending wallet address
    uint256 target{};       // Receiving wallet address
    int64_t nQuantity{0};   // Amount moved from owner to target
    int64_t nReward{0};     // Fee debited from owner (burned)
    uint256 hashLastTx{};   // Owner's previous transaction id (null for first)

    [[nodiscard]] uint256 ComputeId() const;
    void UpdateId() { id = ComputeId(); }

    // Context-free checks: id commits to fields, non-null distinct
    // parties, quantity and reward in MoneyRange with quantity + reward too
    [[nodiscard]] bool IsWellFormed() const;

    [[nodiscard]] std::string ToString() const;
};

struct WalletEntry
{
    int64_t nBalance{0};
    uint256 hashLastTx{};

    friend bool operator==(const WalletEntry& a, const WalletEntry& b)
    {
        return a.nBalance == b.nBalance && a.hashLastTx == b.hashLastTx;
    }
    friend bool operator!=(const WalletEntry& a, const WalletEntry& b) { return !(a == b); }
};

// Wallet state snapshot, ordered by address so it hashes deterministically
using WalletList = std::map<uint256, WalletEntry>;

uint256 ComputeWalletRoot(const WalletList& wallets);

uint256 ComputeTxRoot(const std::vector<CTransaction>& txs);

// Apply txs in order: debit owner quantity+reward, credit target quantity
// (creating the wallet if needed), advance the owner's last tx.
// Does not check legality; balances may go negative. Arithmetic saturates at
// the int64 limits, so an overflowing tx leaves a balance outside MoneyRange.
WalletList ApplyTransactions(const WalletList& wallets,
                             const std::vector<CTransaction>& txs);

// Single-tx form of ApplyTransactions, updating `wallets` in place
void ApplyTransaction(WalletList& wallets, const CTransaction& tx);
