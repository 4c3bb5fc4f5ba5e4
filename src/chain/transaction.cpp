// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/transaction.hpp"
#include "util/sha256.hpp"
#include <limits>
#include <sstream>

using weave::crypto::HashWriter;

uint256 CTransaction::ComputeId() const {
  HashWriter w;
  w.WriteHash(owner)
      .WriteHash(target)
      .WriteI64(nQuantity)
      .WriteI64(nReward)
      .WriteHash(hashLastTx);
  return w.GetHash();
}

bool CTransaction::IsWellFormed() const {
  if (owner.IsNull() || target.IsNull() || owner == target) {
    return false;
  }
  if (!MoneyRange(nQuantity) || !MoneyRange(nReward) ||
      nQuantity > MAX_MONEY - nReward) {
    return false;
  }
  return id == ComputeId();
}

std::string CTransaction::ToString() const {
  std::stringstream s;
  s << "CTransaction(id=" << id.ToString().substr(0, 16)
    << " owner=" << owner.ToString().substr(0, 16)
    << " target=" << target.ToString().substr(0, 16)
    << " quantity=" << nQuantity << " reward=" << nReward << ")";
  return s.str();
}

uint256 ComputeWalletRoot(const WalletList& wallets) {
  HashWriter w;
  w.WriteU64(wallets.size());
  for (const auto& [addr, entry] : wallets) {
    w.WriteHash(addr).WriteI64(entry.nBalance).WriteHash(entry.hashLastTx);
  }
  return w.GetHash();
}

uint256 ComputeTxRoot(const std::vector<CTransaction>& txs) {
  HashWriter w;
  w.WriteU64(txs.size());
  for (const auto& tx : txs) {
    w.WriteHash(tx.id);
  }
  return w.GetHash();
}

namespace {

int64_t SaturatingAdd(int64_t a, int64_t b) {
  if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
    return std::numeric_limits<int64_t>::max();
  }
  if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
    return std::numeric_limits<int64_t>::min();
  }
  return a + b;
}

int64_t SaturatingSub(int64_t a, int64_t b) {
  if (b == std::numeric_limits<int64_t>::min()) {
    return a >= 0 ? std::numeric_limits<int64_t>::max() : a - b;
  }
  return SaturatingAdd(a, -b);
}

} // namespace

void ApplyTransaction(WalletList& wallets, const CTransaction& tx) {
  WalletEntry& from = wallets[tx.owner];
  from.nBalance = SaturatingSub(
      SaturatingSub(from.nBalance, tx.nQuantity), tx.nReward);
  from.hashLastTx = tx.id;

  WalletEntry& to = wallets[tx.target];
  to.nBalance = SaturatingAdd(to.nBalance, tx.nQuantity);
}

WalletList ApplyTransactions(const WalletList& wallets,
                             const std::vector<CTransaction>& txs) {
  WalletList out = wallets;
  for (const auto& tx : txs) {
    ApplyTransaction(out, tx);
  }
  return out;
}
