// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/transaction.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace weave {

namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION ARCHITECTURE
 * ============================================================================
 *
 * LAYER 1: Structure (context-free)
 * - CheckBlockStructure()   : hash list shape, independent hash, tx ids
 * Purpose: Reject garbage before spending any RandomX time on it
 *
 * LAYER 2: Contextual consensus (requires predecessor and recall block)
 * - ConsensusValidator::ValidateBlock() : height/linkage, hash list, recall
 *   commitment, difficulty, timestamps, RandomX PoW, transactions and the
 *   resulting wallet state
 *
 * INTEGRATION POINT:
 * - recovery::RecoverySession runs layer 1 on every fetched block, then hands
 *   candidate/predecessor/recall to a ChainValidator
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block
    ERROR    // System error
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid()) {
      return "valid";
    }
    return debug_message_.empty() ? reject_reason_
                                  : reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Context-free structural checks. A block failing these is malformed rather
// than merely invalid: its fields contradict each other.
bool CheckBlockStructure(const CBlock &block, ValidationState &state);

// uses the (mockable) node clock
int64_t GetAdjustedTime();

/**
 * ChainValidator - consensus gate used by fork recovery
 *
 * Validate() decides whether `candidate` may follow `predecessor` given the
 * predecessor's hash chain ([predecessor.hashIndep] + predecessor.vHashList),
 * the wallet state produced by applying candidate's transactions, and the
 * recall block selected by the predecessor.
 */
class ChainValidator {
public:
  virtual ~ChainValidator() = default;

  virtual WalletList ApplyTransactions(const WalletList &wallets,
                                       const std::vector<CTransaction> &txs) const = 0;

  virtual bool Validate(const std::vector<uint256> &hash_list,
                        const WalletList &wallets, const CBlock &candidate,
                        const CBlock &predecessor, const CBlock &recall) const = 0;
};

/**
 * ConsensusValidator - production consensus rules
 *
 * Rules are checked in a fixed order; the first failure is recorded in the
 * ValidationState:
 *   bad-height, bad-prevblk, bad-hashlist, bad-recall, bad-diff,
 *   bad-retarget, time-too-old, time-too-new, high-hash, bad-txns-*,
 *   bad-wallet-balance, bad-wallet-list
 */
class ConsensusValidator : public ChainValidator {
public:
  explicit ConsensusValidator(const chain::ChainParams &params);
  ~ConsensusValidator() override = default;

  WalletList ApplyTransactions(const WalletList &wallets,
                               const std::vector<CTransaction> &txs) const override;

  // Logs the reject reason at debug level
  bool Validate(const std::vector<uint256> &hash_list,
                const WalletList &wallets, const CBlock &candidate,
                const CBlock &predecessor, const CBlock &recall) const override;

  bool ValidateBlock(const std::vector<uint256> &hash_list,
                     const WalletList &wallets, const CBlock &candidate,
                     const CBlock &predecessor, const CBlock &recall,
                     ValidationState &state) const;

  const chain::ChainParams &GetParams() const { return params_; }

protected:
  // RandomX verification; test validators override to skip the expensive hash
  virtual bool CheckProofOfWork(const CBlock &candidate,
                                const uint256 &recall_hash) const;

  virtual int64_t GetAdjustedTime() const;

private:
  // bad-txns-*: each tx well formed, unique, owner known, hashLastTx chained
  bool CheckTransactions(const WalletList &prev_wallets,
                         const std::vector<CTransaction> &txs,
                         ValidationState &state) const;

  const chain::ChainParams &params_;
};

} // namespace validation
} // namespace weave
