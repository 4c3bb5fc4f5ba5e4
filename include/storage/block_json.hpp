// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace weave {
namespace storage {

/*
 JSON encoding of blocks and hash lists (on-disk format)

 {
   "version": 1,
   "indep_hash": "<hex>", "height": N, "prev_block": "<hex>",
   "hash_list": ["<hex>", ...],            // newest-first
   "time": T, "diff": D, "last_retarget": R, "nonce": X, "pow_hash": "<hex>",
   "wallets": [{"address": "<hex>", "balance": B, "last_tx": "<hex>"}, ...],
   "txs": [{"id": ..., "owner": ..., "target": ..., "quantity": Q,
            "reward": F, "last_tx": ...}, ...]
 }

 Decoders never throw: malformed input yields std::nullopt and, when
 `error` is non-null, a description of the first problem.
*/

static constexpr int BLOCK_FORMAT_VERSION = 1;

std::string EncodeBlockJson(const CBlock &block);

std::optional<CBlock> DecodeBlockJson(const std::string &data,
                                      std::string *error = nullptr);

std::string EncodeHashListJson(const std::vector<uint256> &hash_list);

std::optional<std::vector<uint256>>
DecodeHashListJson(const std::string &data, std::string *error = nullptr);

} // namespace storage
} // namespace weave
