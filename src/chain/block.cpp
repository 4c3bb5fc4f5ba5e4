// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "util/sha256.hpp"
#include <sstream>

using weave::crypto::HashWriter;

namespace {

// Fields shared by the independent hash and the PoW preimage
void WriteHeaderFields(HashWriter& w, const CBlock& block) {
  w.WriteI32(block.nVersion)
      .WriteI32(block.nHeight)
      .WriteHash(block.hashPrevBlock)
      .WriteU32(block.nTime)
      .WriteU32(block.nDiff)
      .WriteU32(block.nLastRetarget)
      .WriteU32(block.nNonce)
      .WriteHash(ComputeWalletRoot(block.vWalletList))
      .WriteHash(ComputeTxRoot(block.vtx));
}

} // namespace

uint256 CBlock::ComputeIndepHash() const {
  HashWriter w;
  WriteHeaderFields(w, *this);
  w.WriteHash(hashPoW);
  w.WriteU64(vHashList.size());
  for (const auto& h : vHashList) {
    w.WriteHash(h);
  }
  return w.GetHash();
}

std::vector<uint256> CBlock::GetHashChain() const {
  std::vector<uint256> chain;
  chain.reserve(vHashList.size() + 1);
  chain.push_back(hashIndep);
  chain.insert(chain.end(), vHashList.begin(), vHashList.end());
  return chain;
}

std::vector<uint8_t> CBlock::SerializePoWInput(const uint256& recall_hash) const {
  HashWriter w;
  WriteHeaderFields(w, *this);
  w.WriteHash(recall_hash);
  return w.Bytes();
}

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(hash=" << hashIndep.ToString().substr(0, 16)
    << ", height=" << nHeight
    << ", prev=" << hashPrevBlock.ToString().substr(0, 16)
    << ", time=" << nTime
    << ", diff=" << nDiff
    << ", nonce=" << nNonce
    << ", wallets=" << vWalletList.size()
    << ", txs=" << vtx.size() << ")";
  return s.str();
}

CBlock CreateGenesisBlock(uint32_t nTime, uint32_t nDiff, const WalletList& wallets) {
  CBlock genesis;
  genesis.nVersion = 1;
  genesis.nHeight = 0;
  genesis.nTime = nTime;
  genesis.nDiff = nDiff;
  genesis.nLastRetarget = nTime;
  genesis.vWalletList = wallets;
  genesis.UpdateIndepHash();
  return genesis;
}
