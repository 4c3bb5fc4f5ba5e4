// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/block_json.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace weave {
namespace storage {

using json = nlohmann::json;

namespace {

uint256 HashFromJson(const json &j, const char *field) {
  uint256 h;
  if (!j.is_string() || !h.SetHex(j.get<std::string>())) {
    throw std::runtime_error(std::string("invalid hash in field '") + field + "'");
  }
  return h;
}

json HashListToJson(const std::vector<uint256> &hashes) {
  json arr = json::array();
  for (const auto &h : hashes) {
    arr.push_back(h.ToString());
  }
  return arr;
}

std::vector<uint256> HashListFromJson(const json &arr, const char *field) {
  if (!arr.is_array()) {
    throw std::runtime_error(std::string("field '") + field + "' is not an array");
  }
  std::vector<uint256> out;
  out.reserve(arr.size());
  for (const auto &item : arr) {
    out.push_back(HashFromJson(item, field));
  }
  return out;
}

json TxToJson(const CTransaction &tx) {
  json j;
  j["id"] = tx.id.ToString();
  j["owner"] = tx.owner.ToString();
  j["target"] = tx.target.ToString();
  j["quantity"] = tx.nQuantity;
  j["reward"] = tx.nReward;
  j["last_tx"] = tx.hashLastTx.ToString();
  return j;
}

CTransaction TxFromJson(const json &j) {
  CTransaction tx;
  tx.id = HashFromJson(j.at("id"), "id");
  tx.owner = HashFromJson(j.at("owner"), "owner");
  tx.target = HashFromJson(j.at("target"), "target");
  tx.nQuantity = j.at("quantity").get<int64_t>();
  tx.nReward = j.at("reward").get<int64_t>();
  tx.hashLastTx = HashFromJson(j.at("last_tx"), "last_tx");
  return tx;
}

} // namespace

std::string EncodeBlockJson(const CBlock &block) {
  json root;
  root["version"] = BLOCK_FORMAT_VERSION;

  root["indep_hash"] = block.hashIndep.ToString();
  root["block_version"] = block.nVersion;
  root["height"] = block.nHeight;
  root["prev_block"] = block.hashPrevBlock.ToString();
  root["hash_list"] = HashListToJson(block.vHashList);
  root["time"] = block.nTime;
  root["diff"] = block.nDiff;
  root["last_retarget"] = block.nLastRetarget;
  root["nonce"] = block.nNonce;
  root["pow_hash"] = block.hashPoW.ToString();

  json wallets = json::array();
  for (const auto &[addr, entry] : block.vWalletList) {
    json w;
    w["address"] = addr.ToString();
    w["balance"] = entry.nBalance;
    w["last_tx"] = entry.hashLastTx.ToString();
    wallets.push_back(w);
  }
  root["wallets"] = wallets;

  json txs = json::array();
  for (const auto &tx : block.vtx) {
    txs.push_back(TxToJson(tx));
  }
  root["txs"] = txs;

  return root.dump(2);
}

std::optional<CBlock> DecodeBlockJson(const std::string &data,
                                      std::string *error) {
  try {
    json root = json::parse(data);

    int version = root.value("version", 0);
    if (version != BLOCK_FORMAT_VERSION) {
      throw std::runtime_error("unsupported block format version " +
                               std::to_string(version));
    }

    CBlock block;
    block.hashIndep = HashFromJson(root.at("indep_hash"), "indep_hash");
    block.nVersion = root.at("block_version").get<int32_t>();
    block.nHeight = root.at("height").get<int32_t>();
    block.hashPrevBlock = HashFromJson(root.at("prev_block"), "prev_block");
    block.vHashList = HashListFromJson(root.at("hash_list"), "hash_list");
    block.nTime = root.at("time").get<uint32_t>();
    block.nDiff = root.at("diff").get<uint32_t>();
    block.nLastRetarget = root.at("last_retarget").get<uint32_t>();
    block.nNonce = root.at("nonce").get<uint32_t>();
    block.hashPoW = HashFromJson(root.at("pow_hash"), "pow_hash");

    for (const auto &w : root.at("wallets")) {
      uint256 addr = HashFromJson(w.at("address"), "address");
      WalletEntry entry;
      entry.nBalance = w.at("balance").get<int64_t>();
      entry.hashLastTx = HashFromJson(w.at("last_tx"), "last_tx");
      if (!block.vWalletList.emplace(addr, entry).second) {
        throw std::runtime_error("duplicate wallet " + addr.ToString());
      }
    }

    for (const auto &t : root.at("txs")) {
      block.vtx.push_back(TxFromJson(t));
    }

    return block;
  } catch (const std::exception &e) {
    // nlohmann::json::exception derives from std::exception
    if (error) {
      *error = e.what();
    }
    return std::nullopt;
  }
}

std::string EncodeHashListJson(const std::vector<uint256> &hash_list) {
  json root;
  root["version"] = BLOCK_FORMAT_VERSION;
  root["height"] = hash_list.empty() ? 0 : static_cast<int64_t>(hash_list.size()) - 1;
  root["hash_list"] = HashListToJson(hash_list);
  return root.dump(2);
}

std::optional<std::vector<uint256>>
DecodeHashListJson(const std::string &data, std::string *error) {
  try {
    json root = json::parse(data);
    int version = root.value("version", 0);
    if (version != BLOCK_FORMAT_VERSION) {
      throw std::runtime_error("unsupported hash list format version " +
                               std::to_string(version));
    }
    return HashListFromJson(root.at("hash_list"), "hash_list");
  } catch (const std::exception &e) {
    if (error) {
      *error = e.what();
    }
    return std::nullopt;
  }
}

} // namespace storage
} // namespace weave
