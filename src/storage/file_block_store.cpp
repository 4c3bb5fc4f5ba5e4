// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/file_block_store.hpp"
#include "storage/block_json.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

namespace weave {
namespace storage {

FileBlockStore::FileBlockStore(const std::filesystem::path &datadir)
    : datadir_(datadir), blocks_dir_(datadir / "blocks"),
      best_chain_path_(datadir / "best_chain.json") {}

bool FileBlockStore::Open() {
  if (!util::ensure_directory(blocks_dir_)) {
    LOG_STORE_ERROR("Failed to create block directory {}", blocks_dir_.string());
    return false;
  }
  LOG_STORE_DEBUG("Opened block store at {}", datadir_.string());
  return true;
}

std::filesystem::path FileBlockStore::GetBlockPath(const uint256 &hash) const {
  return blocks_dir_ / (hash.GetHex() + ".json");
}

std::optional<CBlock> FileBlockStore::ReadBlock(const uint256 &hash) const {
  auto path = GetBlockPath(hash);
  auto data = util::read_file_string(path);
  if (!data) {
    LOG_STORE_TRACE("Block {} not in store", hash.ToString().substr(0, 16));
    return std::nullopt;
  }

  std::string error;
  auto block = DecodeBlockJson(*data, &error);
  if (!block) {
    LOG_STORE_ERROR("Failed to decode block file {}: {}", path.string(), error);
    return std::nullopt;
  }

  // Recompute the hash to detect corruption or tampering
  const uint256 recomputed = block->ComputeIndepHash();
  if (block->hashIndep != hash || recomputed != hash) {
    LOG_STORE_ERROR("CORRUPTION DETECTED: block file {} holds {} (recomputed {})",
                    path.string(), block->hashIndep.ToString().substr(0, 16),
                    recomputed.ToString().substr(0, 16));
    return std::nullopt;
  }

  return block;
}

bool FileBlockStore::HasBlock(const uint256 &hash) const {
  std::error_code ec;
  return std::filesystem::exists(GetBlockPath(hash), ec);
}

bool FileBlockStore::WriteBlocks(const std::vector<CBlock> &blocks) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  if (!util::ensure_directory(blocks_dir_)) {
    LOG_STORE_ERROR("Block directory {} unavailable", blocks_dir_.string());
    return false;
  }

  size_t written = 0;
  for (const auto &block : blocks) {
    if (HasBlock(block.hashIndep)) {
      continue;
    }
    if (!util::atomic_write_file(GetBlockPath(block.hashIndep),
                                 EncodeBlockJson(block))) {
      LOG_STORE_ERROR("Failed to write block {} at height {}",
                      block.hashIndep.ToString().substr(0, 16), block.nHeight);
      return false;
    }
    ++written;
  }

  LOG_STORE_DEBUG("Wrote {} blocks ({} already present)", written,
                  blocks.size() - written);
  return true;
}

std::optional<std::vector<uint256>> FileBlockStore::ReadBestChain() const {
  auto data = util::read_file_string(best_chain_path_);
  if (!data) {
    LOG_STORE_DEBUG("No best chain record at {}", best_chain_path_.string());
    return std::nullopt;
  }

  std::string error;
  auto hash_list = DecodeHashListJson(*data, &error);
  if (!hash_list) {
    LOG_STORE_ERROR("Failed to decode {}: {}", best_chain_path_.string(), error);
    return std::nullopt;
  }
  return hash_list;
}

bool FileBlockStore::WriteBestChain(const std::vector<uint256> &hash_list) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!util::atomic_write_file(best_chain_path_, EncodeHashListJson(hash_list))) {
    LOG_STORE_ERROR("Failed to write best chain record {}", best_chain_path_.string());
    return false;
  }
  LOG_STORE_DEBUG("Best chain record updated (height {})",
                  hash_list.empty() ? 0 : hash_list.size() - 1);
  return true;
}

} // namespace storage
} // namespace weave
