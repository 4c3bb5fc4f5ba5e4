// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "storage/block_store.hpp"
#include <filesystem>
#include <mutex>

namespace weave {
namespace storage {

/**
 * FileBlockStore - one JSON file per block
 *
 * Layout under the data directory:
 *   blocks/<indep_hash>.json   block (see block_json.hpp)
 *   best_chain.json            canonical hash list, newest-first
 *
 * Every file is written with util::atomic_write_file (temp file, fsync,
 * rename, directory fsync), so a crash never leaves a torn block behind.
 * Blocks are immutable and content addressed: re-writing an existing block is
 * a no-op. A batch that fails midway leaves only complete, unreferenced
 * files, which is harmless because the best-chain record is written last by
 * the caller.
 *
 * ReadBlock re-derives the independent hash of what it loaded and refuses
 * files whose contents do not match their name.
 */
class FileBlockStore : public LocalBlockStore {
public:
  explicit FileBlockStore(const std::filesystem::path &datadir);

  // Creates the directory layout. Returns false if it cannot be created.
  bool Open();

  std::optional<CBlock> ReadBlock(const uint256 &hash) const override;
  bool HasBlock(const uint256 &hash) const override;
  bool WriteBlocks(const std::vector<CBlock> &blocks) override;

  std::optional<std::vector<uint256>> ReadBestChain() const override;
  bool WriteBestChain(const std::vector<uint256> &hash_list) override;

  const std::filesystem::path &GetDataDir() const { return datadir_; }
  std::filesystem::path GetBlockPath(const uint256 &hash) const;

private:
  std::filesystem::path datadir_;
  std::filesystem::path blocks_dir_;
  std::filesystem::path best_chain_path_;

  // Serializes writers; readers rely on atomic renames
  mutable std::mutex write_mutex_;
};

} // namespace storage
} // namespace weave
