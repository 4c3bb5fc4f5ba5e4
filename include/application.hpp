// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "chain/chainstate.hpp"
#include "chain/validation.hpp"
#include "network/peer.hpp"
#include "network/peer_block_source.hpp"
#include "recovery/recovery_manager.hpp"
#include "recovery/recovery_result.hpp"
#include "storage/file_block_store.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weave {
namespace app {

// Application configuration
struct AppConfig {
  // Local node data directory (blocks/, best_chain.json, debug.log)
  std::filesystem::path datadir;

  // Data directories of the nodes to recover from, in preference order
  std::vector<std::filesystem::path> peer_dirs;

  // Block to recover to; defaults to the tallest peer tip
  std::optional<uint256> target;

  // Chain type (mainnet, testnet, regtest)
  chain::ChainType chain_type = chain::ChainType::MAIN;

  recovery::RetryPolicy retry;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Exit codes of weave-recover
enum ExitCode : int {
  EXIT_OK = 0,     // RECOVERED or ALREADY_SYNCED
  EXIT_FAILED = 1, // ABORTED, stale target, or setup failure
};

// Application - one-shot recovery run
// Opens the local chainstate, attaches the peer data directories, recovers
// onto the target and adopts the result. SIGINT/SIGTERM cancel the recovery.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  bool initialize();

  // Returns the process exit code
  int run();

  const chain::ChainParams &chain_params() const { return *chain_params_; }
  chain::Chainstate &chainstate() { return *chainstate_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::unique_ptr<util::DataDirLock> datadir_lock_;
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<storage::FileBlockStore> store_;
  std::unique_ptr<chain::Chainstate> chainstate_;
  std::unique_ptr<validation::ConsensusValidator> validator_;
  network::SequentialPeerBlockSource block_source_;
  std::vector<std::shared_ptr<storage::FileBlockStore>> peer_stores_;
  network::PeerSet peers_;
  std::unique_ptr<recovery::RecoveryManager> recovery_manager_;

  // Initialization steps
  bool init_datadir();
  bool init_randomx();
  bool init_chain();
  bool init_peers();

  // Target given on the command line, or the tallest tip any peer reports
  std::optional<CBlock> find_target();

  void report(const recovery::RecoveryResult &result, bool adopted) const;

  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace weave
