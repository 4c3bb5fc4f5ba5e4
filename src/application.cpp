// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/randomx_pow.hpp"
#include "recovery/fork_monitor.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <unistd.h>

namespace weave {
namespace app {

Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  shutdown();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_INFO("{} starting", GetFullVersionString());

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_randomx()) {
    LOG_ERROR("Failed to initialize RandomX");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize blockchain");
    return false;
  }

  if (!init_peers()) {
    LOG_ERROR("Failed to attach peers");
    return false;
  }

  recovery::RecoveryManager::Config manager_config;
  manager_config.retry = config_.retry;
  recovery_manager_ = std::make_unique<recovery::RecoveryManager>(
      block_source_, *store_, *validator_, manager_config);

  setup_signal_handlers();
  return true;
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent concurrent writers
  util::LockResult lock_result;
  std::string reason;
  datadir_lock_ = util::DataDirLock::Acquire(config_.datadir, lock_result, &reason);

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory {}: {}", config_.datadir.string(),
              reason);
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "A node or another recovery is probably using it.",
              config_.datadir.string());
    return false;
  }

  return true;
}

bool Application::init_randomx() {
  LOG_INFO("Initializing RandomX...");

  // Initialize RandomX (thread-local VMs and caches)
  crypto::InitRandomX();

  return true;
}

bool Application::init_chain() {
  chain_params_ = chain::ChainParams::Create(config_.chain_type);
  LOG_INFO("Chain: {}", chain_params_->GetChainTypeString());

  store_ = std::make_unique<storage::FileBlockStore>(config_.datadir);
  if (!store_->Open()) {
    return false;
  }

  chainstate_ = std::make_unique<chain::Chainstate>(*store_);
  const uint256 &genesis_hash = chain_params_->GetConsensus().hashGenesisBlock;
  if (!chainstate_->Load(genesis_hash)) {
    if (store_->ReadBestChain()) {
      // A record exists but is unusable (wrong network or corrupt)
      return false;
    }
    LOG_INFO("No existing chain, initializing from genesis");
    if (!chainstate_->Initialize(chain_params_->GenesisBlock())) {
      return false;
    }
  }

  validator_ = std::make_unique<validation::ConsensusValidator>(*chain_params_);

  LOG_INFO("Local chain tip at height {}", chainstate_->GetHeight());
  return true;
}

bool Application::init_peers() {
  if (config_.peer_dirs.empty()) {
    LOG_ERROR("No peers configured (use --peerdir=<path>)");
    return false;
  }

  for (const auto &dir : config_.peer_dirs) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir / "blocks", ec)) {
      LOG_WARN("Peer directory {} has no blocks/ directory; skipping", dir.string());
      continue;
    }
    auto peer_store = std::make_shared<storage::FileBlockStore>(dir);
    peer_stores_.push_back(peer_store);
    peers_.push_back(std::make_shared<network::StoreBackedPeer>(
        "peerdir:" + dir.string(), peer_store));
  }

  if (peers_.empty()) {
    LOG_ERROR("None of the {} peer directories is usable", config_.peer_dirs.size());
    return false;
  }

  LOG_INFO("Attached {} peers", peers_.size());
  return true;
}

std::optional<CBlock> Application::find_target() {
  if (config_.target) {
    auto block = block_source_.GetBlock(peers_, *config_.target);
    if (!block) {
      LOG_ERROR("Target block {} not found on any peer", config_.target->ToString());
    }
    return block;
  }

  std::optional<CBlock> best;
  for (const auto &peer_store : peer_stores_) {
    auto record = peer_store->ReadBestChain();
    if (!record || record->empty()) {
      continue;
    }
    auto tip = block_source_.GetBlock(peers_, record->front());
    if (tip && (!best || tip->nHeight > best->nHeight)) {
      best = std::move(tip);
    }
  }

  if (!best) {
    LOG_ERROR("No peer reports a usable best chain; pass --target=<hash>");
  } else {
    LOG_INFO("Tallest peer tip: {} at height {} ({})",
             best->hashIndep.ToString().substr(0, 16), best->nHeight,
             util::FormatTime(best->nTime));
  }
  return best;
}

int Application::run() {
  auto target = find_target();
  if (!target) {
    return EXIT_FAILED;
  }

  if (!recovery_manager_->Start()) {
    LOG_ERROR("Failed to start recovery manager");
    return EXIT_FAILED;
  }

  recovery::ForkMonitor monitor(*chainstate_, *recovery_manager_);
  bool adopted = false;
  auto handle = monitor.OnBlockAnnounced(
      *target, peers_,
      [&adopted](const recovery::RecoveryResult &, bool was_adopted) {
        adopted = was_adopted;
      });

  if (!handle) {
    const chain::BlockRelation relation = chainstate_->ClassifyBlock(*target);
    if (relation == chain::BlockRelation::KNOWN) {
      std::cout << "Already synced: local chain contains "
                << target->hashIndep.ToString() << " at height "
                << target->nHeight << std::endl;
      return EXIT_OK;
    }
    std::cout << "Target at height " << target->nHeight
              << " is not taller than the local chain (height "
              << chainstate_->GetHeight() << "); nothing to do" << std::endl;
    return EXIT_FAILED;
  }

  // Poll so a signal can cancel the recovery promptly
  while (!handle->WaitFor(std::chrono::milliseconds(200))) {
    if (shutdown_requested_) {
      LOG_INFO("Shutdown requested, cancelling recovery");
      handle->Cancel();
      shutdown_requested_ = false;
    }
  }

  // The completion callback has run by the time the result is ready
  const recovery::RecoveryResult result = handle->Get();
  report(result, adopted);

  switch (result.status) {
  case recovery::RecoveryStatus::RECOVERED:
    return adopted ? EXIT_OK : EXIT_FAILED;
  case recovery::RecoveryStatus::ALREADY_SYNCED:
    return EXIT_OK;
  case recovery::RecoveryStatus::ABORTED:
    return EXIT_FAILED;
  }
  return EXIT_FAILED;
}

void Application::report(const recovery::RecoveryResult &result,
                         bool adopted) const {
  std::cout << "Recovery " << recovery::StatusToString(result.status);
  if (result.IsAborted()) {
    std::cout << ": " << recovery::ReasonToString(result.reason);
    if (!result.detail.empty()) {
      std::cout << " (" << result.detail << ")";
    }
  }
  std::cout << "\n  target:   " << result.target_hash.ToString()
            << "\n  height:   " << result.target_height
            << "\n  verified: " << result.steps_completed << " blocks"
            << "\n  elapsed:  " << util::FormatDuration(result.elapsed);
  if (result.IsRecovered()) {
    std::cout << "\n  adopted:  " << (adopted ? "yes" : "no");
  }
  std::cout << std::endl;
}

void Application::shutdown() {
  if (recovery_manager_) {
    recovery_manager_->Stop();
  }
  crypto::ShutdownRandomX();
  datadir_lock_.reset();
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace weave
