// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --peerdir=<path> [options]\n"
      << "\n"
      << "Recovers the local chain onto a peer's fork, verifying every block\n"
      << "from the divergence point before committing any of them.\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Local data directory (default: ~/.weave)\n"
      << "  --peerdir=<path>     Data directory of a peer to fetch blocks from\n"
      << "                       (repeatable; tried in the order given)\n"
      << "  --target=<hash>      Block to recover to (default: tallest peer tip)\n"
      << "  --retries=<n>        Attempts per missing block (default: 1)\n"
      << "  --backoff-ms=<ms>    Base delay between attempts (default: 500)\n"
      << "  --regtest            Use regression test chain\n"
      << "  --testnet            Use test network\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, recovery, storage, peer, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=recovery,peer\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Exit status: 0 when recovered or already synced, 1 otherwise.\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    weave::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << weave::GetFullVersionString() << std::endl;
        std::cout << weave::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--peerdir=") == 0) {
        config.peer_dirs.emplace_back(arg.substr(10));
      } else if (arg.find("--target=") == 0) {
        auto hash_opt = weave::util::SafeParseHash(arg.substr(9));
        if (!hash_opt) {
          std::cerr << "Error: Invalid block hash: " << arg.substr(9) << std::endl;
          std::cerr << "Hash must be 64 hex characters" << std::endl;
          return 1;
        }
        config.target = *hash_opt;
      } else if (arg.find("--retries=") == 0) {
        auto retries_opt = weave::util::SafeParseInt(arg.substr(10), 1, 100);
        if (!retries_opt) {
          std::cerr << "Error: Invalid retry count: " << arg.substr(10) << std::endl;
          std::cerr << "Retries must be a number between 1 and 100" << std::endl;
          return 1;
        }
        config.retry.max_attempts = *retries_opt;
      } else if (arg.find("--backoff-ms=") == 0) {
        auto backoff_opt = weave::util::SafeParseInt(arg.substr(13), 0, 600000);
        if (!backoff_opt) {
          std::cerr << "Error: Invalid backoff: " << arg.substr(13) << std::endl;
          std::cerr << "Backoff must be a number of milliseconds between 0 and 600000"
                    << std::endl;
          return 1;
        }
        config.retry.backoff = std::chrono::milliseconds(*backoff_opt);
      } else if (arg == "--regtest") {
        config.chain_type = weave::chain::ChainType::REGTEST;
      } else if (arg == "--testnet") {
        config.chain_type = weave::chain::ChainType::TESTNET;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=recovery,peer
        for (const auto &component : weave::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!weave::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: "
                << config.datadir.string() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    weave::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        weave::util::LogManager::SetLogLevel("trace");
      } else {
        weave::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = weave::app::EXIT_FAILED;

    // IMPORTANT: Use nested scope so the app destructor (which joins the
    // recovery worker) runs before LogManager::Shutdown()
    {
      weave::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        std::cerr << "Initialization failed; see " << log_file << std::endl;
      } else {
        exit_code = app.run();
      }
    }

    // Shutdown logging AFTER app is fully destroyed
    weave::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    weave::util::LogManager::Shutdown();
    return 1;
  }
}
