#include "Chain.h"
#include "FileDirStorage.h"
#include "Logger.h"
#include "MemoryStorage.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr const char *FILE_CONFIG = "config.json";

/**
 * Contents of <work-dir>/config.json
 */
struct RunFileConfig {
  hc::Chain::Config chain;
  std::string blockDir{ "blocks" };
  std::string storage{ "file" };

  nlohmann::json ltsToJson() const {
    nlohmann::json j = chain.ltsToJson();
    j["blockDir"] = blockDir;
    j["storage"] = storage;
    return j;
  }

  hc::Chain::Roe<void> ltsFromJson(const nlohmann::json &jd) {
    auto chainResult = chain.ltsFromJson(jd);
    if (!chainResult) {
      return chainResult;
    }
    if (jd.contains("blockDir")) {
      if (!jd["blockDir"].is_string() ||
          jd["blockDir"].get<std::string>().empty()) {
        return hc::ChainError(hc::E_CONFIG,
                              "Field 'blockDir' must be a non-empty string");
      }
      blockDir = jd["blockDir"].get<std::string>();
    }
    if (jd.contains("storage")) {
      if (!jd["storage"].is_string()) {
        return hc::ChainError(hc::E_CONFIG, "Field 'storage' must be a string");
      }
      storage = jd["storage"].get<std::string>();
      if (storage != "file" && storage != "memory") {
        return hc::ChainError(hc::E_CONFIG,
                              "Field 'storage' must be 'file' or 'memory'");
      }
    }
    return {};
  }
};

hc::Chain::Roe<RunFileConfig> loadRunFileConfig(const std::string &workDir) {
  auto logger = hc::logging::getLogger("hashchain");
  std::filesystem::path configPath = std::filesystem::path(workDir) / FILE_CONFIG;
  RunFileConfig runFileConfig;

  std::error_code ec;
  if (!std::filesystem::exists(configPath, ec)) {
    logger.info << "No " << FILE_CONFIG << " found, creating with default values";
    auto writeResult = hc::utl::writeFileAtomically(
        configPath.string(), runFileConfig.ltsToJson().dump(2) + "\n");
    if (!writeResult) {
      return hc::ChainError(hc::E_CONFIG, "Failed to create " +
                                              configPath.string() + ": " +
                                              writeResult.error().message);
    }
    logger.info << "Created " << configPath.string();
    return runFileConfig;
  }

  auto jsonResult = hc::utl::loadJsonFile(configPath.string());
  if (!jsonResult) {
    return hc::ChainError(hc::E_CONFIG, "Failed to load config file: " +
                                            jsonResult.error().message);
  }
  auto parseResult = runFileConfig.ltsFromJson(jsonResult.value());
  if (!parseResult) {
    return hc::ChainError(hc::E_CONFIG, "Failed to parse config file: " +
                                            parseResult.error().message);
  }
  return runFileConfig;
}

std::shared_ptr<hc::BlockStorage> makeStorage(const RunFileConfig &config,
                                              const std::string &workDir) {
  if (config.storage == "memory") {
    return std::make_shared<hc::MemoryStorage>();
  }
  hc::FileDirStorage::Config storageConfig;
  storageConfig.dirPath =
      (std::filesystem::path(workDir) / config.blockDir).string();
  return std::make_shared<hc::FileDirStorage>(storageConfig);
}

/**
 * Load the chain from storage, or start an empty one under the same name
 */
hc::Chain::Roe<std::unique_ptr<hc::Chain>>
openChain(const RunFileConfig &config, const std::string &workDir) {
  auto logger = hc::logging::getLogger("hashchain");
  auto upChain =
      std::make_unique<hc::Chain>(config.chain, makeStorage(config, workDir));
  auto loadResult = upChain->load();
  if (!loadResult) {
    if (loadResult.error().code != hc::E_CHAIN_NOT_FOUND) {
      return loadResult.error();
    }
    logger.info << "Creating new chain " << config.chain.name;
  }
  return upChain;
}

// ----- demo payloads -----

std::mt19937 &rng() {
  static std::mt19937 generator{ std::random_device{}() };
  return generator;
}

uint64_t randomBetween(uint64_t low, uint64_t high) {
  std::uniform_int_distribution<uint64_t> distribution(low, high);
  return distribution(rng());
}

nlohmann::json createTransactions() {
  nlohmann::json transactions = nlohmann::json::array();
  uint64_t count = randomBetween(1, 20);
  for (uint64_t i = 0; i < count; ++i) {
    nlohmann::json transaction;
    transaction["from"] = hc::utl::randomHex(32).valueOr("");
    transaction["to"] = hc::utl::randomHex(32).valueOr("");
    transaction["amount"] = randomBetween(0, 0xFFFF);
    transactions.push_back(nlohmann::json::array({ transaction }));
  }
  return transactions;
}

/**
 * Mine and append count blocks of random transactions
 * @return Number of blocks appended
 */
uint64_t addBlocks(hc::Chain &chain, uint64_t count) {
  auto logger = hc::logging::getLogger("hashchain");
  int64_t startMs = hc::utl::getCurrentTimeMs();
  uint64_t added = 0;
  for (uint64_t i = 0; i < count; ++i) {
    auto block = chain.createNextBlock(createTransactions());
    if (!block) {
      logger.warning << "Failed to mine block: " << block.error().message;
      continue;
    }
    auto addResult = chain.add(block.value());
    if (!addResult) {
      logger.warning << "Failed to add block: " << addResult.error().message;
      continue;
    }
    ++added;
  }
  logger.info << "Mined " << added << " blocks in "
              << hc::utl::getCurrentTimeMs() - startMs << " ms";
  return added;
}

void printChain(hc::Chain &chain) {
  bool valid = chain.verify(false);
  std::cout << "\n"
            << (valid ? "[valid]" : "[INVALID]") << " " << chain.getName()
            << " (" << chain.getHeight() << " blocks)\n";
  auto result = chain.visit([](const hc::Block &block, uint64_t index) {
    std::cout << "  " << index << " " << block.getHash() << " "
              << (block.verify(false) ? "ok" : "BAD") << "\n";
    return true;
  });
  if (!result) {
    std::cout << "  walk stopped: " << result.error().message << "\n";
  }
  std::cout << std::endl;
}

void printDiff(hc::Chain &original, hc::Chain &changed) {
  auto diffResult = original.diff(changed);
  if (!diffResult) {
    std::cout << "Diff failed: " << diffResult.error().message << "\n";
    return;
  }
  const auto &diff = diffResult.value();

  size_t i = 0;
  while (i < diff.size() && !diff[i]) {
    ++i;
  }
  std::cout << "\n" << i << " preceding blocks are the same.\n\n";
  while (i < diff.size() && diff[i]) {
    std::cout << diff[i]->ltsToJson().dump(2) << "\n";
    ++i;
  }
  if (i < diff.size()) {
    std::cout << "\n"
              << diff.size() - i << " following blocks are the same.\n\n";
  }
}

int reportCommit(hc::Chain &chain) {
  auto result = chain.commit();
  if (!result) {
    std::cerr << "Error committing changes to the chain: "
              << result.error().message << "\n";
    return 1;
  }
  return 0;
}

// ----- subcommands -----

int runShow(hc::Chain &chain) {
  printChain(chain);
  return 0;
}

int runAdd(hc::Chain &chain, uint64_t count) {
  uint64_t added = addBlocks(chain, count);
  std::cout << "Added " << added << " blocks, height " << chain.getHeight()
            << "\n";
  int rc = reportCommit(chain);
  if (added != count) {
    rc = 1;
  }
  return rc;
}

int runVerify(hc::Chain &chain, bool quick) {
  bool valid = chain.verify(quick);
  std::cout << chain.getName() << ": " << (valid ? "valid" : "INVALID")
            << (quick ? " (quick)" : "") << "\n";
  return valid ? 0 : 1;
}

int runRollback(hc::Chain &chain, const std::string &target) {
  std::optional<std::string> optTarget;
  if (!target.empty()) {
    optTarget = target;
  }
  auto result = chain.rollback(optTarget);
  if (!result) {
    std::cerr << "Rollback failed: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Removed " << result.value() << " blocks, height "
            << chain.getHeight() << "\n";
  return reportCommit(chain);
}

int runDemo(hc::Chain &chain) {
  printChain(chain);

  // Keep a copy of the unaltered chain
  auto cloneResult = chain.clone();
  if (!cloneResult) {
    std::cerr << "Clone failed: " << cloneResult.error().message << "\n";
    return 1;
  }
  std::unique_ptr<hc::Chain> upOriginal = std::move(cloneResult.value());
  std::cout << "Clone of chain " << (chain.equals(*upOriginal) ? "is" : "IS NOT")
            << " equal to the original chain.\n";

  addBlocks(chain, randomBetween(1, 10));

  printDiff(*upOriginal, chain);
  printChain(chain);
  int rc = reportCommit(chain);

  bool indicesCorrect = true;
  std::vector<hc::Block> blocks = chain.getBlocks();
  for (uint64_t i = 0; i < blocks.size(); ++i) {
    auto index = chain.getIndex(blocks[i].getHash());
    if (!index || index.value() != i) {
      indicesCorrect = false;
      std::cout << "The chain contains an invalid index for block "
                << blocks[i].getHash() << "\n";
    }
  }
  if (indicesCorrect) {
    std::cout << "The chain has valid indices.\n";
  }

  if (!blocks.empty()) {
    auto rollbackResult = chain.rollback(blocks.front().getHash());
    if (!rollbackResult) {
      std::cerr << "Rollback failed: " << rollbackResult.error().message
                << "\n";
      rc = 1;
    }
    printChain(chain);
    if (reportCommit(chain) != 0) {
      rc = 1;
    }
  }
  return rc;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "hashchain - hash-linked block chain demo" };
  app.require_subcommand(1);

  std::string workDir;
  app.add_option("-d,--work-dir", workDir, "Work directory (required)")
      ->required();

  bool debugMode = false;
  app.add_flag("--debug", debugMode,
               "Enable debug logging (default: warning level)");

  auto *showCmd = app.add_subcommand("show", "Print the chain");

  uint64_t addCount = 1;
  auto *addCmd = app.add_subcommand("add", "Mine and append random blocks");
  addCmd->add_option("-n,--count", addCount, "Number of blocks to add")
      ->check(CLI::Range(uint64_t{ 1 }, uint64_t{ 1000 }));

  bool quick = false;
  auto *verifyCmd = app.add_subcommand("verify", "Verify the chain");
  verifyCmd->add_flag("--quick", quick, "Check the difficulty suffix only");

  std::string rollbackTarget;
  auto *rollbackCmd = app.add_subcommand(
      "rollback", "Roll back to a block, or past the first invalid block");
  rollbackCmd->add_option("hash", rollbackTarget, "Hash of the new head");

  auto *demoCmd = app.add_subcommand(
      "demo", "Clone, add random blocks, diff, commit and roll back");

  app.footer("Example:\n"
             "  hashchain -d /path/to/work-dir demo [--debug]\n"
             "\n"
             "A default config.json is created in the work directory if it "
             "doesn't exist.\n");

  CLI11_PARSE(app, argc, argv);

  auto logger = hc::logging::getRootLogger();
  logger.setLevel(debugMode ? hc::logging::Level::DEBUG
                            : hc::logging::Level::WARNING);

  std::error_code ec;
  std::filesystem::create_directories(workDir, ec);
  if (ec) {
    std::cerr << "Error: cannot create work directory " << workDir << ": "
              << ec.message() << "\n";
    return 1;
  }

  auto configResult = loadRunFileConfig(workDir);
  if (!configResult) {
    std::cerr << "Error: " << configResult.error().message << "\n";
    return 1;
  }

  auto chainResult = openChain(configResult.value(), workDir);
  if (!chainResult) {
    std::cerr << "Error loading chain: " << chainResult.error().message << "\n";
    return 1;
  }
  std::unique_ptr<hc::Chain> upChain = std::move(chainResult.value());

  int rc = 0;
  if (*showCmd) {
    rc = runShow(*upChain);
  } else if (*addCmd) {
    rc = runAdd(*upChain, addCount);
  } else if (*verifyCmd) {
    rc = runVerify(*upChain, quick);
  } else if (*rollbackCmd) {
    rc = runRollback(*upChain, rollbackTarget);
  } else if (*demoCmd) {
    rc = runDemo(*upChain);
  }

  auto closeResult = upChain->close();
  if (!closeResult) {
    std::cerr << "Error closing chain: " << closeResult.error().message << "\n";
    rc = 1;
  }
  return rc;
}
