#include "../service/Config.h"
#include "../service/IntegrityService.h"
#include "../service/Runtime.h"
#include "../ledger/HashChain.h"
#include "../lib/Logger.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

static int runVerifyChain(lfs::IntegrityService &service) {
  auto report = service.verifyChain();
  if (report.valid) {
    std::cout << "Chain is valid\n";
    return 0;
  }
  std::cout << "Chain is INVALID at block " << report.failedIndex << ": "
            << report.reason << "\n";
  return 1;
}

static int runVerifyFile(lfs::IntegrityService &service, const std::string &name) {
  auto report = service.verifyFile(name);
  if (!report.found) {
    std::cout << "File not found: " << name << "\n";
    return 1;
  }
  std::cout << "File:     " << name << "\n";
  std::cout << "Size:     " << report.totalSize << " bytes\n";
  std::cout << "Chunks:   " << report.verifiedChunks << "/" << report.chunkCount
            << " verified\n";
  for (const auto &failure : report.failures) {
    std::cout << "  block " << failure.index << ": " << failure.reason << "\n";
  }
  std::cout << (report.isIntact() ? "File is intact\n" : "File is CORRUPTED\n");
  return report.isIntact() ? 0 : 1;
}

static int runListFiles(lfs::IntegrityService &service) {
  auto files = service.listFiles();
  if (files.empty()) {
    std::cout << "No files\n";
    return 0;
  }
  for (const auto &file : files) {
    std::cout << file.name << "\t" << file.size << " bytes\t" << file.chunkCount
              << " chunks\n";
  }
  return 0;
}

static int runInfo(lfs::IntegrityService &service) {
  auto info = service.getChainInfo();
  std::cout << "Total blocks: " << info.totalBlocks << "\n";
  std::cout << "Latest hash:  " << info.latestHash << "\n";
  std::cout << "Valid:        " << (info.valid ? "yes" : "no") << "\n";
  std::cout << "Files:        " << info.fileCount << "\n";
  return 0;
}

static int runPrintChain(lfs::HashChain &chain) {
  nlohmann::json jChain = nlohmann::json::array();
  for (const auto &block : chain.getBlocks()) {
    jChain.push_back(block.toJson());
  }
  std::cout << jChain.dump(2) << "\n";
  return 0;
}

int main(int argc, char **argv) {
  CLI::App app{ "LedgerFS integrity checker" };
  app.require_subcommand(1);

  std::string configPath;
  bool debug = false;
  app.add_option("-c,--config", configPath, "Configuration file (JSON)");
  app.add_flag("-d,--debug", debug, "Enable debug logging");

  auto *verify_chain_cmd = app.add_subcommand("verify-chain", "Validate the whole chain");

  auto *verify_file_cmd = app.add_subcommand("verify-file", "Verify every chunk of a file");
  std::string verify_name;
  verify_file_cmd->add_option("name", verify_name, "File name in the ledger")->required();

  auto *list_cmd = app.add_subcommand("list-files", "List files with sizes and chunk counts");
  auto *info_cmd = app.add_subcommand("info", "Show chain summary");
  auto *print_cmd = app.add_subcommand("print-chain", "Print every block as JSON");

  CLI11_PARSE(app, argc, argv);

  lfs::Config config;
  if (!configPath.empty()) {
    auto loaded = lfs::Config::load(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }
  // Only verify-file fetches chunks
  if (!verify_file_cmd->parsed()) {
    config.store.required = false;
  }

  auto logResult = lfs::Runtime::configureLogging(config, debug);
  if (!logResult) {
    std::cerr << "Warning: " << logResult.error().message << "\n";
  }

  lfs::Runtime runtime;
  auto initResult = runtime.init(config);
  if (!initResult) {
    std::cerr << "Error: " << initResult.error().message << "\n";
    return 1;
  }
  auto &service = runtime.getService();

  if (verify_chain_cmd->parsed()) {
    return runVerifyChain(service);
  }
  if (verify_file_cmd->parsed()) {
    return runVerifyFile(service, verify_name);
  }
  if (list_cmd->parsed()) {
    return runListFiles(service);
  }
  if (info_cmd->parsed()) {
    return runInfo(service);
  }
  if (print_cmd->parsed()) {
    return runPrintChain(runtime.getChain());
  }
  return 0;
}
