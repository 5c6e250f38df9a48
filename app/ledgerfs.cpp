#include "../service/Config.h"
#include "../service/FileSystemAdapter.h"
#include "../service/Runtime.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>

#include <cstring>
#include <iostream>
#include <string>

static int reportErrno(const std::string &what, const lfs::FileSystemAdapter::Error &err) {
  std::cerr << "Error: " << what << ": " << std::strerror(err.code) << " ("
            << err.message << ")\n";
  return 1;
}

static int runWrite(lfs::FileSystemAdapter &fs, const std::string &name,
                    const std::string &localFile, uint64_t offset) {
  auto content = lfs::utl::readFile(localFile);
  if (!content) {
    std::cerr << "Error: " << content.error().message << "\n";
    return 1;
  }
  auto result = fs.write("/" + name, content.value(), offset);
  if (!result) {
    return reportErrno("write " + name, result.error());
  }
  std::cout << "Wrote " << result.value() << " bytes to " << name << "\n";
  return 0;
}

static int runRead(lfs::FileSystemAdapter &fs, const std::string &name,
                   const std::string &outFile, uint64_t offset, uint64_t size) {
  std::string path = "/" + name;
  if (size == 0) {
    auto attr = fs.getattr(path);
    if (!attr) {
      return reportErrno("read " + name, attr.error());
    }
    size = attr.value().size;
  }
  auto result = fs.read(path, size, offset);
  if (!result) {
    return reportErrno("read " + name, result.error());
  }
  if (outFile.empty()) {
    std::cout << result.value();
    return 0;
  }
  auto written = lfs::utl::writeFileAtomic(outFile, result.value());
  if (!written) {
    std::cerr << "Error: " << written.error().message << "\n";
    return 1;
  }
  std::cout << "Read " << result.value().size() << " bytes into " << outFile << "\n";
  return 0;
}

static int runList(lfs::FileSystemAdapter &fs) {
  auto entries = fs.readdir("/");
  if (!entries) {
    return reportErrno("ls", entries.error());
  }
  for (const auto &entry : entries.value()) {
    if (entry == "." || entry == "..") {
      continue;
    }
    auto attr = fs.getattr("/" + entry);
    std::cout << entry << "\t" << (attr ? attr.value().size : 0) << "\n";
  }
  return 0;
}

static int runStat(lfs::FileSystemAdapter &fs, const std::string &name) {
  auto attr = fs.getattr("/" + name);
  if (!attr) {
    return reportErrno("stat " + name, attr.error());
  }
  std::cout << "Name:  " << name << "\n";
  std::cout << "Size:  " << attr.value().size << "\n";
  std::cout << "Mode:  " << std::oct << attr.value().mode << std::dec << "\n";
  std::cout << "Links: " << attr.value().nlink << "\n";
  return 0;
}

int main(int argc, char **argv) {
  CLI::App app{ "LedgerFS - files over a tamper-evident chunk ledger" };
  app.require_subcommand(1);

  std::string configPath;
  bool debug = false;
  app.add_option("-c,--config", configPath, "Configuration file (JSON)");
  app.add_flag("-d,--debug", debug, "Enable debug logging");

  auto *write_cmd = app.add_subcommand("write", "Store a local file in the ledger");
  std::string write_name;
  std::string write_local;
  uint64_t write_offset = 0;
  write_cmd->add_option("name", write_name, "File name in the ledger")->required();
  write_cmd->add_option("local", write_local, "Local file to read")->required();
  write_cmd->add_option("--offset", write_offset, "Write offset (only 0 is supported)");

  auto *read_cmd = app.add_subcommand("read", "Read a file back from the ledger");
  std::string read_name;
  std::string read_out;
  uint64_t read_offset = 0;
  uint64_t read_size = 0;
  read_cmd->add_option("name", read_name, "File name in the ledger")->required();
  read_cmd->add_option("-o,--output", read_out, "Write to this file instead of stdout");
  read_cmd->add_option("--offset", read_offset, "Start offset");
  read_cmd->add_option("--size", read_size, "Bytes to read (default: whole file)");

  auto *ls_cmd = app.add_subcommand("ls", "List files");

  auto *stat_cmd = app.add_subcommand("stat", "Show file attributes");
  std::string stat_name;
  stat_cmd->add_option("name", stat_name, "File name in the ledger")->required();

  auto *rm_cmd = app.add_subcommand("rm", "Delete a file (always refused)");
  std::string rm_name;
  rm_cmd->add_option("name", rm_name, "File name in the ledger")->required();

  auto *truncate_cmd = app.add_subcommand("truncate", "Truncate a file (always refused)");
  std::string truncate_name;
  uint64_t truncate_length = 0;
  truncate_cmd->add_option("name", truncate_name, "File name in the ledger")->required();
  truncate_cmd->add_option("--length", truncate_length, "New length");

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
  auto &fs = runtime.getAdapter();

  if (write_cmd->parsed()) {
    return runWrite(fs, write_name, write_local, write_offset);
  }
  if (read_cmd->parsed()) {
    return runRead(fs, read_name, read_out, read_offset, read_size);
  }
  if (ls_cmd->parsed()) {
    return runList(fs);
  }
  if (stat_cmd->parsed()) {
    return runStat(fs, stat_name);
  }
  if (rm_cmd->parsed()) {
    auto result = fs.unlink("/" + rm_name);
    return result ? 0 : reportErrno("rm " + rm_name, result.error());
  }
  if (truncate_cmd->parsed()) {
    auto result = fs.truncate("/" + truncate_name, truncate_length);
    return result ? 0 : reportErrno("truncate " + truncate_name, result.error());
  }
  return 0;
}
