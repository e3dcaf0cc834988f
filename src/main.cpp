#include <unistd.h>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/config.h>
#include <codebox/logger.h>
#include <codebox/session.h>
#include "codebox/utils.h"

namespace {

void ParseArgs(int argc, char** argv, Config& config) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox-shelld");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfigPath) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-l", "--listen")
    .help("tcp://host:port or unix:/path");
  parser.add_argument("--prompt")
    .help("PS1 of session shells");
  parser.add_argument("--shell")
    .help("Shell command line of each session");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  SetVerbosity(verbosity);
  if (auto path = parser.present("--config")) {
    if (!ParseConfig(std::filesystem::path(path.value()), config)) exit(1);
  } else if (std::filesystem::exists(kDefaultConfigPath) &&
             !ParseConfig(std::filesystem::path(kDefaultConfigPath), config)) {
    exit(1);
  }
  if (auto val = parser.present("--listen")) config.listen = val.value();
  if (auto val = parser.present("--prompt")) config.session.prompt = val.value();
  if (auto val = parser.present("--shell"); val && !SplitWords(val.value()).empty()) {
    config.session.shell = SplitWords(val.value());
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Config config;
  ParseArgs(argc, argv, config);
  auto address = ListenAddress::Parse(config.listen);
  if (!address) {
    spdlog::error("Invalid listen address {}", config.listen);
    return 1;
  }
  if (geteuid() == 0) spdlog::warn("Running as root; session shells will run as root too");
  SessionListener listener(address.value(), config.session);
  if (!listener.Bind()) return 1;
  listener.Serve();
}
