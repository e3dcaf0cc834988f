#include <signal.h>
#include <atomic>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codebox/utils.h>
#include <codebox/config.h>
#include <codebox/logger.h>
#include <codebox/execution.h>

namespace {

std::atomic_bool cancelled(false);

void CancelHandler(int) {
  cancelled = true;
}

std::string ReadAll(std::istream& in) {
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct Args {
  ExecutionRequest request;
  Config config;
  bool text;
};

bool ParseArgs(int argc, char** argv, Args& args) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox-run");
  parser.add_argument("request")
    .default_value(std::string(""))
    .help("JSON request file, - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfigPath) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--code")
    .help("Code to run instead of a request");
  parser.add_argument("-f", "--file")
    .help("File with the code to run instead of a request");
  parser.add_argument("--lint")
    .default_value(false)
    .implicit_value(true)
    .help("Lint the code instead of running it");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .help("Wall clock limit in seconds");
  parser.add_argument("--backend")
    .help("Limit backend: rlimit, cgroup, namespace or jail");
  parser.add_argument("--text")
    .default_value(false)
    .implicit_value(true)
    .help("Print human-readable output instead of JSON");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return false;
  }

  SetVerbosity(verbosity);
  if (auto path = parser.present("--config")) {
    if (!ParseConfig(std::filesystem::path(path.value()), args.config)) return false;
  } else if (std::filesystem::exists(kDefaultConfigPath) &&
             !ParseConfig(std::filesystem::path(kDefaultConfigPath), args.config)) {
    return false;
  }
  if (auto val = parser.present("--backend")) {
    auto type = GetLimitBackend(val.value());
    if (!type) {
      spdlog::error("Unknown limit backend {}", val.value());
      return false;
    }
    args.config.execution.backend = type.value();
  }

  if (auto code = parser.present("--code")) {
    args.request.code = code.value();
  } else if (auto file = parser.present("--file")) {
    std::ifstream fin(file.value());
    if (!fin) {
      spdlog::error("Failed opening {}", file.value());
      return false;
    }
    args.request.code = ReadAll(fin);
  } else {
    std::string path = parser.get<std::string>("request");
    std::string body;
    if (path.empty() || path == "-") {
      body = ReadAll(std::cin);
    } else {
      std::ifstream fin(path);
      if (!fin) {
        spdlog::error("Failed opening {}", path);
        return false;
      }
      body = ReadAll(fin);
    }
    try {
      nlohmann::json::parse(body).get_to(args.request);
    } catch (std::exception& e) {
      spdlog::error("Invalid request: {}", e.what());
      return false;
    }
  }
  if (parser["--lint"] == true) args.request.mode = ExecutionMode::LINT;
  if (auto val = parser.present<int>("--timeout")) args.request.timeout_seconds = val.value();
  args.text = parser["--text"] == true;
  return true;
}

void Print(const ExecutionResult& result, bool text) {
  if (text) {
    std::cout << result.FormattedOutput() << std::endl;
  } else {
    // guest output is not necessarily UTF-8
    std::cout << nlohmann::json(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%P] %+");
  spdlog::set_level(spdlog::level::warn);
  InitLogger();
  Args args;
  if (!ParseArgs(argc, argv, args)) return 1;

  struct sigaction action = {};
  action.sa_handler = CancelHandler;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  try {
    ExecutionManager manager(args.config.profile, args.config.execution);
    Print(manager.Execute(args.request, &cancelled), args.text);
  } catch (ManagerError& e) {
    spdlog::error("{}", e.what());
    ExecutionResult result;
    result.exit_status = ExitStatus::Error(e.what());
    Print(result, args.text);
    return 1;
  }
  return 0;
}
