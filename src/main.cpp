// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors before the logger is initialized
#include <limits>
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Scenario:\n"
      << "  --scenario=<name>    honest, minority, majority, tamper, rewrite,\n"
      << "                       pow, merkle (default: honest)\n"
      << "  --replicas=<n>       Number of replicas (default: 5)\n"
      << "  --blocks=<n>         Blocks mined after genesis (default: 4)\n"
      << "  --difficulty=<d>     Leading zero hex digits, 0-64 (default: 3)\n"
      << "  --genesis-time=<t>   Genesis timestamp (default: 1000)\n"
      << "  --tamper-index=<i>   Block targeted by tamper/rewrite (default: 2)\n"
      << "  --threads=<n>        Mine replicas on n threads (default: 1)\n"
      << "  --regtest            Use regression test parameters (difficulty 1)\n"
      << "  --json               Print the report as JSON\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, merkle, consensus, app, all\n"
      << "                       Can be comma-separated: --debug=chain,consensus\n"
      << "  --logfile=<path>     Write logs to a rotating file instead of stderr\n"
      << "  --verbose            Debug logging and every block in the text report\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Parse "--key=<n>" values, reporting errors on stderr
static bool ParseSize(const std::string &arg, size_t prefix_len, int max,
                      size_t &out) {
  auto value = replichain::util::SafeParseInt(arg.substr(prefix_len), 0, max);
  if (!value) {
    std::cerr << "Error: Invalid value in " << arg << std::endl;
    std::cerr << "Expected a number between 0 and " << max << std::endl;
    return false;
  }
  out = static_cast<size_t>(*value);
  return true;
}

int main(int argc, char *argv[]) {
  try {
    replichain::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << replichain::GetFullVersionString() << std::endl;
        std::cout << replichain::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--scenario=") == 0) {
        auto scenario = replichain::app::ParseScenario(arg.substr(11));
        if (!scenario) {
          std::cerr << "Error: Unknown scenario: " << arg.substr(11)
                    << std::endl;
          return 1;
        }
        config.scenario = *scenario;
      } else if (arg.find("--replicas=") == 0) {
        if (!ParseSize(arg, 11, 1000, config.replicas)) {
          return 1;
        }
      } else if (arg.find("--blocks=") == 0) {
        if (!ParseSize(arg, 9, 100000, config.blocks)) {
          return 1;
        }
      } else if (arg.find("--tamper-index=") == 0) {
        if (!ParseSize(arg, 15, 100000, config.tamper_index)) {
          return 1;
        }
      } else if (arg.find("--threads=") == 0) {
        if (!ParseSize(arg, 10, 256, config.threads)) {
          return 1;
        }
      } else if (arg.find("--difficulty=") == 0) {
        auto difficulty = replichain::util::SafeParseInt(arg.substr(13), 0, 64);
        if (!difficulty) {
          std::cerr << "Error: Invalid difficulty: " << arg.substr(13)
                    << std::endl;
          std::cerr << "Difficulty must be a number between 0 and 64"
                    << std::endl;
          return 1;
        }
        config.difficulty = *difficulty;
      } else if (arg.find("--genesis-time=") == 0) {
        auto time = replichain::util::SafeParseInt64(
            arg.substr(15), 0, std::numeric_limits<int64_t>::max());
        if (!time) {
          std::cerr << "Error: Invalid genesis time: " << arg.substr(15)
                    << std::endl;
          return 1;
        }
        config.genesis_time = *time;
      } else if (arg == "--regtest") {
        config.chain_type = replichain::chain::ChainType::REGTEST;
      } else if (arg == "--json") {
        config.json_output = true;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=chain,consensus
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    replichain::util::LogManager::Initialize(log_level, !log_file.empty(),
                                             log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        replichain::util::LogManager::SetLogLevel("trace");
      } else {
        replichain::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int rc = 0;
    {
      replichain::app::Application app(config);
      rc = app.run(std::cout);
    }

    replichain::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    replichain::util::LogManager::Shutdown();
    return 1;
  }
}
