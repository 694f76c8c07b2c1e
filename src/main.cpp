// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<path>      Forwarding configuration file (default: natforward.json)\n"
      << "  --http-port=<port>   Local HTTP port to expose (default: 8096)\n"
      << "  --https-port=<port>  Local HTTPS port to expose (default: 8920)\n"
      << "  --https              The server also listens with HTTPS\n"
      << "  --name=<name>        Description of the mappings on the gateway\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: forwarding, nat, config, app, all\n"
      << "                       Can be comma-separated: --debug=forwarding,nat\n"
      << "  --logfile=<path>     Log to a file instead of stdout\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Send SIGHUP to reload the configuration file.\n"
      << std::endl;
}

static uint16_t parse_port(const std::string &value, const char *option) {
  int port = std::stoi(value);
  if (port < 1 || port > 65535) {
    throw std::out_of_range(std::string(option) + " must be between 1 and 65535");
  }
  return static_cast<uint16_t>(port);
}

int main(int argc, char *argv[]) {
  try {
    natforward::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << natforward::GetFullVersionString() << std::endl;
        std::cout << natforward::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config.config_path = arg.substr(9);
      } else if (arg.find("--http-port=") == 0) {
        config.http_port = parse_port(arg.substr(12), "--http-port");
      } else if (arg.find("--https-port=") == 0) {
        config.https_port = parse_port(arg.substr(13), "--https-port");
      } else if (arg == "--https") {
        config.listen_with_https = true;
      } else if (arg.find("--name=") == 0) {
        config.name = arg.substr(7);
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=forwarding,nat
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

    natforward::util::LogManager::Initialize(log_level, !log_file.empty(),
                                             log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        natforward::util::LogManager::SetLogLevel("trace");
      } else if (component == "fwd") {
        natforward::util::LogManager::SetComponentLevel("forwarding", "trace");
      } else if (!natforward::util::LogManager::SetComponentLevel(component,
                                                                  "trace")) {
        std::cerr << "Unknown log component: " << component << std::endl;
        natforward::util::LogManager::Shutdown();
        return 1;
      }
    }

    natforward::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      natforward::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      natforward::util::LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();

    natforward::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    natforward::util::LogManager::Shutdown();
    return 1;
  }
}
