#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include "cli/cli.hpp"
#include "client/http_transport.hpp"
#include "config/config_loader.hpp"
#include "logger/logger.hpp"
#include "server/service.hpp"

struct ProgramOptions {
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<std::string> secret;
  std::string config_file;
  std::string log_file = "netfile.log";
  std::string log_level;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-h <host>] [-p <port>] [-s <secret>] [-c <config>]"
            << " [-l <log file>] [-v <log level>]\n"
            << "Optional arguments:\n"
            << "  -h, --host       Listen address (default 127.0.0.1)\n"
            << "  -p, --port       Listen port, 0 picks a free one (default 0)\n"
            << "  -s, --secret     Shared secret, generated when absent\n"
            << "  -c, --config     JSON configuration file\n"
            << "  -l, --log-file   Log file (default netfile.log)\n"
            << "  -v, --log-level  trace, debug, info, warning, error or fatal\n"
            << "Command line values override the configuration file.\n"
            << "Example: " << program_name << " -h 127.0.0.1 -p 3001\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-h", "--host", "-p", "--port", "-s", "--secret", "-c", "--config",
    "-l", "--log-file", "-v", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-h" || flag == "--host") {
      options.host = value;
    } else if (flag == "-p" || flag == "--port") {
      int port = -1;
      try {
        std::size_t consumed = 0;
        port = std::stoi(value, &consumed);
        if (consumed != value.size()) {
          port = -1;
        }
      } catch (const std::exception&) {
        port = -1;
      }
      if (port < 0 || port > 65535) {
        std::cerr << "Error: Invalid port number\n";
        print_usage(argv[0]);
        return options;
      }
      options.port = static_cast<uint16_t>(port);
    } else if (flag == "-s" || flag == "--secret") {
      options.secret = value;
    } else if (flag == "-c" || flag == "--config") {
      options.config_file = value;
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      options.log_level = value;
    }
  }

  options.valid = true;
  return options;
}

bool run_node(const ProgramOptions& options) {
  try {
    netfile::config::NodeConfig config;
    if (!options.config_file.empty()) {
      config = netfile::config::load_config(options.config_file);
    }

    std::string level = !options.log_level.empty() ? options.log_level : config.log_level;
    netfile::logging::init_logging(options.log_file,
      level.empty() ? netfile::logging::severity_level::info : netfile::logging::parse_log_level(level));

    if (options.host) {
      config.server.address = *options.host;
    }
    if (options.port) {
      config.server.port = *options.port;
    }
    if (options.secret) {
      config.server.shared_secret = *options.secret;
    }

    netfile::server::Service service(config.server);
    auto transport = std::make_shared<netfile::client::HttpTransport>();
    netfile::cli::CLI cli(service, transport);

    if (!service.start()) {
      std::cerr << "Error: Failed to start file server\n";
      return false;
    }

    std::cout << "Serving on " << service.base_url() << '\n'
              << "Shared secret: " << service.shared_secret() << '\n';
    cli.run();
    service.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
