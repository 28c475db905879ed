#include "network/bootstrap.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <stdexcept>
#include <unordered_set>

struct ProgramOptions {
  chunkd::config::EngineConfig engine;
  chunkd::config::ServerConfig server;
  chunkd::logger::LogOptions logging;
  bool shell{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <data-dir> [options]\n"
        << "Required arguments:\n"
        << "  -d, --data-dir   Storage root for chunks and artifacts\n"
        << "Options:\n"
        << "  -h, --host       Listen address (default 0.0.0.0)\n"
        << "  -p, --port       Listen port (default 5000, 0 picks a free port)\n"
        << "  -t, --threads    Worker threads (default 4)\n"
        << "  --ttl            Session idle timeout in seconds, 0 disables (default 86400)\n"
        << "  --log-level      trace|debug|info|warning|error|fatal (default info)\n"
        << "  --log-file       Also log to this file\n"
        << "  --shell          Run the interactive shell instead of waiting for a signal\n"
        << "Example: " << program_name << " -d /var/lib/chunkd -h 127.0.0.1 -p 3001\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-h", "--host",
    "-p", "--port",
    "-d", "--data-dir",
    "-t", "--threads",
    "--ttl",
    "--log-level",
    "--log-file"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--shell") {
      options.shell = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    try {
      if (flag == "-h" || flag == "--host") {
        options.server.address = value;
      } else if (flag == "-p" || flag == "--port") {
        int port = std::stoi(value);
        if (port < 0 || port > 65535) {
          throw std::out_of_range("port");
        }
        options.server.port = static_cast<uint16_t>(port);
      } else if (flag == "-d" || flag == "--data-dir") {
        options.engine.storage_root = value;
      } else if (flag == "-t" || flag == "--threads") {
        int threads = std::stoi(value);
        if (threads < 1) {
          throw std::out_of_range("threads");
        }
        options.server.worker_threads = static_cast<std::size_t>(threads);
      } else if (flag == "--ttl") {
        long long ttl = std::stoll(value);
        if (ttl < 0) {
          throw std::out_of_range("ttl");
        }
        options.engine.session_ttl = std::chrono::seconds(ttl);
      } else if (flag == "--log-level") {
        if (!chunkd::logger::parse_severity(value, options.logging.min_level)) {
          throw std::invalid_argument("log level");
        }
      } else if (flag == "--log-file") {
        options.logging.log_file = value;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.engine.storage_root.empty()) {
    std::cerr << "Error: A data directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

// Blocks until SIGINT or SIGTERM
void wait_for_signal() {
  boost::asio::io_context io_context;
  boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
    }
  });
  io_context.run();
}

bool run_bootstrap(const ProgramOptions& options) {
  try {
    chunkd::network::Bootstrap service(options.engine, options.server);

    if (!service.start()) {
      std::cerr << "Error: Failed to start service\n";
      return false;
    }

    if (options.shell) {
      chunkd::cli::CLI cli(service.get_engine());
      cli.run();
    } else {
      wait_for_signal();
    }
    return service.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start service: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  chunkd::logger::init_logging(options.logging);

  if (!run_bootstrap(options)) {
    return 1;
  }
  return 0;
}
