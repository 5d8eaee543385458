#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/tcp_server.hpp"
#include "store/store.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>

struct ProgramOptions {
  std::string host;
  uint16_t port{0};
  std::string log_file;
  lbft::logging::severity_level log_level{lbft::logging::severity_level::info};
  lbft::config::ProtocolConfig protocol;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> [options]\n"
        << "Required arguments:\n"
        << "  -h, --host               Address to listen on\n"
        << "  -p, --port               Port number\n"
        << "Options:\n"
        << "  -d, --dir                Shared directory (default ./shared_files)\n"
        << "  -z, --compression-level  0 (off), 1, 6 or 9\n"
        << "  -t, --timeout            Socket timeout in seconds\n"
        << "  -l, --log-file           Log file path\n"
        << "  -v, --log-level          trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -h 0.0.0.0 -p 9000 -d ./shared_files\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  try {
    for (int i = 1; i < argc - 1; i += 2) {
      const std::string flag(argv[i]);
      const std::string value(argv[i + 1]);

      if (flag == "-h" || flag == "--host") {
        options.host = value;
      } else if (flag == "-p" || flag == "--port") {
        long port = lbft::config::parse_number(flag, value);
        if (port <= 0 || port > 65535) {
          std::cerr << "Error: Invalid port number\n";
          print_usage(argv[0]);
          return options;
        }
        options.port = static_cast<uint16_t>(port);
      } else if (flag == "-l" || flag == "--log-file") {
        options.log_file = value;
      } else if (flag == "-v" || flag == "--log-level") {
        auto level = lbft::logging::severity_from_string(value);
        if (!level) {
          std::cerr << "Error: Unknown log level: " << value << '\n';
          return options;
        }
        options.log_level = *level;
      } else if (flag == "-c" || flag == "--chunk-size") {
        // Each client request names its own chunk size
        std::cerr << "Error: " << flag << " is a client option\n";
        print_usage(argv[0]);
        return options;
      } else if (!lbft::config::apply_protocol_flag(options.protocol, flag, value)) {
        std::cerr << "Error: Unknown argument: " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
    options.protocol.validate();
  } catch (const lbft::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  if (options.host.empty() || options.port == 0) {
    std::cerr << "Error: Both host and port are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_server(const ProgramOptions& options) {
  try {
    lbft::logging::init_logging(options.log_file, options.log_level);

    lbft::store::Store store(options.protocol.storage_root);
    lbft::network::TCP_Server server(options.port, options.host, store, options.protocol);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to listen on " << options.host << ":" << options.port << '\n';
      return false;
    }
    std::cout << "Serving " << options.protocol.storage_root << " on " << options.host << ":"
              << server.port() << std::endl;

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&signal_context](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
      signal_context.stop();
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(options)) {
    return 1;
  }
  return 0;
}
