#include "client/client.hpp"
#include "client/retry_policy.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct ProgramOptions {
  std::string host;
  uint16_t port{0};
  std::string log_file;
  lbft::logging::severity_level log_level{lbft::logging::severity_level::warning};
  unsigned retries{3};
  lbft::config::ProtocolConfig protocol;
  std::string command;
  std::vector<std::string> arguments;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> [options] <command> [arguments]\n"
        << "Commands:\n"
        << "  list                            Show the files the server offers\n"
        << "  download <name> [local path]    Fetch a file, default path is the name\n"
        << "  upload <local path> [name]      Send a file, default name is the file name\n"
        << "Required arguments:\n"
        << "  -h, --host               Server address\n"
        << "  -p, --port               Port number\n"
        << "Options:\n"
        << "  -c, --chunk-size         1024, 4096, 16384 or 65536\n"
        << "  -z, --compression-level  0 (off), 1, 6 or 9\n"
        << "  -t, --timeout            Socket timeout in seconds\n"
        << "  -r, --retries            Attempts for transient failures (default 3)\n"
        << "  -l, --log-file           Log file path\n"
        << "  -v, --log-level          trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 9000 download report.pdf\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  try {
    int i = 1;
    // Flags come in pairs until the command
    for (; i < argc && argv[i][0] == '-'; i += 2) {
      const std::string flag(argv[i]);
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
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
      } else if (flag == "-r" || flag == "--retries") {
        long retries = lbft::config::parse_number(flag, value);
        if (retries <= 0) {
          std::cerr << "Error: Retries must be at least 1\n";
          return options;
        }
        options.retries = static_cast<unsigned>(retries);
      } else if (flag == "-l" || flag == "--log-file") {
        options.log_file = value;
      } else if (flag == "-v" || flag == "--log-level") {
        auto level = lbft::logging::severity_from_string(value);
        if (!level) {
          std::cerr << "Error: Unknown log level: " << value << '\n';
          return options;
        }
        options.log_level = *level;
      } else if (!lbft::config::apply_protocol_flag(options.protocol, flag, value)) {
        std::cerr << "Error: Unknown argument: " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
    options.protocol.validate();

    if (i < argc) {
      options.command = argv[i++];
    }
    for (; i < argc; ++i) {
      options.arguments.emplace_back(argv[i]);
    }
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

  bool arguments_ok =
    (options.command == "list" && options.arguments.empty()) ||
    ((options.command == "download" || options.command == "upload") &&
     !options.arguments.empty() && options.arguments.size() <= 2);
  if (!arguments_ok) {
    std::cerr << "Error: Invalid command\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

void print_progress(uint64_t done, uint64_t total) {
  int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
  std::cout << "\r  " << done << " / " << total << " bytes (" << percent << "%)" << std::flush;
}

void print_listing(const std::vector<lbft::protocol::ListEntry>& entries) {
  if (entries.empty()) {
    std::cout << "No files available" << std::endl;
    return;
  }
  for (const auto& entry : entries) {
    std::time_t modified = static_cast<std::time_t>(entry.modified_time);
    std::tm local{};
    localtime_r(&modified, &local);
    std::cout << std::setw(12) << entry.size << "  "
              << std::put_time(&local, "%Y-%m-%d %H:%M") << "  " << entry.name << '\n';
  }
  std::cout << std::flush;
}

// Connects and handshakes a fresh client, every retry starts here
std::unique_ptr<lbft::client::Client> open_client(const ProgramOptions& options) {
  auto client = std::make_unique<lbft::client::Client>(options.protocol);
  client->set_progress_callback(print_progress);
  client->connect(options.host, options.port);
  client->handshake();
  return client;
}

bool run_client(const ProgramOptions& options) {
  try {
    lbft::logging::init_logging(options.log_file, options.log_level);
    lbft::client::RetryPolicy retry(options.retries);

    if (options.command == "list") {
      auto entries = retry.run([&options]() {
        auto client = open_client(options);
        auto result = client->list();
        client->disconnect();
        return result;
      });
      print_listing(entries);
    } else if (options.command == "download") {
      const std::string& name = options.arguments[0];
      std::string destination = options.arguments.size() > 1 ? options.arguments[1] : name;
      auto metadata = retry.run([&]() {
        auto client = open_client(options);
        auto result = client->download(name, destination);
        client->disconnect();
        return result;
      });
      std::cout << "\nDownloaded " << name << " (" << metadata.total_size << " bytes, sha256 "
                << lbft::integrity::to_hex(metadata.digest) << ") to " << destination << std::endl;
    } else {
      const std::string& source = options.arguments[0];
      std::string name = options.arguments.size() > 1
        ? options.arguments[1]
        : std::filesystem::path(source).filename().string();
      auto metadata = retry.run([&]() {
        auto client = open_client(options);
        auto result = client->upload(source, name);
        client->disconnect();
        return result;
      });
      std::cout << "\nUploaded " << source << " as " << name << " (" << metadata.total_size
                << " bytes, sha256 " << lbft::integrity::to_hex(metadata.digest) << ")" << std::endl;
    }
    return true;
  } catch (const lbft::protocol::ProtocolError& e) {
    std::cerr << "\nError: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    std::cerr << "\nError: Client failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_client(options)) {
    return 1;
  }
  return 0;
}
