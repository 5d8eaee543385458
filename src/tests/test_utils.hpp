#ifndef LBFT_TEST_UTILS_HPP
#define LBFT_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "protocol/message.hpp"
#include "protocol/protocol_error.hpp"
#include "transfer/message_sink.hpp"

namespace lbft {
namespace test {

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    // Add console output with formatting
    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);

    // Add commonly used attributes
    boost::log::add_common_attributes();
}

// Deterministic pseudo-random bytes
inline std::vector<uint8_t> random_bytes(std::size_t size, uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<uint8_t> bytes(size);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return bytes;
}

// Highly compressible bytes
inline std::vector<uint8_t> text_bytes(std::size_t size) {
    static const std::string line = "the quick brown fox jumps over the lazy dog\n";
    std::vector<uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(line[i % line.size()]);
    }
    return bytes;
}

// Fresh directory under the system temp path, removed by the owner
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
    static std::mt19937 gen(std::random_device{}());
    auto dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(gen()));
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Collects everything the state machine emits
class RecordingSink : public transfer::MessageSink {
public:
    void send(const protocol::ProtocolMessage& message) override {
        messages.push_back(message);
    }

    std::vector<protocol::MessageType> types() const {
        std::vector<protocol::MessageType> result;
        for (const auto& message : messages) {
            result.push_back(message.type);
        }
        return result;
    }

    std::vector<protocol::ProtocolMessage> messages;
};

// Messages a ScriptedStream replays and records, outlives the stream
struct Script {
    std::deque<protocol::ProtocolMessage> incoming;
    std::vector<protocol::ProtocolMessage> sent;
    bool closed = false;
    bool fail_sends = false;

    std::vector<protocol::MessageType> sent_types() const {
        std::vector<protocol::MessageType> result;
        for (const auto& message : sent) {
            result.push_back(message.type);
        }
        return result;
    }
};

// Replays queued messages and records what is sent, closing cleanly once the queue runs dry
class ScriptedStream : public transfer::MessageStream {
public:
    explicit ScriptedStream(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    void send(const protocol::ProtocolMessage& message) override {
        if (script_->fail_sends) {
            throw protocol::ProtocolError(protocol::ErrorKind::WRITE_ERROR, "scripted send failure");
        }
        script_->sent.push_back(message);
    }

    std::optional<protocol::ProtocolMessage> receive() override {
        if (script_->incoming.empty()) {
            return std::nullopt;
        }
        auto message = script_->incoming.front();
        script_->incoming.pop_front();
        return message;
    }

    void close() override {
        script_->closed = true;
    }

private:
    std::shared_ptr<Script> script_;
};

} // namespace test
} // namespace lbft

#endif // LBFT_TEST_UTILS_HPP
