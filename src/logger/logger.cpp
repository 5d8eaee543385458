#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace lbft {
namespace logging {

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage;

    if (!log_file.empty()) {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    if (console) {
      auto console_sink = boost::log::add_console_log(std::clog);
      console_sink->set_formatter(formatter);
    }

    boost::log::add_common_attributes();
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

std::optional<severity_level> severity_from_string(const std::string& value) {
  if (value == "trace")   return severity_level::trace;
  if (value == "debug")   return severity_level::debug;
  if (value == "info")    return severity_level::info;
  if (value == "warning") return severity_level::warning;
  if (value == "error")   return severity_level::error;
  if (value == "fatal")   return severity_level::fatal;
  return std::nullopt;
}

} // namespace logging
} // namespace lbft
