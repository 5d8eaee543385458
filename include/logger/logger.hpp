#ifndef LBFT_LOGGER_HPP
#define LBFT_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace lbft {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Installs a text file sink (and optionally a console sink) on the Boost.Log core.
// An empty log_file disables the file sink.
void init_logging(const std::string& log_file, severity_level min_level, bool console = true);

// Parses trace/debug/info/warning/error/fatal
std::optional<severity_level> severity_from_string(const std::string& value);

} // namespace logging
} // namespace lbft

#endif // LBFT_LOGGER_HPP
