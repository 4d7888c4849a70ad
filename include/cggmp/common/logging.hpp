#pragma once

#include <optional>
#include <string_view>

#include <boost/log/trivial.hpp>

namespace cggmp {

struct LogConfig {
  boost::log::trivial::severity_level min_severity = boost::log::trivial::warning;

  // Reads CGGMP_LOG_LEVEL; unset or unrecognised values keep the default.
  static LogConfig FromEnvironment();
};

std::optional<boost::log::trivial::severity_level> ParseLogSeverity(std::string_view name);

// Installs the severity filter on the Boost.Log core.
void InitLogging(const LogConfig& config);

}  // namespace cggmp
