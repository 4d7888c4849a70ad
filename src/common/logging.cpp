#include "cggmp/common/logging.hpp"

#include <cstdlib>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace cggmp {

std::optional<boost::log::trivial::severity_level> ParseLogSeverity(std::string_view name) {
  using boost::log::trivial::severity_level;
  if (name == "trace") {
    return severity_level::trace;
  }
  if (name == "debug") {
    return severity_level::debug;
  }
  if (name == "info") {
    return severity_level::info;
  }
  if (name == "warning") {
    return severity_level::warning;
  }
  if (name == "error") {
    return severity_level::error;
  }
  if (name == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

LogConfig LogConfig::FromEnvironment() {
  LogConfig config;
  const char* env = std::getenv("CGGMP_LOG_LEVEL");
  if (env != nullptr && env[0] != '\0') {
    const auto parsed = ParseLogSeverity(env);
    if (parsed.has_value()) {
      config.min_severity = *parsed;
    }
  }
  return config;
}

void InitLogging(const LogConfig& config) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= config.min_severity);
}

}  // namespace cggmp
