#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "time_utils.hpp"

namespace microbatch_server {
// Logging utilities
// -----------------
// Every line is prefixed with a wall-clock timestamp and written under a
// global mutex, so worker threads, gRPC threads and the supervisor never
// interleave partial lines.

inline std::mutex log_mutex;

enum class VerbosityLevel : std::uint8_t {
  Silent = 0,
  Info = 1,
  Stats = 2,
  Debug = 3,
  Trace = 4
};

// =============================================================================
// Utility: parse verbosity level from string or number
// =============================================================================

inline auto
parse_verbosity_level(const std::string& val) -> VerbosityLevel
{
  using enum VerbosityLevel;

  const auto first = val.find_first_not_of(" \t\n\r\f\v");
  const auto last = val.find_last_not_of(" \t\n\r\f\v");
  const std::string trimmed = first == std::string::npos
                                  ? std::string{}
                                  : val.substr(first, last - first + 1);
  if (trimmed.empty()) {
    throw std::invalid_argument("Empty verbosity level");
  }

  if (std::ranges::all_of(
          trimmed, [](unsigned char c) { return std::isdigit(c) != 0; })) {
    if (trimmed.size() > 1) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    const int level = trimmed.front() - '0';
    if (level > std::to_underlying(Trace)) {
      throw std::invalid_argument("Invalid verbosity level: " + trimmed);
    }
    return static_cast<VerbosityLevel>(level);
  }

  std::string lower(trimmed.size(), '\0');
  std::ranges::transform(trimmed, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "silent") {
    return Silent;
  }
  if (lower == "info") {
    return Info;
  }
  if (lower == "stats") {
    return Stats;
  }
  if (lower == "debug") {
    return Debug;
  }
  if (lower == "trace") {
    return Trace;
  }
  throw std::invalid_argument("Invalid verbosity level: " + trimmed);
}

inline auto
should_log(const VerbosityLevel level, const VerbosityLevel current_level)
    -> bool
{
  return std::to_underlying(current_level) >= std::to_underlying(level) &&
         level != VerbosityLevel::Silent;
}

// =============================================================================
// Utility: color and label mapping for verbosity levels
// =============================================================================

inline auto
verbosity_style(const VerbosityLevel level)
    -> std::pair<const char*, const char*>
{
  using enum VerbosityLevel;
  switch (level) {
    case Info:
      return {"\x1b[1;32m", "[INFO] "};  // Green
    case Stats:
      return {"\x1b[1;35m", "[STATS] "};  // Magenta
    case Debug:
      return {"\x1b[1;34m", "[DEBUG] "};  // Blue
    case Trace:
      return {"\x1b[1;90m", "[TRACE] "};  // Gray
    default:
      return {"", ""};
  }
}

namespace detail {
inline void
write_log_line(
    std::ostream& stream, std::string_view color, std::string_view label,
    std::string_view message)
{
  const auto stamp =
      time_utils::format_timestamp(std::chrono::system_clock::now());
  const std::scoped_lock lock(log_mutex);
  stream << color << stamp << ' ' << label << message << "\x1b[0m\n"
         << std::flush;
}
}  // namespace detail

// =============================================================================
// Verbosity-controlled logging (stdout)
// =============================================================================

inline void
log_verbose(
    const VerbosityLevel level, const VerbosityLevel current_level,
    const std::string& message)
{
  if (should_log(level, current_level)) {
    auto [color, label] = verbosity_style(level);
    detail::write_log_line(std::cout, color, label, message);
  }
}

inline void
log_info(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Info, lvl, msg);
}

inline void
log_stats(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Stats, lvl, msg);
}

inline void
log_debug(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Debug, lvl, msg);
}

inline void
log_trace(const VerbosityLevel lvl, const std::string& msg)
{
  log_verbose(VerbosityLevel::Trace, lvl, msg);
}

// =============================================================================
// Unconditional stderr logging
// =============================================================================

inline void
log_warning(const std::string& message)
{
  detail::write_log_line(std::cerr, "\x1b[1;33m", "[WARNING] ", message);
}

inline void
log_error(const std::string& message)
{
  detail::write_log_line(std::cerr, "\x1b[1;31m", "[ERROR] ", message);
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  detail::write_log_line(std::cerr, "\x1b[1;41m", "[FATAL] ", message);
  std::terminate();
}
}  // namespace microbatch_server
