// schema_dsl/basic/logging.hpp - Process-wide operational logger
//
// Diagnostics about schema sources go through DiagnosticBag; this logger
// carries progress and database activity (connections, statements, timing).
//
#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace schema_dsl
{

struct LogOptions
{
  spdlog::level::level_enum level = spdlog::level::warn;
  bool use_color = true;
  /// Optional file receiving every message at debug level.
  std::string log_file;
};

/**
 * Install the "schema_dsl" logger as spdlog's default logger.
 *
 * Safe to call more than once; the previous default logger is replaced.
 */
void init_logging(const LogOptions & options);

/// Map a verbosity count (-v, -vv) to a level, starting from warn.
[[nodiscard]] spdlog::level::level_enum level_for_verbosity(int verbosity) noexcept;

}  // namespace schema_dsl
