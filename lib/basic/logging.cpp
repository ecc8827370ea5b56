// schema_dsl/basic/logging.cpp
#include "schema_dsl/basic/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <memory>
#include <vector>

namespace schema_dsl
{

void init_logging(const LogOptions & options)
{
  std::vector<spdlog::sink_ptr> sinks;

  // stderr keeps stdout free for generated SQL and JSON dumps.
  spdlog::sink_ptr console;
  if (options.use_color) {
    console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
  }
  console->set_level(options.level);
  console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
  sinks.push_back(console);

  if (!options.log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, true);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("schema_dsl", sinks.begin(), sinks.end());
  logger->set_level(options.log_file.empty() ? options.level : spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

spdlog::level::level_enum level_for_verbosity(int verbosity) noexcept
{
  if (verbosity <= 0) return spdlog::level::warn;
  if (verbosity == 1) return spdlog::level::info;
  if (verbosity == 2) return spdlog::level::debug;
  return spdlog::level::trace;
}

}  // namespace schema_dsl
