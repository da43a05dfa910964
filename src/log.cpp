#include "log.hpp"
#include <spdlog/sinks/basic_file_sink.h>

bool parse_log_level(std::string_view name, spdlog::level::level_enum& out) {
  if (name == "trace") out = spdlog::level::trace;
  else if (name == "debug") out = spdlog::level::debug;
  else if (name == "info") out = spdlog::level::info;
  else if (name == "warn") out = spdlog::level::warn;
  else if (name == "error") out = spdlog::level::err;
  else if (name == "off") out = spdlog::level::off;
  else return false;
  return true;
}

bool setup_logging(const std::filesystem::path& path, std::string_view level, std::string& msg) {
  spdlog::level::level_enum lvl;
  if (!parse_log_level(level, lvl)) {
    msg = "unknown log level: " + std::string(level);
    return false;
  }
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
    auto logger = std::make_shared<spdlog::logger>("fnedit", sink);
    logger->set_level(lvl);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + e.what();
    return false;
  }
  return true;
}
