#include "gsnake_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace gsnake {

namespace {
constexpr const char* kLoggerName = "gridsnake";
}

std::string init_logging(const GameConfig& config) {
  const std::string path = resolved_log_file(config);
  std::shared_ptr<spdlog::logger> logger;
  spdlog::drop(kLoggerName);

  try {
    const std::filesystem::path target(path);
    if (const auto parent = target.parent_path(); !parent.empty()) {
      std::filesystem::create_directories(parent);
    }
    logger = spdlog::basic_logger_mt(kLoggerName, path, true);
  } catch (const std::exception& e) {
    std::cerr << "gridsnake: logging disabled: " << e.what() << std::endl;
    spdlog::drop(kLoggerName);
    logger = spdlog::null_logger_mt(kLoggerName);
    spdlog::set_default_logger(logger);
    return std::string();
  }

  logger->set_level(spdlog::level::from_str(config.log_level));
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return path;
}

}  // namespace gsnake
