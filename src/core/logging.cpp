#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <system_error>

#include "../control/config.hpp"

namespace lattice::logging {

static std::atomic<quill::Logger*> g_current_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::LogLevel parse_log_level(std::string_view level) {
  std::string level_lower(level);
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  } else if (level_lower == "info") {
    return quill::LogLevel::Info;
  } else if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  } else if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(std::string_view component, const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;
  std::string logger_name(component);

  if (log_config.output == "stdout") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
  } else {
    std::error_code ec;
    std::filesystem::create_directories(log_config.output, ec);
    if (ec) {
      // Unwritable log directory: keep running on the console
      auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
      logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
      LOG_WARNING(logger, "Cannot create log directory {}: {}", log_config.output, ec.message());
    } else {
      quill::RotatingFileSinkConfig config;
      config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
      config.set_max_backup_files(log_config.rotation.max_files);
      config.set_open_mode('a');

      std::string log_path = fmt::format("{}/{}.log", log_config.output, component);

      if (log_config.format == "json") {
        auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
            log_path, config);
        logger = quill::Frontend::create_or_get_logger(logger_name, std::move(json_sink));
      } else {
        auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
            log_path, config);
        logger = quill::Frontend::create_or_get_logger(logger_name, std::move(file_sink));
      }
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_current_logger.store(logger);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_current_logger.load()) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  quill::Logger* logger = g_current_logger.load();
  if (logger) {
    return logger;
  }

  init_logging_system();
  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
  logger = quill::Frontend::create_or_get_logger("lattice", std::move(console_sink));

  quill::Logger* expected = nullptr;
  if (!g_current_logger.compare_exchange_strong(expected, logger)) {
    return expected;
  }
  return logger;
}

}  // namespace lattice::logging
