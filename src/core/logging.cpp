#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <string>

#include "../control/config.hpp"

namespace sluice::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::LogLevel parse_log_level(std::string_view level) {
  std::string level_lower{level};
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  }
  if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  }
  if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty()) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("sluice_console");
    logger = quill::Frontend::create_or_get_logger("sluice", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/sluice.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink =
          quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger("sluice", std::move(json_sink));
    } else {
      auto file_sink =
          quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger("sluice", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  quill::Logger* logger = g_logger.load(std::memory_order_acquire);
  if (logger != nullptr) {
    return logger;
  }

  // create_or_get_* is thread-safe; racing callers end up with the same logger
  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("sluice_console");
  logger = quill::Frontend::create_or_get_logger("sluice_default", std::move(console_sink));

  quill::Logger* expected = nullptr;
  g_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel);
  return g_logger.load(std::memory_order_acquire);
}

}  // namespace sluice::logging
