#include "logging.hpp"

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace bastion::logging {

// Shared by every server thread and by detached JWKS fetch threads
static std::atomic<quill::Logger*> g_current_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

static quill::LogLevel parse_log_level(std::string_view level) {
  std::string level_lower = core::to_lower(level);

  if (level_lower == "trace") {
    return quill::LogLevel::TraceL1;
  } else if (level_lower == "debug") {
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

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty() || log_config.output == "-") {
    if (log_config.format == "json") {
      auto json_sink =
          quill::Frontend::create_or_get_sink<quill::JsonConsoleSink>("bastion_json_console");
      logger = quill::Frontend::create_or_get_logger("bastion", std::move(json_sink));
    } else {
      auto console_sink =
          quill::Frontend::create_or_get_sink<quill::ConsoleSink>("bastion_console");
      logger = quill::Frontend::create_or_get_logger("bastion", std::move(console_sink));
    }
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/bastion.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("bastion", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("bastion", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_current_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_current_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger.load(std::memory_order_acquire);
}

// Generate base UUID v4 (called once per thread)
static std::string generate_base_uuid() {
  // XOR combines hardware randomness with timestamp for thread-unique seed
  std::mt19937 rng(std::random_device{}() ^
                   static_cast<uint32_t>(
                       std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 4) {
    uint32_t random_val = dist(rng);
    uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
    uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
    uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
    uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
  }

  // Set version to 4 (random UUID)
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  // Set variant to RFC4122
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');

  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
  }

  return oss.str();
}

std::string generate_correlation_id() {
  // Format: {base_uuid}#{counter}
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

}  // namespace bastion::logging
