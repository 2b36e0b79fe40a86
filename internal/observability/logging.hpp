#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace strands::runtime::config {
class RuntimeConfig;
}

namespace strands::observability {

/*
  Structured key=value logging over the process-wide spdlog logger.

  Messages are short lowercase phrases; identifiers travel as fields so
  log lines stay greppable ("settlement rejected reason=PROMO_EXPIRED").
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const strands::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace strands::observability

#define STRANDS_LOG_DEBUG(message, ...) ::strands::observability::LogDebug((message), ##__VA_ARGS__)
#define STRANDS_LOG_INFO(message, ...) ::strands::observability::LogInfo((message), ##__VA_ARGS__)
#define STRANDS_LOG_WARN(message, ...) ::strands::observability::LogWarn((message), ##__VA_ARGS__)
#define STRANDS_LOG_ERROR(message, ...) ::strands::observability::LogError((message), ##__VA_ARGS__)
