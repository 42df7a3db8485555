#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace msgstore::runtime::config {
class LoggingConfig;
}

namespace msgstore::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const msgstore::runtime::config::LoggingConfig& config);
void ShutdownLogging();

/*
  Stores are handed their logger at construction. A null logger means the
  process default one.
*/
std::shared_ptr<spdlog::logger> ResolveLogger(std::shared_ptr<spdlog::logger> logger);

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace msgstore::observability

#define MSGSTORE_LOG_INFO(message, ...) ::msgstore::observability::LogInfo((message), ##__VA_ARGS__)
#define MSGSTORE_LOG_WARN(message, ...) ::msgstore::observability::LogWarn((message), ##__VA_ARGS__)
#define MSGSTORE_LOG_ERROR(message, ...) ::msgstore::observability::LogError((message), ##__VA_ARGS__)
