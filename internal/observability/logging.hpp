#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace credit::runtime::config {
class RuntimeConfig;
}

namespace credit::observability {

/*
  One key=value pair appended to a log line. Values holding spaces, quotes
  or '=' are written quoted, so loan purposes and error messages stay a
  single field.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern: CREDIT_LOG_LEVEL / CREDIT_LOG_PATTERN, then the config
// file, then info and an ISO-8601 pattern.
void InitializeLogging(const credit::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace credit::observability

#define CREDIT_LOG_INFO(message, ...) ::credit::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define CREDIT_LOG_WARN(message, ...) ::credit::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define CREDIT_LOG_ERROR(message, ...) ::credit::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
