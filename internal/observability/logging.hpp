#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace famgraph::config {
class RuntimeConfig;
}

namespace famgraph::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const famgraph::config::RuntimeConfig& config);
void ShutdownLogging();

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

// Formats fields the same way Log does: "k1=v1 k2=v2".
std::string SerializeFields(std::initializer_list<LogField> fields);

} // namespace famgraph::observability

#define FAMGRAPH_LOG_INFO(message, ...) ::famgraph::observability::LogInfo((message), ##__VA_ARGS__)
#define FAMGRAPH_LOG_WARN(message, ...) ::famgraph::observability::LogWarn((message), ##__VA_ARGS__)
#define FAMGRAPH_LOG_ERROR(message, ...) ::famgraph::observability::LogError((message), ##__VA_ARGS__)
