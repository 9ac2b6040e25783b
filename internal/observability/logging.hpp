#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cashgraph::runtime::config {
class RuntimeConfig;
}

namespace cashgraph::observability {

// Rendered as key=value after the message; values holding whitespace are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Ledger-shaped fields: "tenant=<id>", "as_of=2024-03-05T09:00:00.000Z",
// "amount=950.00" (minor units rendered with two decimals).
LogField TenantField(std::string_view tenant_id);
LogField TimestampField(std::string_view key, std::int64_t epoch_ms);
LogField MoneyField(std::string_view key, std::int64_t amount_minor);

// Installs the "cashgraph" logger as the spdlog default. Safe to call more than once.
void InitializeLogging(const cashgraph::runtime::config::RuntimeConfig& config);
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

} // namespace cashgraph::observability

#define CASHGRAPH_LOG_DEBUG(message, ...) ::cashgraph::observability::LogDebug((message), ##__VA_ARGS__)
#define CASHGRAPH_LOG_INFO(message, ...) ::cashgraph::observability::LogInfo((message), ##__VA_ARGS__)
#define CASHGRAPH_LOG_WARN(message, ...) ::cashgraph::observability::LogWarn((message), ##__VA_ARGS__)
#define CASHGRAPH_LOG_ERROR(message, ...) ::cashgraph::observability::LogError((message), ##__VA_ARGS__)
