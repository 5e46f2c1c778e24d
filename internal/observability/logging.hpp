#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/chain/address.hpp"

namespace rvault::runtime::config {
class RuntimeConfig;
}

namespace rvault::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Addresses are logged in their short form to keep lines readable.
LogField AddressField(std::string_view key, const chain::Address& address);

void InitializeLogging(const rvault::runtime::config::RuntimeConfig& config);
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

} // namespace rvault::observability

#define RVAULT_LOG_DEBUG(message, ...) ::rvault::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define RVAULT_LOG_INFO(message, ...) ::rvault::observability::LogInfo((message), ##__VA_ARGS__)
#define RVAULT_LOG_WARN(message, ...) ::rvault::observability::LogWarn((message), ##__VA_ARGS__)
#define RVAULT_LOG_ERROR(message, ...) ::rvault::observability::LogError((message), ##__VA_ARGS__)
