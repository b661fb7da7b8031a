#pragma once
#include <functional>
#include <optional>
#include <string_view>

namespace stratus {

#ifndef STRATUS_LOG_MAX_MESSAGE_LEN
#define STRATUS_LOG_MAX_MESSAGE_LEN 512
#endif

enum class LogLevel : int {
  Error = 0,
  Warn  = 1,
  Info  = 2,
  Debug = 3
};

// Receives every record that passes the level gate. Default writes to stderr.
// Called without any logger lock held, possibly from several threads at once;
// a sink may log itself. Messages longer than STRATUS_LOG_MAX_MESSAGE_LEN - 1
// are cut and end in "...".
using LogSink = std::function<void(LogLevel level, const char* tag, const char* message)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Empty sink restores the stderr writer. A record already being delivered may
// still reach the previous sink.
void set_log_sink(LogSink sink);

const char* log_level_name(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

void log_message(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 3, 4)))
#endif
  ;

} // namespace stratus

#define STRATUS_LOG_ERROR(TAG, ...) ::stratus::log_message(::stratus::LogLevel::Error, (TAG), __VA_ARGS__)
#define STRATUS_LOG_WARN(TAG, ...)  ::stratus::log_message(::stratus::LogLevel::Warn,  (TAG), __VA_ARGS__)
#define STRATUS_LOG_INFO(TAG, ...)  ::stratus::log_message(::stratus::LogLevel::Info,  (TAG), __VA_ARGS__)
#define STRATUS_LOG_DEBUG(TAG, ...) ::stratus::log_message(::stratus::LogLevel::Debug, (TAG), __VA_ARGS__)
