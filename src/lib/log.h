#pragma once
#include <cstdarg>

namespace jsh {

enum class LogLevel { Error = 0, Warning = 1, Info = 2, Debug = 3 };

// Threshold is read once from `JSH_LOG` (error, warn, info, debug). Defaults to warn.
auto GetLogLevel() -> LogLevel;
void SetLogLevel(LogLevel level);

void Log(LogLevel level, const char* format, ...)
#if defined(__GNUC__)
	__attribute__((format(printf, 2, 3)))
#endif
	;

#define JSH_LOG_ERROR(...) ::jsh::Log(::jsh::LogLevel::Error, __VA_ARGS__)
#define JSH_LOG_WARNING(...) ::jsh::Log(::jsh::LogLevel::Warning, __VA_ARGS__)
#define JSH_LOG_INFO(...) ::jsh::Log(::jsh::LogLevel::Info, __VA_ARGS__)
#define JSH_LOG_DEBUG(...) ::jsh::Log(::jsh::LogLevel::Debug, __VA_ARGS__)

} // namespace jsh
