#include "log.h"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace jsh {
namespace {

auto ReadLogLevel() -> LogLevel {
	const char* value = std::getenv("JSH_LOG");
	if (value == nullptr) {
		return LogLevel::Warning;
	} else if (std::strcmp(value, "error") == 0) {
		return LogLevel::Error;
	} else if (std::strcmp(value, "info") == 0) {
		return LogLevel::Info;
	} else if (std::strcmp(value, "debug") == 0) {
		return LogLevel::Debug;
	}
	return LogLevel::Warning;
}

auto LevelRef() -> std::atomic<LogLevel>& {
	static std::atomic<LogLevel> level{ReadLogLevel()};
	return level;
}

auto LevelPrefix(LogLevel level) -> const char* {
	switch (level) {
		case LogLevel::Error: return "error";
		case LogLevel::Warning: return "warn";
		case LogLevel::Info: return "info";
		case LogLevel::Debug: return "debug";
	}
	return "";
}

std::mutex output_mutex;

} // anonymous namespace

auto GetLogLevel() -> LogLevel {
	return LevelRef().load();
}

void SetLogLevel(LogLevel level) {
	LevelRef().store(level);
}

void Log(LogLevel level, const char* format, ...) {
	if (static_cast<int>(level) > static_cast<int>(GetLogLevel())) {
		return;
	}
	std::lock_guard<std::mutex> lock{output_mutex};
	fprintf(stderr, "[jshost:%s] ", LevelPrefix(level));
	va_list args;
	va_start(args, format);
	vfprintf(stderr, format, args);
	va_end(args);
	fputc('\n', stderr);
}

} // namespace jsh
