#pragma once
#include <v8.h>
#include <v8-platform.h>

namespace jsh {

/**
 * Owns the process-wide v8 platform. v8 may only be initialized once per process so this is
 * created lazily by the first runtime and is never torn down.
 */
class Platform {
	public:
		Platform(const Platform&) = delete;
		auto operator=(const Platform&) = delete;

		static auto Get() -> v8::Platform*;

		// Run foreground tasks which v8 posted for `isolate`. Does not block.
		static auto PumpMessageLoop(v8::Isolate* isolate) -> bool;
		static void NotifyIsolateShutdown(v8::Isolate* isolate);

	private:
		Platform() = default;
};

} // namespace jsh
