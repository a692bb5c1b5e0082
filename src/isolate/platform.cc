#include "platform.h"
#include <libplatform/libplatform.h>
#include <memory>
#include <mutex>

namespace jsh {
namespace {

std::once_flag platform_once;
std::unique_ptr<v8::Platform> platform;

} // anonymous namespace

auto Platform::Get() -> v8::Platform* {
	std::call_once(platform_once, []() {
		platform = v8::platform::NewDefaultPlatform();
		v8::V8::InitializePlatform(platform.get());
		v8::V8::Initialize();
	});
	return platform.get();
}

auto Platform::PumpMessageLoop(v8::Isolate* isolate) -> bool {
	bool did_work = false;
	while (v8::platform::PumpMessageLoop(Get(), isolate, v8::platform::MessageLoopBehavior::kDoNotWait)) {
		did_work = true;
	}
	return did_work;
}

void Platform::NotifyIsolateShutdown(v8::Isolate* isolate) {
	v8::platform::NotifyIsolateShutdown(Get(), isolate);
}

} // namespace jsh
