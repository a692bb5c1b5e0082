#include "api/jshost.h"
#include "isolate/util.h"
#include <gtest/gtest.h>

namespace jsh {
namespace {

class GreeterExtension final : public Extension {
	public:
		auto GetName() const -> std::string final { return "greeter"; }

		void Install(v8::Local<v8::Context> context, v8::Local<v8::Object> global) final {
			SetMethod(context, global, "nativeGreeting", [](const v8::FunctionCallbackInfo<v8::Value>& info) {
				info.GetReturnValue().Set(v8_string("hello from native"));
			});
		}

		auto GetModules() const -> std::vector<Module> final {
			return {
				Module{"strings.js", "export const suffix = '!';"},
				Module{"index.js", R"(
					import { suffix } from "ext:greeter/strings.js";
					globalThis.greet = name => nativeGreeting() + ", " + name + suffix;
				)"},
			};
		}
};

auto WithGreeter() -> RuntimeOptions {
	RuntimeOptions options;
	options.extensions.emplace_back(std::make_shared<GreeterExtension>());
	return options;
}

TEST(ExtensionTest, BindingsAndModules) {
	Runtime runtime{WithGreeter()};
	EXPECT_EQ(runtime.Eval<std::string>("greet('jshost')"), "hello from native, jshost!");
}

TEST(ExtensionTest, ModulesCanBeImported) {
	Runtime runtime{WithGreeter()};
	auto handle = runtime.LoadModules(Module{"test.js", "export { suffix } from 'ext:greeter/strings.js';"});
	EXPECT_EQ(runtime.GetValue<std::string>(handle, "suffix"), "!");
}

TEST(ExtensionTest, ExtensionSpecifier) {
	GreeterExtension extension;
	EXPECT_EQ(ExtensionModuleSpecifier(extension, Module{"index.js", ""}), "ext:greeter/index.js");
}

TEST(ExtensionTest, CoreObjectIsFrozen) {
	Runtime runtime;
	EXPECT_EQ(runtime.Eval<bool>("Object.isFrozen(jshost)"), true);
	EXPECT_EQ(runtime.Eval<bool>("Object.keys(globalThis).includes('jshost')"), false);
	EXPECT_THROW(runtime.Eval<Void>("jshost.register_entrypoint(5)"), RuntimeError);
}

TEST(ExtensionTest, ConsoleWritesToLog) {
	auto level = GetLogLevel();
	SetLogLevel(LogLevel::Info);
	Runtime runtime;
	testing::internal::CaptureStderr();
	runtime.Eval<Void>("console.log('value', 1, { a: true })");
	runtime.Eval<Void>("console.debug('hidden')");
	std::string output = testing::internal::GetCapturedStderr();
	SetLogLevel(level);
	EXPECT_NE(output.find("[jshost:info] value 1 {\"a\":true}"), std::string::npos) << output;
	EXPECT_EQ(output.find("hidden"), std::string::npos) << output;
}

TEST(ExtensionTest, Timers) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export function run() {
			return new Promise(resolve => {
				const order = [];
				const cancelled = setTimeout(() => order.push("cancelled"), 0);
				clearTimeout(cancelled);
				let ticks = 0;
				const interval = setInterval(() => {
					order.push("tick");
					if (++ticks === 3) {
						clearInterval(interval);
						setTimeout(() => resolve(order), 5);
					}
				}, 1);
				queueMicrotask(() => order.push("microtask"));
			});
		}
	)"});
	EXPECT_EQ(
		runtime.CallFunction<std::vector<std::string>>(handle, "run"),
		(std::vector<std::string>{"microtask", "tick", "tick", "tick"}));
}

} // anonymous namespace
} // namespace jsh
