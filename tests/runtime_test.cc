#include "api/jshost.h"
#include "test_util.h"
#include <chrono>
#include <stdexcept>
#include <gtest/gtest.h>

namespace jsh {
namespace {

using namespace std::chrono_literals;

auto EndsWith(const std::string& value, const std::string& suffix) -> bool {
	return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TEST(RuntimeTest, EvalExpressions) {
	Runtime runtime;
	EXPECT_EQ(runtime.Eval<int32_t>("5 + 5"), 10);
	EXPECT_EQ(runtime.Eval<std::string>("'a' + 'b'"), "ab");
	EXPECT_EQ(runtime.Eval<std::vector<int32_t>>("[1, 2, 3]"), (std::vector<int32_t>{1, 2, 3}));
	EXPECT_EQ(runtime.Eval<int32_t>("Promise.resolve(7)"), 7);
}

TEST(RuntimeTest, EvalSharesGlobalScope) {
	Runtime runtime;
	runtime.Eval<Void>("globalThis.counter = 1");
	runtime.Eval<Void>("counter += 1");
	EXPECT_EQ(runtime.Eval<int32_t>("counter"), 2);
}

TEST(RuntimeTest, DecodeFailureIsSerializationError) {
	Runtime runtime;
	EXPECT_THROW(runtime.Eval<int32_t>("'not a number'"), SerializationError);
}

TEST(RuntimeTest, ExportsAndGlobals) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		globalThis.shadowed = "global";
		export const shadowed = "export";
		export const answer = 42;
		export const nothing = null;
		export let unset;
		export const notAFunction = 5;
	)"});
	EXPECT_EQ(runtime.GetValue<int32_t>(handle, "answer"), 42);
	EXPECT_EQ(runtime.GetValue<std::string>(handle, "shadowed"), "global");
	EXPECT_THROW(runtime.GetValue<Json>(handle, "nothing"), ValueNotFoundError);
	EXPECT_THROW(runtime.GetValue<Json>(handle, "unset"), ValueNotFoundError);
	EXPECT_THROW(runtime.GetValue<Json>(handle, "undeclared"), ValueNotFoundError);
	EXPECT_THROW(runtime.CallFunction<Json>(handle, "notAFunction"), ValueNotCallableError);
}

TEST(RuntimeTest, CallFunctionWithArguments) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export function greet(name, times) {
			return ("hello " + name + " ").repeat(times).trim();
		}
		export async function later(value) {
			await new Promise(resolve => setTimeout(resolve, 10));
			return { value };
		}
	)"});
	auto greeting = runtime.CallFunction<std::string>(handle, "greet", MakeArguments("world", 2));
	EXPECT_EQ(greeting, "hello world hello world");
	auto result = runtime.CallFunction<Json>(handle, "later", MakeArguments(Json::Parse("[1,2]")));
	EXPECT_EQ(result.Dump(), "{\"value\":[1,2]}");
}

TEST(RuntimeTest, RegisteredEntrypoint) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", "jshost.register_entrypoint(() => 2);"});
	ASSERT_TRUE(handle.GetEntrypoint());
	EXPECT_EQ(runtime.CallEntrypoint<int32_t>(handle), 2);
}

TEST(RuntimeTest, DefaultEntrypoint) {
	RuntimeOptions options;
	options.default_entrypoint = "start";
	Runtime runtime{options};
	auto handle = runtime.LoadModules(Module{"test.js", "export function start(value) { return value * 3; }"});
	EXPECT_EQ(runtime.CallEntrypoint<int32_t>(handle, MakeArguments(3)), 9);

	auto missing = runtime.LoadModules(Module{"other.js", "export const value = 1;"});
	EXPECT_FALSE(missing.GetEntrypoint());
}

TEST(RuntimeTest, RegisteredEntrypointWins) {
	RuntimeOptions options;
	options.default_entrypoint = "start";
	Runtime runtime{options};
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export function start() { return 0; }
		jshost.register_entrypoint(() => 1);
		jshost.register_entrypoint(() => 2);
	)"});
	EXPECT_EQ(runtime.CallEntrypoint<int32_t>(handle), 2);
}

TEST(RuntimeTest, MissingEntrypoint) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", "export const value = 1;"});
	EXPECT_THROW(runtime.CallEntrypoint<Json>(handle), MissingEntrypointError);
}

TEST(RuntimeTest, ExecuteModule) {
	auto value = Runtime::ExecuteModule<std::string>(
		Module{"test.js", "import { suffix } from './side.js'; jshost.register_entrypoint(v => v + suffix);"},
		{Module{"side.js", "export const suffix = '!';"}},
		{},
		MakeArguments("hi"));
	EXPECT_EQ(value, "hi!");
}

TEST(RuntimeTest, LoadingNothingIsAnError) {
	Runtime runtime;
	try {
		runtime.LoadModules(std::nullopt, {});
		FAIL() << "expected a RuntimeError";
	} catch (const RuntimeError& error) {
		EXPECT_STREQ(error.what(), "Internal error: attempt to load no modules");
	}
}

TEST(RuntimeTest, UncaughtErrorsCarryLocation) {
	Runtime runtime;
	try {
		runtime.LoadModules(Module{"test.js", "const a = 1;\nthrow new Error('msg');\n"});
		FAIL() << "expected a RuntimeError";
	} catch (const RuntimeError& error) {
		EXPECT_TRUE(EndsWith(error.what(), "test.js:2: Uncaught Error: msg")) << error.what();
	}
}

TEST(RuntimeTest, SyntaxErrorsAreRuntimeErrors) {
	Runtime runtime;
	EXPECT_THROW(runtime.LoadModules(Module{"test.js", "export const = ;"}), RuntimeError);
}

TEST(RuntimeTest, TimeoutOnPendingTimer) {
	RuntimeOptions options;
	options.timeout = 50ms;
	Runtime runtime{options};
	auto start = std::chrono::steady_clock::now();
	EXPECT_THROW(
		runtime.LoadModules(Module{"test.js", "await new Promise(resolve => setTimeout(resolve, 2000));"}),
		TimeoutError);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
}

TEST(RuntimeTest, TimeoutInterruptsBusyLoops) {
	RuntimeOptions options;
	options.timeout = 50ms;
	Runtime runtime{options};
	auto handle = runtime.LoadModules(Module{"test.js", "export function spin() { for (;;) {} }"});
	EXPECT_THROW(runtime.CallFunction<Void>(handle, "spin"), TimeoutError);
	// Still usable afterward
	EXPECT_EQ(runtime.Eval<int32_t>("1 + 1"), 2);
}

TEST(RuntimeTest, StoredFunctionsAreBoundToTheirRuntime) {
	Runtime first;
	Runtime second;
	auto first_handle = first.LoadModules(Module{"test.js", "export const twice = v => v * 2;"});
	auto second_handle = second.LoadModules(Module{"test.js", "export const twice = v => v * 2;"});
	Function twice = first.GetFunctionByName(first_handle, "twice");
	EXPECT_EQ(first.CallStoredFunction<int32_t>(first_handle, twice, MakeArguments(4)), 8);
	EXPECT_THROW(second.CallStoredFunction<int32_t>(second_handle, twice, MakeArguments(4)), InvalidHandleError);
	EXPECT_THROW(second.GetValue<Json>(first_handle, "twice"), InvalidHandleError);
}

TEST(RuntimeTest, ReleasedFunctions) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", "export const twice = v => v * 2;"});
	EXPECT_EQ(runtime.GetStoredFunctionCount(), 0u);
	Function twice = runtime.GetFunctionByName(handle, "twice");
	EXPECT_EQ(runtime.GetStoredFunctionCount(), 1u);
	runtime.ReleaseFunction(twice);
	EXPECT_EQ(runtime.GetStoredFunctionCount(), 0u);
	EXPECT_THROW(runtime.CallStoredFunction<int32_t>(handle, twice, MakeArguments(4)), InvalidHandleError);
	EXPECT_THROW(runtime.ReleaseFunction(twice), InvalidHandleError);
	EXPECT_TRUE(runtime.IsCallable(handle, "twice"));
	EXPECT_FALSE(runtime.IsCallable(handle, "missing"));
	EXPECT_EQ(runtime.GetStoredFunctionCount(), 0u);
}

TEST(RuntimeTest, FunctionsReturnedFromScript) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", "export function adder(base) { return v => base + v; }"});
	auto add_five = runtime.CallFunction<Function>(handle, "adder", MakeArguments(5));
	EXPECT_EQ(runtime.CallStoredFunction<int32_t>(handle, add_five, MakeArguments(1)), 6);
}

TEST(RuntimeTest, SideModulesShareTheRuntime) {
	Runtime runtime;
	auto handle = runtime.LoadModules(
		Module{"main.js", "import { base } from './base.js'; export const total = base + globalThis.extra;"},
		{Module{"base.js", "export const base = 40; globalThis.extra = 2;"}});
	EXPECT_EQ(handle.GetModule().GetFilename(), "main.js");
	EXPECT_EQ(runtime.GetValue<int32_t>(handle, "total"), 42);
}

TEST(RuntimeTest, ReloadingReusesTheModule) {
	Runtime runtime;
	auto first = runtime.LoadModule(Module{"test.js", "globalThis.loads = (globalThis.loads || 0) + 1; export const a = 1;"});
	auto second = runtime.LoadModule(Module{"test.js", "globalThis.loads = (globalThis.loads || 0) + 1; export const a = 1;"});
	EXPECT_EQ(first.GetId(), second.GetId());
	EXPECT_EQ(runtime.Eval<int32_t>("loads"), 1);
}

TEST(RuntimeTest, HostState) {
	Runtime runtime;
	runtime.Put<std::string>("state");
	runtime.Put<int>(5);
	EXPECT_EQ(runtime.Take<std::string>(), "state");
	EXPECT_FALSE(runtime.Take<std::string>());
	EXPECT_EQ(runtime.Take<int>(), 5);
}

TEST(RuntimeTest, TimerErrorsFailTheCall) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export async function run() {
			setTimeout(() => { throw new Error("from timer"); }, 0);
			await new Promise(resolve => setTimeout(resolve, 50));
		}
	)"});
	EXPECT_THROW(runtime.CallFunction<Void>(handle, "run"), RuntimeError);
}

TEST(RuntimeTest, HugeTimerDelays) {
	Runtime runtime;
	EXPECT_EQ(runtime.Eval<bool>(R"(
		const id = setTimeout(() => { throw new Error("fired"); }, 1e30);
		clearTimeout(id);
		typeof id === "number"
	)"), true);
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export async function run() {
			setInterval(() => {}, Number.MAX_VALUE);
			await new Promise(resolve => setTimeout(resolve, 10));
			return 1;
		}
	)"});
	EXPECT_EQ(runtime.CallFunction<int32_t>(handle, "run"), 1);
}

TEST(RuntimeTest, TimerErrorsDoNotLeakIntoLaterCalls) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", R"(
		export async function failing() {
			setInterval(() => { throw new Error("from interval"); }, 1);
			await new Promise(resolve => setTimeout(resolve, 20));
		}
		export async function healthy() {
			await new Promise(resolve => setTimeout(resolve, 20));
			return 1;
		}
	)"});
	EXPECT_THROW(runtime.CallFunction<Void>(handle, "failing"), RuntimeError);
	EXPECT_EQ(runtime.CallFunction<int32_t>(handle, "healthy"), 1);
	EXPECT_EQ(runtime.CallFunction<int32_t>(handle, "healthy"), 1);
}

class RuntimeFileTest : public test::TempDirTest {};

TEST_F(RuntimeFileTest, TranspilerExceptionsAreRuntimeErrors) {
	WriteFile("dep.js", "export const value = 1;");
	RuntimeOptions options;
	options.allow_fs_import = true;
	options.transpiler = [](const ModuleSpecifier& specifier, const std::string& code) -> std::string {
		if (specifier.ToString().find("dep.js") != std::string::npos) {
			throw std::runtime_error("unexpected token");
		}
		return code;
	};
	Runtime runtime{options};
	Module main{(dir / "main.js").string(), "import { value } from './dep.js'; export const total = value;"};
	EXPECT_THROW(runtime.LoadModules(main), RuntimeError);
	EXPECT_EQ(runtime.Eval<int32_t>("1 + 1"), 2);
}

} // anonymous namespace
} // namespace jsh
