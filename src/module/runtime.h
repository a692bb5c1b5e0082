#pragma once
#include "extension.h"
#include "function.h"
#include "module.h"
#include "module_cache.h"
#include "module_handle.h"
#include "transferable.h"
#include "transpiler.h"
#include "value.h"
#include "value_bridge.h"
#include <any>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace jsh {
class ExecutionCoordinator;
class IsolateEnvironment;

struct RuntimeOptions {
	// Installed after the built-in extensions, in order
	std::vector<std::shared_ptr<Extension>> extensions;
	// Export used as the entrypoint when a module doesn't register one
	std::optional<std::string> default_entrypoint;
	std::chrono::milliseconds timeout = std::chrono::milliseconds::max();
	// Defaults to no caching
	std::shared_ptr<ModuleCacheProvider> module_cache;
	bool allow_fs_import = false;
	bool allow_url_import = false;
	Transpiler transpiler;
	// 0 leaves v8's default heap limits
	size_t memory_limit_mb = 0;
};

/**
 * One script engine instance and everything loaded into it. A runtime must only be used from one
 * thread at a time, separate runtimes are independent.
 *
 * Every call which runs script is bounded by `RuntimeOptions::timeout` and throws a `jsh::Error`
 * on failure.
 */
class Runtime {
	public:
		explicit Runtime(RuntimeOptions options = {});
		Runtime(const Runtime&) = delete;
		auto operator=(const Runtime&) = delete;
		~Runtime();

		/**
		 * Loads `side` in order and then `main`, see `ExecutionCoordinator::LoadModules`. The
		 * handle is the one of `main` if there is one.
		 */
		auto LoadModules(const std::optional<Module>& main, const std::vector<Module>& side = {}) -> ModuleHandle;
		auto LoadModule(const Module& module) -> ModuleHandle;

		// Runs a classic script in the global scope and decodes its completion value
		template <class Type>
		auto Eval(const std::string& expression) -> Type;

		// Global first, then the module's exports
		template <class Type>
		auto GetValue(const ModuleHandle& handle, const std::string& name) -> Type;

		template <class Type>
		auto CallFunction(const ModuleHandle& handle, const std::string& name, const Arguments& arguments = {}) -> Type;

		template <class Type>
		auto CallStoredFunction(const ModuleHandle& handle, const Function& function, const Arguments& arguments = {}) -> Type;

		template <class Type>
		auto CallEntrypoint(const ModuleHandle& handle, const Arguments& arguments = {}) -> Type;

		// Captures a function by name so it can be called later with `CallStoredFunction`
		auto GetFunctionByName(const ModuleHandle& handle, const std::string& name) -> Function;

		// Drops a function captured by `GetFunctionByName`. Later calls through it throw `InvalidHandle`.
		void ReleaseFunction(const Function& function);

		// True if `name` resolves to something callable. Nothing is captured.
		auto IsCallable(const ModuleHandle& handle, const std::string& name) -> bool;

		auto GetStoredFunctionCount() const -> size_t;

		// Names exported by the module, in namespace order
		auto GetExportNames(const ModuleHandle& handle) -> std::vector<std::string>;

		/**
		 * Creates a runtime, loads `module` after `side`, and calls its entrypoint.
		 */
		template <class Type>
		static auto ExecuteModule(
			const Module& module,
			const std::vector<Module>& side = {},
			RuntimeOptions options = {},
			const Arguments& arguments = {}
		) -> Type;

		// Host state, one value per type
		template <class Type>
		void Put(Type value);
		template <class Type>
		auto Take() -> std::optional<Type>;

		auto GetId() const -> uint64_t;
		auto GetTimeout() const -> std::chrono::milliseconds { return options.timeout; }

		template <class Type>
		static auto Arg(Type&& value) -> std::shared_ptr<Transferable> {
			return jsh::Arg(std::forward<Type>(value));
		}

	private:
		using Sink = std::function<void(v8::Local<v8::Value>)>;

		void EvalImpl(const std::string& expression, const Sink& sink);
		void GetValueImpl(const ModuleHandle& handle, const std::string& name, const Sink& sink);
		void CallFunctionImpl(const ModuleHandle& handle, const std::string& name, const Arguments& arguments, const Sink& sink);
		void CallStoredFunctionImpl(const ModuleHandle& handle, const Function& function, const Arguments& arguments, const Sink& sink);
		auto GetNamespace(const ModuleHandle& handle) -> v8::Local<v8::Object>;
		void StartExtensions();

		RuntimeOptions options;
		std::unique_ptr<IsolateEnvironment> env;
		std::unique_ptr<ExecutionCoordinator> coordinator;
		std::unordered_map<std::type_index, std::any> state;
};

template <class Type>
auto Runtime::Eval(const std::string& expression) -> Type {
	std::optional<Type> result;
	EvalImpl(expression, [&](v8::Local<v8::Value> value) { result.emplace(Decode<Type>(value)); });
	return std::move(*result);
}

template <class Type>
auto Runtime::GetValue(const ModuleHandle& handle, const std::string& name) -> Type {
	std::optional<Type> result;
	GetValueImpl(handle, name, [&](v8::Local<v8::Value> value) { result.emplace(Decode<Type>(value)); });
	return std::move(*result);
}

template <class Type>
auto Runtime::CallFunction(const ModuleHandle& handle, const std::string& name, const Arguments& arguments) -> Type {
	std::optional<Type> result;
	CallFunctionImpl(handle, name, arguments, [&](v8::Local<v8::Value> value) { result.emplace(Decode<Type>(value)); });
	return std::move(*result);
}

template <class Type>
auto Runtime::CallStoredFunction(const ModuleHandle& handle, const Function& function, const Arguments& arguments) -> Type {
	std::optional<Type> result;
	CallStoredFunctionImpl(handle, function, arguments, [&](v8::Local<v8::Value> value) { result.emplace(Decode<Type>(value)); });
	return std::move(*result);
}

template <class Type>
auto Runtime::CallEntrypoint(const ModuleHandle& handle, const Arguments& arguments) -> Type {
	if (!handle.GetEntrypoint()) {
		throw MissingEntrypointError(handle.GetModule().GetFilename());
	}
	return CallStoredFunction<Type>(handle, *handle.GetEntrypoint(), arguments);
}

template <class Type>
auto Runtime::ExecuteModule(
	const Module& module,
	const std::vector<Module>& side,
	RuntimeOptions options,
	const Arguments& arguments
) -> Type {
	Runtime runtime{std::move(options)};
	ModuleHandle handle = runtime.LoadModules(module, side);
	return runtime.CallEntrypoint<Type>(handle, arguments);
}

template <class Type>
void Runtime::Put(Type value) {
	state.insert_or_assign(std::type_index{typeid(Type)}, std::any{std::move(value)});
}

template <class Type>
auto Runtime::Take() -> std::optional<Type> {
	auto it = state.find(std::type_index{typeid(Type)});
	if (it == state.end()) {
		return std::nullopt;
	}
	std::optional<Type> value{std::any_cast<Type>(std::move(it->second))};
	state.erase(it);
	return value;
}

} // namespace jsh
