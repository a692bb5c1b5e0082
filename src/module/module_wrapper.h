#pragma once
#include "runtime.h"
#include <memory>
#include <string>
#include <vector>

namespace jsh {

/**
 * A runtime with a single module loaded into it
 */
class ModuleWrapper {
	public:
		static auto NewFromModule(const Module& module, RuntimeOptions options = {}) -> ModuleWrapper;
		static auto NewFromFile(const std::string& path, RuntimeOptions options = {}) -> ModuleWrapper;

		auto GetModuleContext() const -> const ModuleHandle& { return handle; }
		auto GetRuntime() -> Runtime& { return *runtime; }

		template <class Type>
		auto Get(const std::string& name) -> Type {
			return runtime->GetValue<Type>(handle, name);
		}

		// True if `name` resolves to a function
		auto IsCallable(const std::string& name) -> bool;

		template <class Type>
		auto Call(const std::string& name, const Arguments& arguments = {}) -> Type {
			return runtime->CallFunction<Type>(handle, name, arguments);
		}

		template <class Type>
		auto CallStored(const Function& function, const Arguments& arguments = {}) -> Type {
			return runtime->CallStoredFunction<Type>(handle, function, arguments);
		}

		auto Keys() -> std::vector<std::string>;

	private:
		ModuleWrapper(std::unique_ptr<Runtime> runtime, ModuleHandle handle) :
			runtime{std::move(runtime)}, handle{std::move(handle)} {}

		std::unique_ptr<Runtime> runtime;
		ModuleHandle handle;
};

} // namespace jsh
