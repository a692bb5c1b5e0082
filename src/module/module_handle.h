#pragma once
#include "function.h"
#include "module.h"
#include "module_source.h"
#include <v8.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jsh {
class IsolateEnvironment;

/**
 * Underlying data on a module compiled into a runtime. Some information is stored outside of v8
 * so there is a separate struct to hold it, owned by the environment's module map.
 */
struct ModuleInfo {
	IsolateEnvironment& env;
	std::string specifier;
	ModuleType type;
	int identity_hash;
	// `ScriptId()` of source text modules, 0 for synthetic ones
	int script_id = 0;
	bool is_main = false;
	// Import requests in source order, raw specifier -> canonical specifier
	std::vector<std::pair<std::string, std::string>> requests;
	// Text of JSON modules, parsed when the module is evaluated
	std::string json_source;
	v8::Global<v8::Module> handle;

	ModuleInfo(IsolateEnvironment& env, std::string specifier, ModuleType type, v8::Local<v8::Module> handle);
	ModuleInfo(const ModuleInfo&) = delete;
	auto operator=(const ModuleInfo&) = delete;
	~ModuleInfo();

	// Canonical specifier of one of this module's import requests
	auto FindRequest(const std::string& raw_specifier) const -> const std::string*;
};

auto LookupModuleInfo(v8::Local<v8::Module> module) -> ModuleInfo*;

// Finds a module in the environment's module map by its v8 script id
auto FindModuleById(IsolateEnvironment& env, int script_id) -> std::shared_ptr<ModuleInfo>;

/**
 * Returned to the host after a module loads, and passed back into every call which needs the
 * module's export namespace. Immutable.
 */
class ModuleHandle {
	public:
		ModuleHandle(Module module, int module_id, uint64_t runtime_id, std::optional<Function> entrypoint = std::nullopt) :
			module{std::move(module)}, module_id{module_id}, runtime_id{runtime_id}, entrypoint{std::move(entrypoint)} {}

		auto GetModule() const -> const Module& { return module; }
		// v8's script id for the module, never 0
		auto GetId() const -> int { return module_id; }
		auto GetRuntimeId() const -> uint64_t { return runtime_id; }
		auto GetEntrypoint() const -> const std::optional<Function>& { return entrypoint; }

	private:
		Module module;
		int module_id;
		uint64_t runtime_id;
		std::optional<Function> entrypoint;
};

} // namespace jsh
