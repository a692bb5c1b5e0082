#pragma once
#include "module.h"
#include <v8.h>
#include <memory>
#include <string>
#include <vector>

namespace jsh {

/**
 * Native capability injected into a runtime when it starts. `Install` runs first, for every
 * extension in order, then the modules of every extension are evaluated in order. Modules are
 * served under `ext:<name>/<filename>` and may import each other by that specifier.
 */
class Extension {
	public:
		Extension() = default;
		Extension(const Extension&) = delete;
		auto operator=(const Extension&) = delete;
		virtual ~Extension() = default;

		virtual auto GetName() const -> std::string = 0;

		// Native bindings. Called inside the runtime's context, with the global object.
		virtual void Install(v8::Local<v8::Context> /*context*/, v8::Local<v8::Object> /*global*/) {}

		virtual auto GetModules() const -> std::vector<Module> { return {}; }
};

// Installed ahead of the extensions in `RuntimeOptions`: `jshost`, `console` and timers
auto BuiltinExtensions() -> std::vector<std::shared_ptr<Extension>>;

// Specifier an extension module is served under
auto ExtensionModuleSpecifier(const Extension& extension, const Module& module) -> std::string;

// Helper for native bindings: `object[name] = function`
void SetMethod(v8::Local<v8::Context> context, v8::Local<v8::Object> object, const char* name, v8::FunctionCallback callback);

} // namespace jsh
