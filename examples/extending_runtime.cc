// Example extension w/ native bindings and a module of its own

#include <api/jshost.h>
#include <isolate/util.h>

#include <cstdio>

// `using namespace` is omitted to better show which interfaces exist where.

// Extensions are installed into every runtime which lists them in `RuntimeOptions::extensions`.
// `Install` runs inside the runtime's context before any module is evaluated.
class HostExtension final : public jsh::Extension {
	public:
		auto GetName() const -> std::string final { return "host"; }

		void Install(v8::Local<v8::Context> context, v8::Local<v8::Object> global) final {
			jsh::SetMethod(context, global, "hostVersion", [](const v8::FunctionCallbackInfo<v8::Value>& info) {
				info.GetReturnValue().Set(jsh::v8_string("jshost example 1.0"));
			});
		}

		// Served as `ext:host/greeting.js`. Modules run after every extension has been installed.
		auto GetModules() const -> std::vector<jsh::Module> final {
			return {
				jsh::Module{"greeting.js", R"(
					export function greeting(name) {
						return `hello ${name}, this is ${hostVersion()}`;
					}
					globalThis.greeting = greeting;
				)"},
			};
		}
};

int main() {
	jsh::RuntimeOptions options;
	options.extensions.emplace_back(std::make_shared<HostExtension>());

	try {
		jsh::Runtime runtime{options};

		// Globals set by extension modules are visible to everything
		std::printf("%s\n", runtime.Eval<std::string>("greeting('eval')").c_str());

		// The extension's module can also be imported directly
		jsh::ModuleHandle handle = runtime.LoadModules(jsh::Module{"main.js", R"(
			import { greeting } from "ext:host/greeting.js";
			jshost.register_entrypoint(name => greeting(name).toUpperCase());
		)"});
		std::printf("%s\n", runtime.CallEntrypoint<std::string>(handle, jsh::MakeArguments("module")).c_str());
	} catch (const jsh::Error& error) {
		std::fprintf(stderr, "%s\n", error.what());
		return 1;
	}
	return 0;
}
