#pragma once
#include "module_handle.h"
#include "module_source.h"
#include "specifier.h"
#include <v8.h>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace jsh {
class IsolateEnvironment;

/**
 * Loads a module along with everything it imports. Dependencies are resolved when a module is
 * compiled, fetched on the runtime's loop, and once nothing is outstanding the root is
 * instantiated and evaluated. Modules which are already in the environment's module map are
 * linked as they are.
 *
 * The graph keeps itself alive while fetches are in flight. The promise it hands out settles with
 * the result of the root's evaluation, or with its namespace for dynamic imports.
 */
class ModuleGraph : public std::enable_shared_from_this<ModuleGraph> {
	public:
		ModuleGraph(const ModuleGraph&) = delete;
		auto operator=(const ModuleGraph&) = delete;
		~ModuleGraph() = default;

		// Root whose source the host supplied. Throws on a compile or resolution error in the root.
		static auto LoadRoot(
			IsolateEnvironment& env, const ModuleSpecifier& specifier, const std::string& code, bool is_main
		) -> std::shared_ptr<ModuleGraph>;

		// Root which has to be fetched, from `import()`
		static auto Import(IsolateEnvironment& env, const ModuleSpecifier& specifier) -> std::shared_ptr<ModuleGraph>;

		auto GetPromise() const -> v8::Local<v8::Promise>;
		auto GetRoot() const -> const std::shared_ptr<ModuleInfo>& { return root; }

		// Host error which rejected the promise, if it wasn't a script exception
		auto GetError() const -> std::exception_ptr { return error; }

		// Installs the import callbacks on a new isolate
		static void InstallCallbacks(v8::Isolate* isolate);

	private:
		ModuleGraph(IsolateEnvironment& env, std::string root_specifier, bool resolve_namespace);

		auto Compile(const ModuleSpecifier& specifier, const ModuleSource& source, bool is_main, bool produce_cache)
			-> std::shared_ptr<ModuleInfo>;
		void Start();
		void Visit(const ModuleInfo& info);
		void Enqueue(const std::string& specifier);
		void OnLoaded(const ModuleSpecifier& specifier, std::exception_ptr load_error, std::optional<ModuleSource> source);
		void Fail(std::exception_ptr host_error, v8::Local<v8::Value> reason = {});
		void Finish();

		static auto ResolveCallback(
			v8::Local<v8::Context> context,
			v8::Local<v8::String> specifier,
			v8::Local<v8::FixedArray> import_assertions,
			v8::Local<v8::Module> referrer
		) -> v8::MaybeLocal<v8::Module>;
		static auto ImportDynamically(
			v8::Local<v8::Context> context,
			v8::Local<v8::Data> host_defined_options,
			v8::Local<v8::Value> resource_name,
			v8::Local<v8::String> specifier,
			v8::Local<v8::FixedArray> import_assertions
		) -> v8::MaybeLocal<v8::Promise>;
		static void InitializeImportMeta(v8::Local<v8::Context> context, v8::Local<v8::Module> module, v8::Local<v8::Object> meta);
		static auto EvaluateJson(v8::Local<v8::Context> context, v8::Local<v8::Module> module) -> v8::MaybeLocal<v8::Value>;

		IsolateEnvironment& env;
		std::string root_specifier;
		std::shared_ptr<ModuleInfo> root;
		v8::Global<v8::Promise::Resolver> resolver;
		std::unordered_set<std::string> visited;
		std::exception_ptr error;
		size_t pending = 0;
		bool resolve_namespace;
		bool settled = false;
};

} // namespace jsh
