#pragma once
#include "module_source.h"
#include <v8.h>
#include <memory>
#include <optional>
#include <string>

namespace jsh {

/**
 * Holder for all common v8 compilation information: code string, cached data and script origin.
 * The holder must outlive the `ScriptCompiler::Source` it hands out since v8 reads the cached data
 * straight out of it.
 */
class CodeCompilerHolder {
	public:
		CodeCompilerHolder(std::string resource_name, const ModuleSource& source, bool is_module);
		CodeCompilerHolder(std::string resource_name, std::string code, bool is_module);

		auto DidSupplyCachedData() const { return cached_data_in.has_value(); }
		auto GetCompileOptions() const -> v8::ScriptCompiler::CompileOptions;
		auto GetSource() -> std::unique_ptr<v8::ScriptCompiler::Source>;
		auto GetResourceName() const -> const std::string& { return resource_name; }
		void SetCachedDataRejected(bool rejected) { cached_data_rejected = rejected; }
		void SetProduceCachedData(bool produce) { produce_cached_data = produce; }
		auto ShouldProduceCachedData() const { return produce_cached_data && (!cached_data_in || cached_data_rejected); }

	private:
		auto GetOrigin() const -> v8::ScriptOrigin;

		std::string resource_name;
		std::string code;
		std::optional<ModuleSource::CodeCache> cached_data_in;
		bool cached_data_rejected = false;
		bool produce_cached_data = false;
		bool is_module;
};

// Compiles ESM source text. Throws `ScriptException` on a syntax error.
auto CompileModule(CodeCompilerHolder& holder) -> v8::Local<v8::Module>;

// Compiles a classic script which runs in the global scope
auto CompileScript(CodeCompilerHolder& holder) -> v8::Local<v8::Script>;

// Serializes v8's code cache for a compiled module
auto CreateCodeCache(v8::Local<v8::Module> module) -> ModuleSource::CodeCache;

} // namespace jsh
