#include "evaluation.h"
#include "isolate/generic/error.h"
#include "isolate/generic/handle_cast.h"

using namespace v8;

namespace jsh {

/**
 * CodeCompilerHolder implementation
 */
CodeCompilerHolder::CodeCompilerHolder(std::string resource_name, const ModuleSource& source, bool is_module) :
		resource_name{std::move(resource_name)},
		code{source.GetCode()},
		cached_data_in{source.GetCodeCache()},
		is_module{is_module} {}

CodeCompilerHolder::CodeCompilerHolder(std::string resource_name, std::string code, bool is_module) :
		resource_name{std::move(resource_name)},
		code{std::move(code)},
		is_module{is_module} {}

auto CodeCompilerHolder::GetOrigin() const -> ScriptOrigin {
	return ScriptOrigin{
		Isolate::GetCurrent(),
		HandleCast<Local<String>>(resource_name),
		0, // line_offset
		0, // column_offset
		false, // resource_is_shared_cross_origin
		-1, // script_id
		{}, // source_map_url
		false, // resource_is_opaque
		false, // is_wasm
		is_module
	};
}

auto CodeCompilerHolder::GetCompileOptions() const -> ScriptCompiler::CompileOptions {
	return cached_data_in ? ScriptCompiler::kConsumeCodeCache : ScriptCompiler::kNoCompileOptions;
}

auto CodeCompilerHolder::GetSource() -> std::unique_ptr<ScriptCompiler::Source> {
	ScriptCompiler::CachedData* cached_data = nullptr;
	if (cached_data_in) {
		cached_data = new ScriptCompiler::CachedData{
			cached_data_in->data(),
			static_cast<int>(cached_data_in->size()),
			ScriptCompiler::CachedData::BufferNotOwned
		};
	}
	return std::make_unique<ScriptCompiler::Source>(HandleCast<Local<String>>(code), GetOrigin(), cached_data);
}

auto CompileModule(CodeCompilerHolder& holder) -> Local<v8::Module> {
	Isolate* isolate = Isolate::GetCurrent();
	auto source = holder.GetSource();
	Local<v8::Module> module = Unmaybe(ScriptCompiler::CompileModule(isolate, source.get(), holder.GetCompileOptions()));
	if (holder.DidSupplyCachedData()) {
		holder.SetCachedDataRejected(source->GetCachedData()->rejected);
	}
	return module;
}

auto CompileScript(CodeCompilerHolder& holder) -> Local<Script> {
	Local<Context> context = Isolate::GetCurrent()->GetCurrentContext();
	auto source = holder.GetSource();
	Local<Script> script = Unmaybe(ScriptCompiler::Compile(context, source.get(), holder.GetCompileOptions()));
	if (holder.DidSupplyCachedData()) {
		holder.SetCachedDataRejected(source->GetCachedData()->rejected);
	}
	return script;
}

auto CreateCodeCache(Local<v8::Module> module) -> ModuleSource::CodeCache {
	std::unique_ptr<ScriptCompiler::CachedData> cached_data{
		ScriptCompiler::CreateCodeCache(module->GetUnboundModuleScript())};
	if (!cached_data) {
		return {};
	}
	return ModuleSource::CodeCache{cached_data->data, cached_data->data + cached_data->length};
}

} // namespace jsh
