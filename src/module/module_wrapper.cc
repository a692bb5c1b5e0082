#include "module_wrapper.h"

namespace jsh {

auto ModuleWrapper::NewFromModule(const Module& module, RuntimeOptions options) -> ModuleWrapper {
	auto runtime = std::make_unique<Runtime>(std::move(options));
	ModuleHandle handle = runtime->LoadModule(module);
	return ModuleWrapper{std::move(runtime), std::move(handle)};
}

auto ModuleWrapper::NewFromFile(const std::string& path, RuntimeOptions options) -> ModuleWrapper {
	return NewFromModule(Module::Load(path), std::move(options));
}

auto ModuleWrapper::IsCallable(const std::string& name) -> bool {
	return runtime->IsCallable(handle, name);
}

auto ModuleWrapper::Keys() -> std::vector<std::string> {
	return runtime->GetExportNames(handle);
}

} // namespace jsh
