#include "module_handle.h"
#include "isolate/environment.h"
#include "isolate/util.h"
#include <algorithm>

using namespace v8;

namespace jsh {

ModuleInfo::ModuleInfo(IsolateEnvironment& env, std::string specifier, ModuleType type, Local<v8::Module> handle) :
		env{env},
		specifier{std::move(specifier)},
		type{type},
		identity_hash{handle->GetIdentityHash()},
		script_id{handle->IsSourceTextModule() ? handle->ScriptId() : 0},
		handle{env.GetIsolate(), handle} {
	// Add to isolate's list of modules
	env.module_handles.emplace(identity_hash, this);
}

ModuleInfo::~ModuleInfo() {
	// Remove from isolate's list of modules
	auto& module_map = env.module_handles;
	auto range = module_map.equal_range(identity_hash);
	auto it = std::find_if(range.first, range.second, [&](decltype(*module_map.begin()) data) {
		return this == data.second;
	});
	if (it != range.second) {
		module_map.erase(it);
	}
}

auto ModuleInfo::FindRequest(const std::string& raw_specifier) const -> const std::string* {
	for (const auto& request : requests) {
		if (request.first == raw_specifier) {
			return &request.second;
		}
	}
	return nullptr;
}

auto LookupModuleInfo(Local<v8::Module> module) -> ModuleInfo* {
	auto& module_map = IsolateEnvironment::GetCurrent()->module_handles;
	auto range = module_map.equal_range(module->GetIdentityHash());
	auto it = std::find_if(range.first, range.second, [&](decltype(*module_map.begin()) data) {
		return Deref(data.second->handle) == module;
	});
	return it == range.second ? nullptr : it->second;
}

auto FindModuleById(IsolateEnvironment& env, int script_id) -> std::shared_ptr<ModuleInfo> {
	for (auto& entry : env.modules) {
		if (entry.second->script_id == script_id) {
			return entry.second;
		}
	}
	return nullptr;
}

} // namespace jsh
