#include "utilities.h"
#include "specifier.h"

namespace jsh {

auto Validate(const std::string& javascript) -> bool {
	Runtime runtime;
	try {
		runtime.LoadModules(Module{"jshost_validate.js", javascript});
		return true;
	} catch (const RuntimeError& cc_error) {
		return false;
	}
}

auto Import(const std::string& path) -> ModuleWrapper {
	return ModuleWrapper::NewFromFile(path);
}

auto ResolvePathUrl(const std::string& path) -> std::string {
	return ResolvePath(path).ToString();
}

} // namespace jsh
