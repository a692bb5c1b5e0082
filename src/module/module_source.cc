#include "module_source.h"

namespace jsh {

auto ModuleTypeFor(const ModuleSpecifier& specifier) -> ModuleType {
	const std::string& path = specifier.GetPath();
	constexpr const char* extension = ".json";
	constexpr size_t length = 5;
	if (path.size() >= length && path.compare(path.size() - length, length, extension) == 0) {
		return ModuleType::Json;
	}
	return ModuleType::JavaScript;
}

} // namespace jsh
