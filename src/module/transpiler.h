#pragma once
#include "specifier.h"
#include <functional>
#include <string>

namespace jsh {

/**
 * Source-to-source transform applied to every module before it is compiled and cached, ie a
 * TypeScript stripper. It may throw a `jsh::Error` to reject a module.
 */
using Transpiler = std::function<std::string(const ModuleSpecifier& specifier, const std::string& code)>;

inline auto IdentityTranspiler() -> Transpiler {
	return [](const ModuleSpecifier& /*specifier*/, const std::string& code) { return code; };
}

} // namespace jsh
