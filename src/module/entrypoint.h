#pragma once
#include "function.h"
#include <v8.h>
#include <optional>
#include <string>

namespace jsh {
class IsolateEnvironment;

/**
 * Picks the entrypoint after a load has evaluated: the function script passed to
 * `jshost.register_entrypoint`, which is consumed, otherwise the export or global named
 * `default_entrypoint` if that is callable. The result is registered in the function table.
 */
auto ResolveEntrypoint(
	IsolateEnvironment& env,
	v8::Local<v8::Object> module_namespace,
	const std::optional<std::string>& default_entrypoint
) -> std::optional<Function>;

} // namespace jsh
