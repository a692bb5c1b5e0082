#include "entrypoint.h"
#include "value_bridge.h"
#include "isolate/environment.h"
#include "isolate/util.h"
#include "lib/log.h"

using namespace v8;

namespace jsh {

auto ResolveEntrypoint(
	IsolateEnvironment& env,
	Local<Object> module_namespace,
	const std::optional<std::string>& default_entrypoint
) -> std::optional<Function> {
	if (!env.registered_entrypoint.IsEmpty()) {
		Local<v8::Function> registered = Deref(env.registered_entrypoint);
		env.registered_entrypoint.Reset();
		return env.function_table->Register(registered);
	}
	if (default_entrypoint) {
		try {
			Local<Context> context = env.DefaultContext();
			return env.function_table->Register(GetFunctionByName(context, module_namespace, *default_entrypoint));
		} catch (const ValueNotFoundError& cc_error) {
			JSH_LOG_DEBUG("no default entrypoint: %s", cc_error.what());
		} catch (const ValueNotCallableError& cc_error) {
			JSH_LOG_DEBUG("no default entrypoint: %s", cc_error.what());
		}
	}
	return std::nullopt;
}

} // namespace jsh
