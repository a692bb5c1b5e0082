#include "value_bridge.h"
#include "isolate/util.h"
#include <vector>

using namespace v8;

namespace jsh {

auto GetValueRef(Local<Context> context, Local<Object> module_namespace, const std::string& name) -> Local<Value> {
	Local<String> key = v8_string(name);
	Local<Value> value = Unmaybe(context->Global()->Get(context, key));
	if (!value->IsNullOrUndefined()) {
		return value;
	}
	if (!module_namespace.IsEmpty()) {
		// Reading an export which is still in its TDZ throws, that is a miss too
		TryCatch try_catch{context->GetIsolate()};
		if (module_namespace->Get(context, key).ToLocal(&value) && !value->IsNullOrUndefined()) {
			return value;
		}
	}
	throw ValueNotFoundError(name);
}

auto GetFunctionByName(Local<Context> context, Local<Object> module_namespace, const std::string& name) -> Local<v8::Function> {
	Local<Value> value = GetValueRef(context, module_namespace, name);
	if (!value->IsFunction()) {
		throw ValueNotCallableError(name);
	}
	return value.As<v8::Function>();
}

auto CallFunctionByRef(
	Local<Context> context,
	Local<v8::Function> function,
	Local<Value> receiver,
	const Arguments& arguments
) -> Local<Value> {
	std::vector<Local<Value>> argv;
	argv.reserve(arguments.size());
	for (const auto& argument : arguments) {
		argv.emplace_back(argument->TransferIn());
	}
	return Unmaybe(function->Call(context, receiver, static_cast<int>(argv.size()), argv.data()));
}

} // namespace jsh
