#pragma once
#include "transferable.h"
#include "isolate/generic/error.h"
#include "isolate/generic/handle_cast.h"
#include <v8.h>
#include <string>

namespace jsh {

/**
 * Finds `name` in the global object, and then in `module_namespace`. `null` and `undefined` count
 * as missing. Throws `ValueNotFoundError`.
 */
auto GetValueRef(v8::Local<v8::Context> context, v8::Local<v8::Object> module_namespace, const std::string& name) -> v8::Local<v8::Value>;

// Same lookup, but the value must be callable. Throws `ValueNotCallableError`.
auto GetFunctionByName(v8::Local<v8::Context> context, v8::Local<v8::Object> module_namespace, const std::string& name) -> v8::Local<v8::Function>;

// Encodes `arguments` and invokes `function` with `receiver` as `this`. Throws `ScriptException`.
auto CallFunctionByRef(
	v8::Local<v8::Context> context,
	v8::Local<v8::Function> function,
	v8::Local<v8::Value> receiver,
	const Arguments& arguments
) -> v8::Local<v8::Value>;

/**
 * Decodes a script value into a host type. Conversion failures come out as `SerializationError`.
 */
template <class Type>
auto Decode(v8::Local<v8::Value> value) -> Type {
	try {
		return HandleCast<Type>(value);
	} catch (const ParamIncorrect& cc_error) {
		throw SerializationError(std::string{"expected "} + cc_error.type);
	}
}

} // namespace jsh
