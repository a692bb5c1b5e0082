#pragma once
#include <v8.h>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "error.h"

namespace jsh {

// Internal handle conversion error. All these `HandleCastImpl` functions are templated and inlined and
// throwing generates verbose asm so this is implementated as a static function to clean up the
// typical case
struct ParamIncorrect : std::exception {
	explicit ParamIncorrect(const char* type) : type{type} {}
	[[noreturn]] static void Throw(const char* type) { throw ParamIncorrect{type}; }
	auto what() const noexcept -> const char* final { return type; }
	const char* type;
};

// Common arguments for casting functions
class HandleCastArguments {
	private:
		// Most of the time we won't need the context (and it is never needed in "strict" casting mode).
		// This little holder will only call GetCurrentContext() when needed because the optimizer can't
		// elide the call in any circumstances
		class ContextHolder {
			public:
				explicit ContextHolder(v8::Isolate* isolate) : isolate{isolate} {}
				inline operator v8::Local<v8::Context>() const { // NOLINT(hicpp-explicit-conversions)
					if (context.IsEmpty()) {
						context = isolate->GetCurrentContext();
					}
					return context;
				}

			private:
				v8::Isolate* const isolate;
				mutable v8::Local<v8::Context> context{};
		};

	public:
		HandleCastArguments() : HandleCastArguments{true, v8::Isolate::GetCurrent()} {}

		HandleCastArguments(bool strict, v8::Isolate* isolate) :
			isolate{isolate}, context{isolate}, strict{strict} {}

		HandleCastArguments(const v8::FunctionCallbackInfo<v8::Value>& info) : // NOLINT(hicpp-explicit-conversions)
			HandleCastArguments{true, info.GetIsolate()} {}

		v8::Isolate* const isolate;
		const ContextHolder context;
		const bool strict;
};

// Helper
template <class Type>
struct HandleCastTag {};

// Explicit casts: printf("%d\n", HandleCast<int>(value));
template <class Type, class Value>
auto HandleCast(Value&& value, HandleCastArguments arguments = {}) -> Type {
	return HandleCastImpl(std::forward<Value>(value), arguments, HandleCastTag<Type>{});
}

// Identity cast
template <class Type>
inline auto HandleCastImpl(Type value, const HandleCastArguments& /*arguments*/, HandleCastTag<Type> /*tag*/) {
	return value;
}

// Local<Value> -> Local<...> conversions
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Array>> /*tag*/) {
	if (value->IsArray()) {
		return value.As<v8::Array>();
	}
	ParamIncorrect::Throw("an array");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Boolean>> /*tag*/) {
	if (value->IsBoolean()) {
		return value.As<v8::Boolean>();
	} else if (!arguments.strict) {
		return value->ToBoolean(arguments.isolate);
	}
	ParamIncorrect::Throw("a boolean");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Function>> /*tag*/) {
	if (value->IsFunction()) {
		return value.As<v8::Function>();
	}
	ParamIncorrect::Throw("a function");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Int32>> /*tag*/) {
	if (value->IsInt32()) {
		return value.As<v8::Int32>();
	}
	ParamIncorrect::Throw("a 32-bit number");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Uint32>> /*tag*/) {
	if (value->IsUint32()) {
		return value.As<v8::Uint32>();
	}
	ParamIncorrect::Throw("a 32-bit number");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Number>> /*tag*/) {
	if (value->IsNumber()) {
		return value.As<v8::Number>();
	}
	ParamIncorrect::Throw("a number");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::Local<v8::Object>> /*tag*/) {
	if (value->IsObject()) {
		return value.As<v8::Object>();
	}
	ParamIncorrect::Throw("an object");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::String>> /*tag*/) {
	if (value->IsString()) {
		return value.As<v8::String>();
	} else if (!arguments.strict) {
		return Unmaybe(value->ToString(arguments.context));
	}
	ParamIncorrect::Throw("a string");
}

// Local<Value> -> MaybeLocal<...> conversions
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::MaybeLocal<v8::Function>> /*tag*/)
-> v8::MaybeLocal<v8::Function> {
	if (value->IsNullOrUndefined()) {
		return {};
	} else if (value->IsFunction()) {
		return {value.As<v8::Function>()};
	}
	ParamIncorrect::Throw("a function");
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<v8::MaybeLocal<v8::Object>> /*tag*/)
-> v8::MaybeLocal<v8::Object> {
	if (value->IsNullOrUndefined()) {
		return {};
	} else if (value->IsObject()) {
		return {value.As<v8::Object>()};
	}
	ParamIncorrect::Throw("an object");
}

// Local<...> -> native C++ conversions
inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<bool> /*tag*/) {
	return HandleCast<v8::Local<v8::Boolean>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<double> /*tag*/) {
	return HandleCast<v8::Local<v8::Number>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<int32_t> /*tag*/) {
	return HandleCast<v8::Local<v8::Int32>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<uint32_t> /*tag*/) {
	return HandleCast<v8::Local<v8::Uint32>>(value, arguments)->Value();
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& /*arguments*/, HandleCastTag<int64_t> /*tag*/) -> int64_t {
	if (value->IsBigInt()) {
		bool lossless = false;
		int64_t result = value.As<v8::BigInt>()->Int64Value(&lossless);
		if (lossless) {
			return result;
		}
	} else if (value->IsNumber()) {
		double number = value.As<v8::Number>()->Value();
		if (std::trunc(number) == number && std::abs(number) <= 9007199254740991.0) {
			return static_cast<int64_t>(number);
		}
	}
	ParamIncorrect::Throw("an integer");
}

inline auto HandleCastImpl(v8::Local<v8::String> value, const HandleCastArguments& arguments, HandleCastTag<std::string> /*tag*/) {
	v8::String::Utf8Value utf8_value{arguments.isolate, value};
	return std::string{*utf8_value, static_cast<size_t>(utf8_value.length())};
}

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<std::string> /*tag*/) {
	return HandleCast<std::string>(HandleCast<v8::Local<v8::String>>(value, arguments), arguments);
}

// Containers. `null` and `undefined` map to an empty optional.
template <class Type>
auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<std::optional<Type>> /*tag*/)
-> std::optional<Type> {
	if (value->IsNullOrUndefined()) {
		return std::nullopt;
	}
	return HandleCast<Type>(value, arguments);
}

template <class Type>
auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<std::vector<Type>> /*tag*/) {
	auto array = HandleCast<v8::Local<v8::Array>>(value, arguments);
	v8::Local<v8::Context> context = arguments.context;
	std::vector<Type> result;
	uint32_t length = array->Length();
	result.reserve(length);
	for (uint32_t ii = 0; ii < length; ++ii) {
		result.emplace_back(HandleCast<Type>(Unmaybe(array->Get(context, ii)), arguments));
	}
	return result;
}

template <class Type>
auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<std::map<std::string, Type>> /*tag*/) {
	auto object = HandleCast<v8::Local<v8::Object>>(value, arguments);
	v8::Local<v8::Context> context = arguments.context;
	v8::Local<v8::Array> keys = Unmaybe(object->GetOwnPropertyNames(context));
	std::map<std::string, Type> result;
	for (uint32_t ii = 0; ii < keys->Length(); ++ii) {
		v8::Local<v8::Value> key = Unmaybe(keys->Get(context, ii));
		result.emplace(
			HandleCast<std::string>(Unmaybe(key->ToString(context)), arguments),
			HandleCast<Type>(Unmaybe(object->Get(context, key)), arguments)
		);
	}
	return result;
}

// native C++ -> Local<Value> conversions
inline auto HandleCastImpl(bool value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Boolean::New(arguments.isolate, value);
}

inline auto HandleCastImpl(int32_t value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Integer::New(arguments.isolate, value);
}

inline auto HandleCastImpl(uint32_t value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Integer::NewFromUnsigned(arguments.isolate, value);
}

// Plain numbers, matching what a JSON round trip would produce
inline auto HandleCastImpl(int64_t value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Number::New(arguments.isolate, static_cast<double>(value));
}

inline auto HandleCastImpl(double value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Number::New(arguments.isolate, value);
}

inline auto HandleCastImpl(const char* value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::String>> /*tag*/) {
	return Unmaybe(v8::String::NewFromUtf8(arguments.isolate, value, v8::NewStringType::kNormal));
}

inline auto HandleCastImpl(const std::string& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::String>> /*tag*/) {
	return Unmaybe(v8::String::NewFromUtf8(arguments.isolate, value.c_str(), v8::NewStringType::kNormal, static_cast<int>(value.size())));
}

inline auto HandleCastImpl(const char* value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return HandleCast<v8::Local<v8::String>>(value, arguments);
}

inline auto HandleCastImpl(const std::string& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return HandleCast<v8::Local<v8::String>>(value, arguments);
}

template <class Type>
auto HandleCastImpl(const std::optional<Type>& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	if (value) {
		return HandleCast<v8::Local<v8::Value>>(*value, arguments);
	}
	return v8::Null(arguments.isolate);
}

template <class Type>
auto HandleCastImpl(const std::vector<Type>& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	v8::Local<v8::Context> context = arguments.context;
	v8::Local<v8::Array> array = v8::Array::New(arguments.isolate, static_cast<int>(value.size()));
	for (size_t ii = 0; ii < value.size(); ++ii) {
		Unmaybe(array->Set(context, static_cast<uint32_t>(ii), HandleCast<v8::Local<v8::Value>>(value[ii], arguments)));
	}
	return array;
}

template <class Type>
auto HandleCastImpl(const std::map<std::string, Type>& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	v8::Local<v8::Context> context = arguments.context;
	v8::Local<v8::Object> object = v8::Object::New(arguments.isolate);
	for (const auto& entry : value) {
		Unmaybe(object->Set(context,
			HandleCast<v8::Local<v8::String>>(entry.first, arguments),
			HandleCast<v8::Local<v8::Value>>(entry.second, arguments)));
	}
	return object;
}

} // namespace jsh
