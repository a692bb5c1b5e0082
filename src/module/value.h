#pragma once
#include "isolate/generic/handle_cast.h"
#include <v8.h>
#include <string>

namespace jsh {

// Result type for calls whose return value is not wanted. Decodes from anything.
struct Void {};

inline auto HandleCastImpl(v8::Local<v8::Value> /*value*/, const HandleCastArguments& /*arguments*/, HandleCastTag<Void> /*tag*/) {
	return Void{};
}

inline auto HandleCastImpl(Void /*value*/, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	return v8::Undefined(arguments.isolate);
}

/**
 * Arbitrary structured data, carried across as JSON text. Values which JSON can't represent
 * (functions, `undefined`) become `null`.
 */
class Json {
	public:
		Json() = default;
		static auto Parse(std::string text) -> Json {
			Json json;
			json.text = std::move(text);
			return json;
		}

		auto Dump() const -> const std::string& { return text; }

		auto operator==(const Json& right) const -> bool { return text == right.text; }
		auto operator!=(const Json& right) const -> bool { return text != right.text; }

	private:
		std::string text = "null";
};

inline auto HandleCastImpl(v8::Local<v8::Value> value, const HandleCastArguments& arguments, HandleCastTag<Json> /*tag*/) {
	v8::Local<v8::Context> context = arguments.context;
	v8::Local<v8::String> text;
	if (value->IsUndefined() || value->IsFunction() || value->IsSymbol()) {
		return Json{};
	} else if (!v8::JSON::Stringify(context, value).ToLocal(&text)) {
		// BigInt and cyclic structures
		ParamIncorrect::Throw("a JSON value");
	}
	return Json::Parse(HandleCast<std::string>(text, arguments));
}

inline auto HandleCastImpl(const Json& value, const HandleCastArguments& arguments, HandleCastTag<v8::Local<v8::Value>> /*tag*/)
-> v8::Local<v8::Value> {
	v8::Local<v8::Context> context = arguments.context;
	v8::Local<v8::String> text = HandleCast<v8::Local<v8::String>>(value.Dump(), arguments);
	v8::Local<v8::Value> result;
	if (!v8::JSON::Parse(context, text).ToLocal(&result)) {
		throw ScriptException();
	}
	return result;
}

} // namespace jsh
