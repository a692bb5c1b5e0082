#include "stack_trace.h"
#include "generic/handle_cast.h"

using namespace v8;

namespace jsh {

auto RenderException(Local<Message> message, const std::string& fallback_filename) -> std::string {
	Isolate* isolate = Isolate::GetCurrent();
	Local<Context> context = isolate->GetCurrentContext();
	std::string filename = fallback_filename;
	Local<Value> resource_name = message->GetScriptResourceName();
	if (!resource_name.IsEmpty() && resource_name->IsString() && resource_name.As<String>()->Length() > 0) {
		filename = HandleCast<std::string>(resource_name.As<String>());
	}
	int line = message->GetLineNumber(context).FromMaybe(0);
	std::string text = HandleCast<std::string>(message->Get());
	return filename + ":" + std::to_string(line) + ": " + text;
}

auto RenderException(Local<Value> exception, const std::string& fallback_filename) -> std::string {
	Isolate* isolate = Isolate::GetCurrent();
	return RenderException(Exception::CreateMessage(isolate, exception), fallback_filename);
}

auto RenderException(const TryCatch& try_catch, const std::string& fallback_filename) -> std::string {
	Local<Message> message = try_catch.Message();
	if (!message.IsEmpty()) {
		return RenderException(message, fallback_filename);
	} else if (try_catch.HasCaught() && !try_catch.Exception().IsEmpty()) {
		return RenderException(try_catch.Exception(), fallback_filename);
	}
	return "Unknown error during function execution";
}

} // namespace jsh
