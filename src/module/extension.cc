#include "extension.h"
#include "isolate/environment.h"
#include "isolate/util.h"
#include "lib/log.h"
#include <cmath>

using namespace v8;

namespace jsh {
namespace {

// Larger delays fire immediately in browsers and node, here they are clamped instead
constexpr double kMaxTimerDelay = 2147483647;

/**
 * `jshost.register_entrypoint(fn)`. The last registration wins, the next module load consumes it.
 */
class CoreExtension final : public Extension {
	public:
		auto GetName() const -> std::string final { return "jshost"; }

		void Install(Local<Context> context, Local<Object> global) final {
			Local<Object> jshost = Object::New(context->GetIsolate());
			SetMethod(context, jshost, "register_entrypoint", RegisterEntrypoint);
			Unmaybe(jshost->SetIntegrityLevel(context, IntegrityLevel::kFrozen));
			Unmaybe(global->DefineOwnProperty(
				context, StringTable::Get().jshost, jshost, static_cast<PropertyAttribute>(PropertyAttribute::ReadOnly | PropertyAttribute::DontEnum)));
		}

	private:
		static void RegisterEntrypoint(const FunctionCallbackInfo<Value>& info) {
			detail::RunBarrier([&]() {
				if (info.Length() < 1 || !info[0]->IsFunction()) {
					throw ScriptTypeError("register_entrypoint expects a function");
				}
				IsolateEnvironment::GetCurrent()->registered_entrypoint.Reset(info.GetIsolate(), info[0].As<v8::Function>());
			});
		}
};

/**
 * `console.*`, printed through the host's log
 */
class ConsoleExtension final : public Extension {
	public:
		auto GetName() const -> std::string final { return "console"; }

		void Install(Local<Context> context, Local<Object> global) final {
			Local<Object> console = Object::New(context->GetIsolate());
			SetMethod(context, console, "log", Print<LogLevel::Info>);
			SetMethod(context, console, "info", Print<LogLevel::Info>);
			SetMethod(context, console, "debug", Print<LogLevel::Debug>);
			SetMethod(context, console, "warn", Print<LogLevel::Warning>);
			SetMethod(context, console, "error", Print<LogLevel::Error>);
			Unmaybe(global->DefineOwnProperty(context, StringTable::Get().console, console, PropertyAttribute::DontEnum));
		}

	private:
		static auto Format(Local<Context> context, Local<Value> value) -> std::string {
			if (value->IsString()) {
				return HandleCast<std::string>(value.As<String>());
			} else if (value->IsObject() && !value->IsFunction() && !value->IsNativeError()) {
				Local<String> json;
				TryCatch try_catch{context->GetIsolate()};
				if (JSON::Stringify(context, value).ToLocal(&json)) {
					return HandleCast<std::string>(json);
				}
			}
			return HandleCast<std::string>(Unmaybe(value->ToDetailString(context)));
		}

		template <LogLevel Level>
		static void Print(const FunctionCallbackInfo<Value>& info) {
			detail::RunBarrier([&]() {
				if (static_cast<int>(Level) > static_cast<int>(GetLogLevel())) {
					return;
				}
				Local<Context> context = info.GetIsolate()->GetCurrentContext();
				std::string line;
				for (int ii = 0; ii < info.Length(); ++ii) {
					if (ii != 0) {
						line += ' ';
					}
					line += Format(context, info[ii]);
				}
				Log(Level, "%s", line.c_str());
			});
		}
};

/**
 * setTimeout, setInterval and friends, backed by libuv timers on the runtime's loop
 */
class TimersExtension final : public Extension {
	public:
		auto GetName() const -> std::string final { return "timers"; }

		void Install(Local<Context> context, Local<Object> global) final {
			SetMethod(context, global, "setTimeout", SetTimer<false>);
			SetMethod(context, global, "setInterval", SetTimer<true>);
			SetMethod(context, global, "clearTimeout", ClearTimer);
			SetMethod(context, global, "clearInterval", ClearTimer);
			SetMethod(context, global, "queueMicrotask", QueueMicrotask);
		}

	private:
		template <bool Repeat>
		static void SetTimer(const FunctionCallbackInfo<Value>& info) {
			detail::RunBarrier([&]() {
				if (info.Length() < 1 || !info[0]->IsFunction()) {
					throw ScriptTypeError("callback must be a function");
				}
				double delay = 0;
				if (info.Length() > 1 && info[1]->IsNumber()) {
					delay = info[1].As<Number>()->Value();
				}
				if (!std::isfinite(delay) || delay < 0) {
					delay = 0;
				} else if (delay > kMaxTimerDelay) {
					delay = kMaxTimerDelay;
				}
				std::vector<Local<Value>> arguments;
				for (int ii = 2; ii < info.Length(); ++ii) {
					arguments.emplace_back(info[ii]);
				}
				auto& scheduler = IsolateEnvironment::GetCurrent()->GetScheduler();
				uint32_t id = scheduler.SetTimer(info[0].As<v8::Function>(), std::move(arguments), static_cast<uint64_t>(delay), Repeat);
				info.GetReturnValue().Set(id);
			});
		}

		static void ClearTimer(const FunctionCallbackInfo<Value>& info) {
			detail::RunBarrier([&]() {
				if (info.Length() > 0 && info[0]->IsUint32()) {
					IsolateEnvironment::GetCurrent()->GetScheduler().ClearTimer(info[0].As<Uint32>()->Value());
				}
			});
		}

		static void QueueMicrotask(const FunctionCallbackInfo<Value>& info) {
			detail::RunBarrier([&]() {
				if (info.Length() < 1 || !info[0]->IsFunction()) {
					throw ScriptTypeError("callback must be a function");
				}
				info.GetIsolate()->EnqueueMicrotask(info[0].As<v8::Function>());
			});
		}
};

} // anonymous namespace

auto BuiltinExtensions() -> std::vector<std::shared_ptr<Extension>> {
	return {
		std::make_shared<CoreExtension>(),
		std::make_shared<ConsoleExtension>(),
		std::make_shared<TimersExtension>(),
	};
}

auto ExtensionModuleSpecifier(const Extension& extension, const Module& module) -> std::string {
	return "ext:" + extension.GetName() + "/" + module.GetFilename();
}

void SetMethod(Local<Context> context, Local<Object> object, const char* name, FunctionCallback callback) {
	Local<v8::Function> function = Unmaybe(v8::Function::New(context, callback));
	Local<String> key = v8_symbol(name);
	function->SetName(key);
	Unmaybe(object->Set(context, key, function));
}

} // namespace jsh
