#include "scheduler.h"
#include "environment.h"
#include "stack_trace.h"
#include "util.h"
#include "lib/log.h"
#include <stdexcept>

using namespace v8;

namespace jsh {

Scheduler::Scheduler(IsolateEnvironment& env) : env{env} {
	int status = uv_loop_init(&loop);
	if (status != 0) {
		throw std::runtime_error{std::string{"uv_loop_init: "} + uv_strerror(status)};
	}
	uv_timer_init(&loop, &deadline_timer);
	// The deadline timer only wakes up the loop, it does not keep it alive
	uv_unref(reinterpret_cast<uv_handle_t*>(&deadline_timer));
}

Scheduler::~Scheduler() {
	for (auto& entry : timers) {
		CloseTimer(entry.second);
	}
	timers.clear();
	uv_close(reinterpret_cast<uv_handle_t*>(&deadline_timer), nullptr);
	// Drain close callbacks and any requests which are still in flight
	while (uv_run(&loop, UV_RUN_DEFAULT) != 0) {}
	if (uv_loop_close(&loop) != 0) {
		JSH_LOG_WARNING("event loop closed with active handles");
	}
}

auto Scheduler::RunOnce(bool wait, std::optional<clock::time_point> deadline) -> bool {
	if (!wait) {
		return uv_run(&loop, UV_RUN_NOWAIT) != 0;
	}
	if (deadline) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock::now()).count();
		uv_timer_start(&deadline_timer, [](uv_timer_t* /*handle*/) {}, remaining > 0 ? remaining : 0, 0);
	}
	bool alive = uv_run(&loop, UV_RUN_ONCE) != 0;
	uv_timer_stop(&deadline_timer);
	return alive;
}

auto Scheduler::SetTimer(
	Local<Function> callback,
	std::vector<Local<Value>> arguments,
	uint64_t delay_ms,
	bool repeat
) -> uint32_t {
	Isolate* isolate = env.GetIsolate();
	auto* timer = new ScriptTimer;
	timer->scheduler = this;
	timer->id = next_timer_id++;
	timer->repeat = repeat;
	timer->callback.Reset(isolate, callback);
	for (auto& argument : arguments) {
		timer->arguments.emplace_back(isolate, argument);
	}
	uv_timer_init(&loop, &timer->handle);
	timer->handle.data = timer;
	uint64_t interval = repeat ? (delay_ms == 0 ? 1 : delay_ms) : 0;
	uv_timer_start(&timer->handle, TimerCallback, delay_ms, interval);
	timers.emplace(timer->id, timer);
	return timer->id;
}

void Scheduler::ClearTimer(uint32_t id) {
	auto it = timers.find(id);
	if (it != timers.end()) {
		CloseTimer(it->second);
		timers.erase(it);
	}
}

auto Scheduler::TakeUncaughtError() -> std::optional<std::string> {
	return std::exchange(uncaught_error, std::nullopt);
}

void Scheduler::CloseTimer(ScriptTimer* timer) {
	uv_timer_stop(&timer->handle);
	uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), [](uv_handle_t* handle) {
		delete static_cast<ScriptTimer*>(handle->data);
	});
}

void Scheduler::TimerCallback(uv_timer_t* handle) {
	auto* timer = static_cast<ScriptTimer*>(handle->data);
	Scheduler& scheduler = *timer->scheduler;
	Isolate* isolate = scheduler.env.GetIsolate();
	HandleScope handle_scope{isolate};
	Local<Context> context = scheduler.env.DefaultContext();
	Context::Scope context_scope{context};

	Local<Function> callback = Deref(timer->callback);
	std::vector<Local<Value>> argv;
	argv.reserve(timer->arguments.size());
	for (auto& argument : timer->arguments) {
		argv.emplace_back(Deref(argument));
	}
	uint32_t id = timer->id;
	if (!timer->repeat) {
		// One-shot timers are released before the callback so `clearTimeout` inside it is harmless
		scheduler.timers.erase(id);
		timer->callback.Reset();
		timer->arguments.clear();
		CloseTimer(timer);
	}

	TryCatch try_catch{isolate};
	MaybeLocal<Value> result = callback->Call(context, Undefined(isolate), static_cast<int>(argv.size()), argv.data());
	if (result.IsEmpty() && try_catch.HasCaught() && !try_catch.HasTerminated()) {
		std::string message = RenderException(try_catch, "<timer>");
		if (scheduler.uncaught_error) {
			JSH_LOG_WARNING("%s", message.c_str());
		} else {
			scheduler.uncaught_error = std::move(message);
		}
		if (timer->repeat) {
			// An interval which throws is reported once, then stopped
			scheduler.ClearTimer(id);
		}
	}
	isolate->PerformMicrotaskCheckpoint();
}

} // namespace jsh
