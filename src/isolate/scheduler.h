#pragma once
#include <v8.h>
#include <uv.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsh {
class IsolateEnvironment;

/**
 * Owns the libuv loop of one runtime. Every asynchronous operation the runtime performs (module
 * fetches, script timers) is a handle or request on this loop, and the host thread is the only
 * one which runs it.
 */
class Scheduler {
	public:
		using clock = std::chrono::steady_clock;

		explicit Scheduler(IsolateEnvironment& env);
		Scheduler(const Scheduler&) = delete;
		~Scheduler();
		auto operator=(const Scheduler&) = delete;

		auto GetLoop() -> uv_loop_t* { return &loop; }

		// Runs one turn of the loop. When `wait` is set this blocks until some handle fires, or
		// until `deadline`. Returns true if the loop still has work.
		auto RunOnce(bool wait, std::optional<clock::time_point> deadline) -> bool;

		// Script timers, used by `setTimeout` and `setInterval`
		auto SetTimer(
			v8::Local<v8::Function> callback,
			std::vector<v8::Local<v8::Value>> arguments,
			uint64_t delay_ms,
			bool repeat
		) -> uint32_t;
		void ClearTimer(uint32_t id);

		// An exception thrown out of a timer callback. Taken by whoever is driving the loop.
		auto TakeUncaughtError() -> std::optional<std::string>;

	private:
		struct ScriptTimer {
			uv_timer_t handle{};
			Scheduler* scheduler = nullptr;
			uint32_t id = 0;
			bool repeat = false;
			v8::Global<v8::Function> callback;
			std::vector<v8::Global<v8::Value>> arguments;
		};

		static void TimerCallback(uv_timer_t* handle);
		static void CloseTimer(ScriptTimer* timer);

		IsolateEnvironment& env;
		uv_loop_t loop{};
		uv_timer_t deadline_timer{};
		std::unordered_map<uint32_t, ScriptTimer*> timers;
		std::optional<std::string> uncaught_error;
		uint32_t next_timer_id = 1;
};

} // namespace jsh
