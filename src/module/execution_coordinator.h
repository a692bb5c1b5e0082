#pragma once
#include "module.h"
#include "module_handle.h"
#include "isolate/three_phase_task.h"
#include <v8.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jsh {
class IsolateEnvironment;

/**
 * Three phase task built from two callbacks. `run` produces a value in the runtime, which may be
 * a promise to wait on, and `sink` receives the settled value. Both run under the runtime's lock.
 */
class CallbackTask final : public ThreePhaseTask {
	public:
		using Producer = std::function<v8::Local<v8::Value>()>;
		using Sink = std::function<void(v8::Local<v8::Value>)>;

		CallbackTask(std::string filename, Producer run, Sink sink) :
			filename{std::move(filename)}, run{std::move(run)}, sink{std::move(sink)} {}

		auto Phase2() -> v8::Local<v8::Value> final { return run(); }
		void Phase3(v8::Local<v8::Value> result) final {
			if (sink) {
				sink(result);
			}
		}
		auto GetFilename() const -> std::string final { return filename; }

	private:
		std::string filename;
		Producer run;
		Sink sink;
};

/**
 * Drives everything which might suspend in a runtime: module evaluation and calls whose result
 * has to be awaited. Every call is bounded by the runtime's timeout. A timed out call leaves the
 * runtime as it was when the deadline passed, timers and pending promises included.
 */
class ExecutionCoordinator {
	public:
		ExecutionCoordinator(IsolateEnvironment& env, std::chrono::milliseconds timeout, std::optional<std::string> default_entrypoint);
		ExecutionCoordinator(const ExecutionCoordinator&) = delete;
		auto operator=(const ExecutionCoordinator&) = delete;
		~ExecutionCoordinator() = default;

		void RunAsyncTask(ThreePhaseTask& task) const;
		void RunAsyncTask(ThreePhaseTask& task, std::chrono::milliseconds timeout) const;

		/**
		 * Loads side modules in order, then `main`. Each is fetched, linked, evaluated and drained
		 * before the next one starts, and all of them share one deadline. Returns the handle of
		 * `main`, or of the last side module. Modules which loaded before a failure stay loaded.
		 */
		auto LoadModules(const std::optional<Module>& main, const std::vector<Module>& side) -> ModuleHandle;

		// Loads and evaluates a single module, returns its script id
		auto EvaluateModule(const Module& module, bool is_main, std::chrono::milliseconds timeout) -> int;

		auto GetTimeout() const -> std::chrono::milliseconds { return timeout; }

	private:
		IsolateEnvironment& env;
		std::chrono::milliseconds timeout;
		std::optional<std::string> default_entrypoint;
};

} // namespace jsh
