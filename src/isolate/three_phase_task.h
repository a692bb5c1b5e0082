#pragma once
#include "environment.h"
#include <v8.h>
#include <chrono>
#include <string>

namespace jsh {

/**
 * Every host call into a runtime can be decomposed into three phases.
 *
 * - Phase 1 [host]: the constructor copies arguments out of host memory
 * - Phase 2 [isolate]: run script, which may hand back a promise
 * - Phase 3 [isolate]: decode the settled value back into host memory
 *
 * Between phase 2 and phase 3 the runtime's event loop is driven until the promise settles or the
 * deadline passes. Both phases share one deadline.
 *
 * These runners are invoked via: ThreePhaseTask::Run(env, task, timeout);
 */
class ThreePhaseTask {
	public:
		ThreePhaseTask() = default;
		ThreePhaseTask(const ThreePhaseTask&) = delete;
		auto operator= (const ThreePhaseTask&) -> ThreePhaseTask& = delete;
		virtual ~ThreePhaseTask() = default;

		virtual auto Phase2() -> v8::Local<v8::Value> = 0;
		virtual void Phase3(v8::Local<v8::Value> /*result*/) {}

		// Called instead of `Phase3` when the promise from `Phase2` rejects. The default renders the
		// rejection into a `RuntimeError`.
		virtual void Phase3Rejected(v8::Local<v8::Value> reason);

		// Returning false hands a promise from `Phase2` straight to `Phase3`
		virtual auto AwaitsPromise() const -> bool { return true; }

		// Filename used to annotate exceptions when v8 does not know where they came from
		virtual auto GetFilename() const -> std::string { return "<anonymous>"; }

		static void Run(IsolateEnvironment& env, ThreePhaseTask& task, std::chrono::milliseconds timeout);

	private:
		void RunLocked(IsolateEnvironment& env, std::chrono::milliseconds timeout);
};

} // namespace jsh
