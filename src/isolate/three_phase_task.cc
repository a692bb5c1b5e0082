#include "three_phase_task.h"
#include "platform.h"
#include "run_with_timeout.h"
#include "stack_trace.h"
#include "generic/handle_cast.h"
#include "lib/log.h"
#include <optional>

using namespace v8;

namespace jsh {
namespace {

auto MakeDeadline(std::chrono::milliseconds timeout) -> std::optional<Scheduler::clock::time_point> {
	auto now = Scheduler::clock::now();
	if (timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(Scheduler::clock::time_point::max() - now)) {
		return std::nullopt;
	}
	return now + timeout;
}

} // anonymous namespace

void ThreePhaseTask::Phase3Rejected(Local<Value> reason) {
	throw RuntimeError(RenderException(reason, GetFilename()));
}

void ThreePhaseTask::Run(IsolateEnvironment& env, ThreePhaseTask& task, std::chrono::milliseconds timeout) {
	Executor::Lock lock{env};
	Context::Scope context_scope{env.DefaultContext()};
	task.RunLocked(env, timeout);
}

void ThreePhaseTask::RunLocked(IsolateEnvironment& env, std::chrono::milliseconds timeout) {
	Isolate* isolate = env.GetIsolate();
	Scheduler& scheduler = env.GetScheduler();
	auto deadline = MakeDeadline(timeout);
	TimeoutScope timeout_scope{env, timeout};
	TryCatch try_catch{isolate};

	// Errors from timers which fired after the last call finished belong to no call
	auto stale = scheduler.TakeUncaughtError();
	if (stale) {
		JSH_LOG_WARNING("%s", stale->c_str());
	}

	auto check_timeout = [&]() {
		if (timeout_scope.DidTimeout() || (deadline && Scheduler::clock::now() >= *deadline)) {
			throw TimeoutError("Task timed out");
		}
	};
	auto rethrow = [&]() {
		check_timeout();
		throw RuntimeError(RenderException(try_catch, GetFilename()));
	};

	// Phase 2
	Local<Value> result;
	try {
		result = Phase2();
	} catch (const ScriptException& cc_error) {
		rethrow();
	}

	// Drive the event loop until the promise settles
	if (AwaitsPromise() && !result.IsEmpty() && result->IsPromise()) {
		Local<Promise> promise = result.As<Promise>();
		while (true) {
			env.TaskEpilogue(promise);
			if (try_catch.HasCaught()) {
				rethrow();
			}
			check_timeout();
			auto uncaught = scheduler.TakeUncaughtError();
			if (uncaught) {
				throw RuntimeError(*uncaught);
			}
			if (promise->State() != Promise::kPending) {
				break;
			}
			bool did_work = Platform::PumpMessageLoop(isolate);
			bool alive = scheduler.RunOnce(false, deadline);
			env.TaskEpilogue(promise);
			if (promise->State() != Promise::kPending) {
				continue;
			}
			if (!alive && !did_work) {
				if (Platform::PumpMessageLoop(isolate)) {
					continue;
				}
				throw RuntimeError("Promise resolution is still pending but the event loop has already resolved");
			}
			if (!did_work) {
				scheduler.RunOnce(true, deadline);
			}
		}
		check_timeout();
		if (promise->State() == Promise::kRejected) {
			Phase3Rejected(promise->Result());
			return;
		}
		result = promise->Result();
	}
	check_timeout();

	// Phase 3
	try {
		Phase3(result);
	} catch (const ParamIncorrect& cc_error) {
		throw SerializationError(std::string{"expected "} + cc_error.type);
	} catch (const ScriptException& cc_error) {
		rethrow();
	}
}

} // namespace jsh
