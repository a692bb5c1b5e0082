#pragma once
#include "environment.h"
#include "lib/timer.h"
#include <chrono>
#include <memory>
#include <mutex>

namespace jsh {

/**
 * Terminates script which is still running when the deadline passes. libuv can only check the
 * deadline between turns of the loop, so a synchronous infinite loop needs to be interrupted from
 * the timer thread.
 */
class TimeoutScope {
	public:
		TimeoutScope(IsolateEnvironment& env, std::chrono::milliseconds timeout) : env{env} {
			if (timeout.count() > 0 && timeout < std::chrono::hours{24 * 365}) {
				timer = std::make_unique<timer_t>(timeout, [this]() {
					std::lock_guard<std::mutex> lock{mutex};
					if (!did_finish) {
						did_terminate = true;
						this->env.GetIsolate()->TerminateExecution();
					}
				});
			}
		}

		TimeoutScope(const TimeoutScope&) = delete;
		auto operator=(const TimeoutScope&) = delete;

		~TimeoutScope() {
			Finish();
		}

		// Stops the watchdog. Termination is cancelled if it fired so the isolate remains usable.
		void Finish() {
			{
				std::lock_guard<std::mutex> lock{mutex};
				did_finish = true;
			}
			timer.reset();
			if (did_terminate && !did_cancel) {
				did_cancel = true;
				env.GetIsolate()->CancelTerminateExecution();
			}
		}

		auto DidTimeout() -> bool {
			std::lock_guard<std::mutex> lock{mutex};
			return did_terminate;
		}

	private:
		IsolateEnvironment& env;
		std::unique_ptr<timer_t> timer;
		std::mutex mutex;
		bool did_finish = false;
		bool did_terminate = false;
		bool did_cancel = false;
};

} // namespace jsh
