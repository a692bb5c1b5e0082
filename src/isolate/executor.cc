#include "executor.h"
#include "environment.h"

namespace jsh {

thread_local Executor* Executor::current_executor = nullptr;

/**
 * Scope implementation
 */
Executor::Scope::Scope(IsolateEnvironment& env) : last{current_executor} {
	current_executor = &env.executor;
}

Executor::Scope::~Scope() {
	current_executor = last;
}

/**
 * Lock implementation
 */
Executor::Lock::Lock(IsolateEnvironment& env) :
	scope{env},
	locker{env.GetIsolate()},
	isolate_scope{env.GetIsolate()},
	handle_scope{env.GetIsolate()} {}

} // namespace jsh
