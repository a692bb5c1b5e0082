#pragma once
#include <v8.h>

namespace jsh {
class IsolateEnvironment;

/**
 * Executor class handles v8 locking while C++ code is running. Thread syncronization is handled
 * by v8::Locker. This also enters the isolate and sets up a handle scope.
 */
class Executor {
	public:
		explicit Executor(IsolateEnvironment& env) : env{env} {}
		Executor(const Executor&) = delete;
		~Executor() = default;
		auto operator= (const Executor&) = delete;

		static auto GetCurrentEnvironment() -> IsolateEnvironment*;

		// A scope sets the current environment without locking v8
		class Scope {
			public:
				explicit Scope(IsolateEnvironment& env);
				Scope(const Scope&) = delete;
				~Scope();
				auto operator= (const Scope&) = delete;

			private:
				Executor* last;
		};

		// Locks this environment for execution. Implies `Scope` as well.
		class Lock {
			public:
				explicit Lock(IsolateEnvironment& env);
				Lock(const Lock&) = delete;
				~Lock() = default;
				auto operator= (const Lock&) = delete;

			private:
				Scope scope;
				v8::Locker locker;
				v8::Isolate::Scope isolate_scope;
				v8::HandleScope handle_scope;
		};

	private:
		IsolateEnvironment& env;

		static thread_local Executor* current_executor;
};

inline auto Executor::GetCurrentEnvironment() -> IsolateEnvironment* {
	return current_executor == nullptr ? nullptr : &current_executor->env;
}

} // namespace jsh
