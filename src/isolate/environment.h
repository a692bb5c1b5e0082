#pragma once
#include <v8.h>
#include <uv.h>

#include "executor.h"
#include "scheduler.h"
#include "strings.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

namespace jsh {

/**
 * Wrapper around a v8::Isolate and the single context a runtime evaluates everything in. One
 * environment exists per runtime. It is only ever entered by one thread at a time.
 */
class IsolateEnvironment {
	friend class Executor;
	friend StringTable;

	private:
		v8::Isolate* isolate{};
		std::unique_ptr<v8::ArrayBuffer::Allocator> allocator;
		Executor executor;
		std::unique_ptr<Scheduler> scheduler;
		v8::Global<v8::Context> default_context;
		uint64_t id;
		size_t memory_limit = 0;
		bool disposing = false;
		std::deque<v8::Global<v8::Promise>> unhandled_promise_rejections;
		StringTable string_table;

		/**
		 * If this function is called then I have failed you.
		 */
		static void OOMErrorCallback(const char* location, const v8::OOMDetails& details);

		/**
		 * Called when an isolate has an uncaught error in a promise. Rejections which are handled
		 * later are removed again by `PromiseWasHandled`.
		 */
		static void PromiseRejectCallback(v8::PromiseRejectMessage rejection);
		void PromiseWasHandled(v8::Local<v8::Promise> promise);

	public:
		// Modules are looked up by identity hash from v8 callbacks and by specifier from the loader
		std::unordered_multimap<int, struct ModuleInfo*> module_handles;
		std::unordered_map<std::string, std::shared_ptr<ModuleInfo>> modules;
		std::unique_ptr<class FunctionTable> function_table;
		std::shared_ptr<class ModuleLoader> module_loader;
		// Set by `jshost.register_entrypoint`, consumed by the next module load
		v8::Global<v8::Function> registered_entrypoint;

		explicit IsolateEnvironment(size_t memory_limit_in_mb = 0);
		IsolateEnvironment(const IsolateEnvironment&) = delete;
		auto operator= (const IsolateEnvironment&) -> IsolateEnvironment = delete;
		~IsolateEnvironment();

		/**
		 * Return pointer the currently running IsolateEnvironment
		 */
		static auto GetCurrent() -> IsolateEnvironment* {
			return Executor::GetCurrentEnvironment();
		}

		operator v8::Isolate*() const { // NOLINT
			return isolate;
		}

		auto GetIsolate() const -> v8::Isolate* {
			return isolate;
		}

		// Unique for the lifetime of the process, stamped into handles which refer to this runtime
		auto GetId() const -> uint64_t {
			return id;
		}

		// Set while the environment is being torn down. Loop callbacks which still fire must not
		// run script.
		auto IsDisposing() const -> bool {
			return disposing;
		}

		auto GetScheduler() -> Scheduler& {
			return *scheduler;
		}

		auto DefaultContext() const -> v8::Local<v8::Context> {
			return v8::Local<v8::Context>::New(isolate, default_context);
		}

		/**
		 * This is called after each turn of the event loop. Drains microtasks then reports promises
		 * which were rejected with nobody listening. `awaited` is the promise the host is waiting on,
		 * which is expected to have no handler.
		 */
		void TaskEpilogue(v8::Local<v8::Promise> awaited = {});
};

inline auto StringTable::Get() -> StringTable& {
	return Executor::GetCurrentEnvironment()->string_table;
}

} // namespace jsh
