#include "environment.h"
#include "platform.h"
#include "stack_trace.h"
#include "util.h"
#include "lib/log.h"
#include "module/function.h"
#include "module/module_handle.h"
#include <cstdio>
#include <cstdlib>

using namespace v8;

namespace jsh {
namespace {

std::atomic<uint64_t> next_environment_id{1};

} // anonymous namespace

/**
 * IsolateEnvironment implementation
 */
void IsolateEnvironment::OOMErrorCallback(const char* location, const OOMDetails& details) {
	fprintf(stderr, "%s\nis_heap_oom = %d\n\n\n", location, static_cast<int>(details.is_heap_oom));
	HeapStatistics heap;
	Isolate::GetCurrent()->GetHeapStatistics(&heap);
	fprintf(stderr,
		"<--- Heap statistics --->\n"
		"total_heap_size = %zd\n"
		"total_physical_size = %zd\n"
		"used_heap_size = %zd\n"
		"heap_size_limit = %zd\n",
		heap.total_heap_size(),
		heap.total_physical_size(),
		heap.used_heap_size(),
		heap.heap_size_limit()
	);
	abort();
}

void IsolateEnvironment::PromiseRejectCallback(PromiseRejectMessage rejection) {
	auto* that = IsolateEnvironment::GetCurrent();
	if (that == nullptr) {
		return;
	}
	auto event = rejection.GetEvent();
	if (event == kPromiseRejectWithNoHandler) {
		that->unhandled_promise_rejections.emplace_back(that->isolate, rejection.GetPromise());
	} else if (event == kPromiseHandlerAddedAfterReject) {
		that->PromiseWasHandled(rejection.GetPromise());
	}
}

void IsolateEnvironment::PromiseWasHandled(Local<Promise> promise) {
	for (auto& handle : unhandled_promise_rejections) {
		if (handle == promise) {
			handle.Reset();
		}
	}
}

IsolateEnvironment::IsolateEnvironment(size_t memory_limit_in_mb) :
		allocator{ArrayBuffer::Allocator::NewDefaultAllocator()},
		executor{*this},
		id{next_environment_id++},
		memory_limit{memory_limit_in_mb} {
	Platform::Get();
	Isolate::CreateParams create_params;
	create_params.array_buffer_allocator = allocator.get();
	if (memory_limit != 0) {
		create_params.constraints.ConfigureDefaultsFromHeapSize(0, memory_limit * 1024 * 1024);
	}
	isolate = Isolate::New(create_params);

	// Various callbacks
	isolate->SetOOMErrorHandler(OOMErrorCallback);
	isolate->SetPromiseRejectCallback(PromiseRejectCallback);
	isolate->SetMicrotasksPolicy(MicrotasksPolicy::kExplicit);

	function_table = std::make_unique<FunctionTable>(id);
	{
		Executor::Lock lock{*this};
		scheduler = std::make_unique<Scheduler>(*this);
		default_context.Reset(isolate, Context::New(isolate));
	}
}

IsolateEnvironment::~IsolateEnvironment() {
	{
		Executor::Lock lock{*this};
		disposing = true;
		// ModuleInfo destructors unregister themselves from `module_handles`
		modules.clear();
		function_table.reset();
		module_loader.reset();
		registered_entrypoint.Reset();
		unhandled_promise_rejections.clear();
		// Closing script timers releases the handles they hold
		scheduler.reset();
		default_context.Reset();
	}
	Platform::NotifyIsolateShutdown(isolate);
	isolate->Dispose();
}

void IsolateEnvironment::TaskEpilogue(Local<Promise> awaited) {
	isolate->PerformMicrotaskCheckpoint();
	auto rejected_promises = std::exchange(unhandled_promise_rejections, {});
	for (auto& handle : rejected_promises) {
		if (handle.IsEmpty()) {
			continue;
		}
		Local<Promise> promise = Deref(handle);
		if (!awaited.IsEmpty() && promise == awaited) {
			continue;
		}
		Context::Scope context_scope{DefaultContext()};
		std::string message = RenderException(promise->Result(), "<promise>");
		JSH_LOG_WARNING("unhandled promise rejection: %s", message.c_str());
	}
}

} // namespace jsh
