#include "execution_coordinator.h"
#include "entrypoint.h"
#include "module_graph.h"
#include "module_loader.h"
#include "isolate/environment.h"
#include "isolate/stack_trace.h"
#include "isolate/util.h"
#include "lib/log.h"

using namespace v8;

namespace jsh {
namespace {

/**
 * Loads one module the host supplied. The promise from the graph settles once the module and its
 * imports have evaluated.
 */
class LoadModuleTask final : public ThreePhaseTask {
	public:
		LoadModuleTask(IsolateEnvironment& env, const Module& module, bool is_main) :
			env{env}, module{module}, is_main{is_main} {}

		auto Phase2() -> Local<Value> final {
			ModuleSpecifier specifier = env.module_loader->Resolve(module.GetFilename(), kRootReferrer);
			graph = ModuleGraph::LoadRoot(env, specifier, module.GetContents(), is_main);
			return graph->GetPromise();
		}

		void Phase3(Local<Value> /*result*/) final {
			script_id = graph->GetRoot()->script_id;
		}

		void Phase3Rejected(Local<Value> reason) final {
			if (graph->GetError()) {
				std::rethrow_exception(graph->GetError());
			}
			ThreePhaseTask::Phase3Rejected(reason);
		}

		auto GetFilename() const -> std::string final {
			return module.GetFilename();
		}

		int script_id = 0;

	private:
		IsolateEnvironment& env;
		const Module& module;
		std::shared_ptr<ModuleGraph> graph;
		bool is_main;
};

} // anonymous namespace

ExecutionCoordinator::ExecutionCoordinator(
	IsolateEnvironment& env,
	std::chrono::milliseconds timeout,
	std::optional<std::string> default_entrypoint
) :
	env{env}, timeout{timeout}, default_entrypoint{std::move(default_entrypoint)} {}

void ExecutionCoordinator::RunAsyncTask(ThreePhaseTask& task) const {
	RunAsyncTask(task, timeout);
}

void ExecutionCoordinator::RunAsyncTask(ThreePhaseTask& task, std::chrono::milliseconds timeout) const {
	ThreePhaseTask::Run(env, task, timeout);
}

auto ExecutionCoordinator::EvaluateModule(const Module& module, bool is_main, std::chrono::milliseconds timeout) -> int {
	JSH_LOG_DEBUG("loading %s", module.GetFilename().c_str());
	LoadModuleTask task{env, module, is_main};
	RunAsyncTask(task, timeout);
	return task.script_id;
}

auto ExecutionCoordinator::LoadModules(const std::optional<Module>& main, const std::vector<Module>& side) -> ModuleHandle {
	if (!main && side.empty()) {
		throw RuntimeError("Internal error: attempt to load no modules");
	}

	// One deadline for the whole call
	auto start = std::chrono::steady_clock::now();
	auto remaining = [&]() {
		if (timeout == std::chrono::milliseconds::max()) {
			return timeout;
		}
		auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
		if (elapsed >= timeout) {
			throw TimeoutError("Task timed out");
		}
		return timeout - elapsed;
	};

	const Module* last = nullptr;
	int last_id = 0;
	for (const auto& module : side) {
		last_id = EvaluateModule(module, false, remaining());
		last = &module;
	}
	if (main) {
		last_id = EvaluateModule(*main, true, remaining());
		last = &*main;
	}

	// Try to get an entrypoint
	Executor::Lock lock{env};
	Context::Scope context_scope{env.DefaultContext()};
	TryCatch try_catch{env.GetIsolate()};
	std::optional<Function> entrypoint;
	auto info = FindModuleById(env, last_id);
	if (info) {
		Local<Object> module_namespace = Deref(info->handle)->GetModuleNamespace().As<Object>();
		try {
			entrypoint = ResolveEntrypoint(env, module_namespace, default_entrypoint);
		} catch (const ScriptException& cc_error) {
			throw RuntimeError(RenderException(try_catch, last->GetFilename()));
		}
	}
	return ModuleHandle{*last, last_id, env.GetId(), entrypoint};
}

} // namespace jsh
