#include "module_graph.h"
#include "evaluation.h"
#include "module_loader.h"
#include "isolate/environment.h"
#include "isolate/stack_trace.h"
#include "isolate/util.h"
#include "lib/log.h"

using namespace v8;

namespace jsh {
namespace {

auto DescribeError(const std::exception_ptr& error) -> std::string {
	try {
		std::rethrow_exception(error);
	} catch (const std::exception& cc_error) {
		return cc_error.what();
	}
}

// Used as the `then` callback of dynamic imports, returns the namespace in `data`
void ReturnNamespace(const FunctionCallbackInfo<Value>& info) {
	info.GetReturnValue().Set(info.Data());
}

} // anonymous namespace

ModuleGraph::ModuleGraph(IsolateEnvironment& env, std::string root_specifier, bool resolve_namespace) :
		env{env},
		root_specifier{std::move(root_specifier)},
		resolver{env.GetIsolate(), Unmaybe(Promise::Resolver::New(env.DefaultContext()))},
		resolve_namespace{resolve_namespace} {}

auto ModuleGraph::LoadRoot(
	IsolateEnvironment& env, const ModuleSpecifier& specifier, const std::string& code, bool is_main
) -> std::shared_ptr<ModuleGraph> {
	std::shared_ptr<ModuleGraph> graph{new ModuleGraph{env, specifier.ToString(), false}};
	auto it = env.modules.find(graph->root_specifier);
	if (it == env.modules.end()) {
		ModuleSource source{ModuleType::JavaScript, env.module_loader->Transpile(specifier, code)};
		graph->root = graph->Compile(specifier, source, is_main, false);
	} else {
		// The same specifier was loaded before, that module is reused as it is
		JSH_LOG_DEBUG("module %s is already loaded", graph->root_specifier.c_str());
		graph->root = it->second;
	}
	graph->visited.insert(graph->root_specifier);
	graph->Start();
	return graph;
}

auto ModuleGraph::Import(IsolateEnvironment& env, const ModuleSpecifier& specifier) -> std::shared_ptr<ModuleGraph> {
	std::shared_ptr<ModuleGraph> graph{new ModuleGraph{env, specifier.ToString(), true}};
	graph->Start();
	return graph;
}

auto ModuleGraph::GetPromise() const -> Local<Promise> {
	return Deref(resolver)->GetPromise();
}

void ModuleGraph::InstallCallbacks(Isolate* isolate) {
	isolate->SetHostImportModuleDynamicallyCallback(ImportDynamically);
	isolate->SetHostInitializeImportMetaObjectCallback(InitializeImportMeta);
}

auto ModuleGraph::Compile(const ModuleSpecifier& specifier, const ModuleSource& source, bool is_main, bool produce_cache)
-> std::shared_ptr<ModuleInfo> {
	Isolate* isolate = env.GetIsolate();
	Local<Context> context = env.DefaultContext();
	std::string canonical = specifier.ToString();
	Local<v8::Module> module;
	if (source.GetType() == ModuleType::Json) {
		std::vector<Local<String>> export_names{Local<String>{StringTable::Get().default_}};
		module = v8::Module::CreateSyntheticModule(isolate, v8_string(canonical), export_names, EvaluateJson);
	} else {
		CodeCompilerHolder holder{canonical, source, true};
		holder.SetProduceCachedData(produce_cache);
		module = CompileModule(holder);
		if (holder.ShouldProduceCachedData()) {
			env.module_loader->UpdateCodeCache(specifier, CreateCodeCache(module));
		}
	}

	auto info = std::make_shared<ModuleInfo>(env, canonical, source.GetType(), module);
	info->is_main = is_main;
	if (source.GetType() == ModuleType::Json) {
		info->json_source = source.GetCode();
	}

	// Every import is checked against the loader's policy before the module becomes visible
	Local<FixedArray> module_requests = module->GetModuleRequests();
	for (int ii = 0; ii < module_requests->Length(); ++ii) {
		Local<ModuleRequest> request = module_requests->Get(context, ii).As<ModuleRequest>();
		auto raw = HandleCast<std::string>(request->GetSpecifier());
		if (info->FindRequest(raw) == nullptr) {
			info->requests.emplace_back(raw, env.module_loader->Resolve(raw, canonical).ToString());
		}
	}
	env.modules[canonical] = info;
	return info;
}

void ModuleGraph::Start() {
	// `pending` is held while visiting so loads which complete synchronously can't finish early
	++pending;
	if (root) {
		Visit(*root);
	} else {
		Enqueue(root_specifier);
	}
	if (--pending == 0 && !settled) {
		Finish();
	}
}

void ModuleGraph::Visit(const ModuleInfo& info) {
	// Instantiated modules already have their whole graph in place
	if (Deref(info.handle)->GetStatus() != v8::Module::kUninstantiated) {
		return;
	}
	for (const auto& request : info.requests) {
		if (settled) {
			return;
		}
		Enqueue(request.second);
	}
}

void ModuleGraph::Enqueue(const std::string& specifier) {
	if (!visited.insert(specifier).second) {
		return;
	}
	auto it = env.modules.find(specifier);
	if (it != env.modules.end()) {
		if (specifier == root_specifier) {
			root = it->second;
		}
		Visit(*it->second);
		return;
	}
	auto parsed = ModuleSpecifier::Parse(specifier);
	if (!parsed) {
		Fail(std::make_exception_ptr(ResolutionError("invalid module specifier: " + specifier)));
		return;
	}
	++pending;
	auto self = shared_from_this();
	ModuleSpecifier resolved = *parsed;
	env.module_loader->Load(env.GetScheduler().GetLoop(), resolved,
		[self, resolved](std::exception_ptr load_error, std::optional<ModuleSource> source) {
			self->OnLoaded(resolved, std::move(load_error), std::move(source));
		});
}

void ModuleGraph::OnLoaded(const ModuleSpecifier& specifier, std::exception_ptr load_error, std::optional<ModuleSource> source) {
	if (env.IsDisposing()) {
		return;
	}
	Isolate* isolate = env.GetIsolate();
	HandleScope handle_scope{isolate};
	Context::Scope context_scope{env.DefaultContext()};
	if (!settled) {
		TryCatch try_catch{isolate};
		try {
			if (load_error) {
				std::rethrow_exception(load_error);
			}
			std::string canonical = specifier.ToString();
			std::shared_ptr<ModuleInfo> info;
			auto it = env.modules.find(canonical);
			if (it == env.modules.end()) {
				info = Compile(specifier, *source, false, env.module_loader->IsCaching());
			} else {
				// Another graph got here first
				info = it->second;
			}
			if (canonical == root_specifier) {
				root = info;
			}
			Visit(*info);
		} catch (const Error& cc_error) {
			Fail(std::current_exception());
		} catch (const ScriptException& cc_error) {
			Fail(
				std::make_exception_ptr(RuntimeError(RenderException(try_catch, specifier.ToString()))),
				try_catch.HasCaught() ? try_catch.Exception() : Local<Value>{}
			);
		} catch (const std::exception& cc_error) {
			Fail(std::make_exception_ptr(RuntimeError(specifier.ToString() + ": " + cc_error.what())));
		}
	}
	if (--pending == 0 && !settled) {
		Finish();
	}
}

void ModuleGraph::Fail(std::exception_ptr host_error, Local<Value> reason) {
	if (settled) {
		return;
	}
	settled = true;
	error = std::move(host_error);
	Local<Context> context = env.DefaultContext();
	if (error) {
		JSH_LOG_DEBUG("failed to load %s: %s", root_specifier.c_str(), DescribeError(error).c_str());
		if (reason.IsEmpty()) {
			reason = Exception::Error(v8_string(DescribeError(error)));
		}
	} else if (reason.IsEmpty()) {
		reason = Undefined(env.GetIsolate());
	}
	if (Deref(resolver)->Reject(context, reason).IsNothing()) {
		JSH_LOG_WARNING("unable to reject import of %s", root_specifier.c_str());
	}
}

void ModuleGraph::Finish() {
	Isolate* isolate = env.GetIsolate();
	Local<Context> context = env.DefaultContext();
	if (!root) {
		Fail(std::make_exception_ptr(ResolutionError("requested module is not loaded: " + root_specifier)));
		return;
	}
	TryCatch try_catch{isolate};
	try {
		Local<v8::Module> module = Deref(root->handle);
		if (module->GetStatus() == v8::Module::kErrored) {
			Fail(nullptr, module->GetException());
			return;
		}
		Unmaybe(module->InstantiateModule(context, ResolveCallback));
		// `InstantiateModule` can report success with an exception pending
		if (try_catch.HasCaught()) {
			throw ScriptException();
		}
		Local<Value> result = Unmaybe(module->Evaluate(context));
		if (resolve_namespace) {
			Local<v8::Function> then = Unmaybe(v8::Function::New(context, ReturnNamespace, module->GetModuleNamespace()));
			result = Unmaybe(result.As<Promise>()->Then(context, then));
		}
		Unmaybe(Deref(resolver)->Resolve(context, result));
		settled = true;
	} catch (const ScriptException& cc_error) {
		if (try_catch.HasTerminated()) {
			// The task driving the loop reports the timeout
			Fail(std::make_exception_ptr(TimeoutError("Task timed out")));
		} else {
			Fail(
				std::make_exception_ptr(RuntimeError(RenderException(try_catch, root_specifier))),
				try_catch.HasCaught() ? try_catch.Exception() : Local<Value>{}
			);
		}
	} catch (const Error& cc_error) {
		Fail(std::current_exception());
	}
}

/**
 * v8 callbacks
 */
auto ModuleGraph::ResolveCallback(
	Local<Context> /*context*/,
	Local<String> specifier,
	Local<FixedArray> /*import_assertions*/,
	Local<v8::Module> referrer
) -> MaybeLocal<v8::Module> {
	MaybeLocal<v8::Module> result;
	detail::RunBarrier([&]() {
		auto raw = HandleCast<std::string>(specifier);
		ModuleInfo* found = LookupModuleInfo(referrer);
		const std::string* canonical = found == nullptr ? nullptr : found->FindRequest(raw);
		if (canonical != nullptr) {
			auto& modules = found->env.modules;
			auto it = modules.find(*canonical);
			if (it != modules.end()) {
				result = Deref(it->second->handle);
				return;
			}
		}
		throw ResolutionError("requested module is not loaded: " + raw);
	});
	return result;
}

auto ModuleGraph::ImportDynamically(
	Local<Context> context,
	Local<Data> /*host_defined_options*/,
	Local<Value> resource_name,
	Local<String> specifier,
	Local<FixedArray> /*import_assertions*/
) -> MaybeLocal<Promise> {
	MaybeLocal<Promise> result;
	detail::RunBarrier([&]() {
		IsolateEnvironment& env = *IsolateEnvironment::GetCurrent();
		Local<Promise::Resolver> import_resolver = Unmaybe(Promise::Resolver::New(context));
		try {
			// Scripts without a name have no referrer, only absolute imports work from those
			std::string referrer = resource_name->IsString() ? HandleCast<std::string>(resource_name) : std::string{};
			ModuleSpecifier resolved = env.module_loader->Resolve(HandleCast<std::string>(specifier), referrer);
			auto graph = Import(env, resolved);
			Unmaybe(import_resolver->Resolve(context, graph->GetPromise()));
		} catch (const Error& cc_error) {
			Unmaybe(import_resolver->Reject(context, Exception::Error(v8_string(cc_error.what()))));
		}
		result = import_resolver->GetPromise();
	});
	return result;
}

void ModuleGraph::InitializeImportMeta(Local<Context> context, Local<v8::Module> module, Local<Object> meta) {
	detail::RunBarrier([&]() {
		ModuleInfo* found = LookupModuleInfo(module);
		if (found != nullptr) {
			Isolate* isolate = context->GetIsolate();
			Unmaybe(meta->CreateDataProperty(context, StringTable::Get().url, v8_string(found->specifier)));
			Unmaybe(meta->CreateDataProperty(context, StringTable::Get().main, Boolean::New(isolate, found->is_main)));
		}
	});
}

auto ModuleGraph::EvaluateJson(Local<Context> context, Local<v8::Module> module) -> MaybeLocal<Value> {
	MaybeLocal<Value> result;
	detail::RunBarrier([&]() {
		ModuleInfo* found = LookupModuleInfo(module);
		if (found == nullptr) {
			throw RuntimeError("JSON module was not registered");
		}
		Isolate* isolate = context->GetIsolate();
		Local<Value> value = Unmaybe(JSON::Parse(context, v8_string(found->json_source)));
		Unmaybe(module->SetSyntheticModuleExport(isolate, StringTable::Get().default_, value));
		Local<Promise::Resolver> done = Unmaybe(Promise::Resolver::New(context));
		Unmaybe(done->Resolve(context, Undefined(isolate)));
		result = done->GetPromise();
	});
	return result;
}

} // namespace jsh
