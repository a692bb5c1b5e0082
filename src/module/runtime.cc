#include "runtime.h"
#include "evaluation.h"
#include "execution_coordinator.h"
#include "module_graph.h"
#include "module_loader.h"
#include "isolate/environment.h"
#include "isolate/stack_trace.h"
#include "isolate/util.h"
#include "lib/log.h"

using namespace v8;

namespace jsh {

Runtime::Runtime(RuntimeOptions options) :
		options{std::move(options)},
		env{std::make_unique<IsolateEnvironment>(this->options.memory_limit_mb)} {
	env->module_loader = std::make_shared<ModuleLoader>(LoaderOptions{
		this->options.allow_fs_import,
		this->options.allow_url_import,
		this->options.module_cache,
		this->options.transpiler,
	});
	coordinator = std::make_unique<ExecutionCoordinator>(*env, this->options.timeout, this->options.default_entrypoint);
	StartExtensions();
}

Runtime::~Runtime() {
	coordinator.reset();
	env.reset();
}

void Runtime::StartExtensions() {
	auto extensions = BuiltinExtensions();
	extensions.insert(extensions.end(), options.extensions.begin(), options.extensions.end());

	// Native bindings first, they are visible to every extension module
	std::vector<Module> modules;
	{
		Executor::Lock lock{*env};
		Local<Context> context = env->DefaultContext();
		Context::Scope context_scope{context};
		TryCatch try_catch{env->GetIsolate()};
		ModuleGraph::InstallCallbacks(env->GetIsolate());
		for (auto& extension : extensions) {
			JSH_LOG_DEBUG("installing extension %s", extension->GetName().c_str());
			try {
				extension->Install(context, context->Global());
			} catch (const ScriptException& cc_error) {
				throw RuntimeError(RenderException(try_catch, "ext:" + extension->GetName()));
			}
			for (auto& module : extension->GetModules()) {
				std::string specifier = ExtensionModuleSpecifier(*extension, module);
				auto parsed = ModuleSpecifier::Parse(specifier);
				if (!parsed) {
					throw ResolutionError("invalid extension module specifier: " + specifier);
				}
				env->module_loader->RegisterExtensionModule(*parsed, module.GetContents());
				modules.emplace_back(specifier, module.GetContents());
			}
		}
	}
	for (auto& module : modules) {
		coordinator->EvaluateModule(module, false, options.timeout);
	}
}

auto Runtime::LoadModules(const std::optional<Module>& main, const std::vector<Module>& side) -> ModuleHandle {
	return coordinator->LoadModules(main, side);
}

auto Runtime::LoadModule(const Module& module) -> ModuleHandle {
	return coordinator->LoadModules(std::nullopt, {module});
}

auto Runtime::GetId() const -> uint64_t {
	return env->GetId();
}

auto Runtime::GetNamespace(const ModuleHandle& handle) -> Local<Object> {
	if (handle.GetRuntimeId() != env->GetId()) {
		throw InvalidHandleError(handle.GetModule().GetFilename() + " was loaded by a different runtime");
	}
	auto info = FindModuleById(*env, handle.GetId());
	if (!info) {
		throw InvalidHandleError(handle.GetModule().GetFilename() + " is not loaded");
	}
	return Deref(info->handle)->GetModuleNamespace().As<Object>();
}

void Runtime::EvalImpl(const std::string& expression, const Sink& sink) {
	CallbackTask task{"<eval>", [&]() {
		CodeCompilerHolder holder{"<eval>", expression, false};
		Local<Script> script = CompileScript(holder);
		return Unmaybe(script->Run(env->DefaultContext()));
	}, sink};
	coordinator->RunAsyncTask(task);
}

void Runtime::GetValueImpl(const ModuleHandle& handle, const std::string& name, const Sink& sink) {
	CallbackTask task{handle.GetModule().GetFilename(), [&]() {
		return GetValueRef(env->DefaultContext(), GetNamespace(handle), name);
	}, sink};
	coordinator->RunAsyncTask(task);
}

void Runtime::CallFunctionImpl(const ModuleHandle& handle, const std::string& name, const Arguments& arguments, const Sink& sink) {
	CallbackTask task{handle.GetModule().GetFilename(), [&]() {
		Local<Context> context = env->DefaultContext();
		Local<Object> module_namespace = GetNamespace(handle);
		Local<v8::Function> function = jsh::GetFunctionByName(context, module_namespace, name);
		return CallFunctionByRef(context, function, module_namespace, arguments);
	}, sink};
	coordinator->RunAsyncTask(task);
}

void Runtime::CallStoredFunctionImpl(const ModuleHandle& handle, const Function& function, const Arguments& arguments, const Sink& sink) {
	CallbackTask task{handle.GetModule().GetFilename(), [&]() {
		Local<Context> context = env->DefaultContext();
		Local<Object> module_namespace = GetNamespace(handle);
		return CallFunctionByRef(context, env->function_table->Get(function), module_namespace, arguments);
	}, sink};
	coordinator->RunAsyncTask(task);
}

auto Runtime::GetFunctionByName(const ModuleHandle& handle, const std::string& name) -> Function {
	std::optional<Function> result;
	CallbackTask task{handle.GetModule().GetFilename(), [&]() -> Local<Value> {
		return jsh::GetFunctionByName(env->DefaultContext(), GetNamespace(handle), name);
	}, [&](Local<Value> value) {
		result = HandleCast<Function>(value);
	}};
	coordinator->RunAsyncTask(task);
	return *result;
}

void Runtime::ReleaseFunction(const Function& function) {
	CallbackTask task{"<release>", [&]() -> Local<Value> {
		env->function_table->Release(function);
		return Undefined(env->GetIsolate());
	}, [](Local<Value> /* value */) {}};
	coordinator->RunAsyncTask(task);
}

auto Runtime::IsCallable(const ModuleHandle& handle, const std::string& name) -> bool {
	bool callable = false;
	CallbackTask task{handle.GetModule().GetFilename(), [&]() -> Local<Value> {
		try {
			return Boolean::New(env->GetIsolate(), GetValueRef(env->DefaultContext(), GetNamespace(handle), name)->IsFunction());
		} catch (const ValueNotFoundError& cc_error) {
			return Boolean::New(env->GetIsolate(), false);
		}
	}, [&](Local<Value> value) {
		callable = value->IsTrue();
	}};
	coordinator->RunAsyncTask(task);
	return callable;
}

auto Runtime::GetStoredFunctionCount() const -> size_t {
	return env->function_table->Size();
}

auto Runtime::GetExportNames(const ModuleHandle& handle) -> std::vector<std::string> {
	std::vector<std::string> names;
	CallbackTask task{handle.GetModule().GetFilename(), [&]() -> Local<Value> {
		return Unmaybe(GetNamespace(handle)->GetOwnPropertyNames(env->DefaultContext()));
	}, [&](Local<Value> value) {
		names = Decode<std::vector<std::string>>(value);
	}};
	coordinator->RunAsyncTask(task);
	return names;
}

} // namespace jsh
