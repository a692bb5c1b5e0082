#include "module_loader.h"
#include "fetch.h"
#include "isolate/generic/error.h"
#include "lib/log.h"

namespace jsh {
namespace {

constexpr const char* kExtensionScheme = "ext";

auto IsWebScheme(const std::string& scheme) -> bool {
	return scheme == "http" || scheme == "https";
}

} // anonymous namespace

ModuleLoader::ModuleLoader(LoaderOptions options) : options{std::move(options)}, caching{this->options.cache != nullptr} {
	if (!this->options.cache) {
		this->options.cache = std::make_shared<NullModuleCacheProvider>();
	}
	if (!this->options.transpiler) {
		this->options.transpiler = IdentityTranspiler();
	}
}

auto ModuleLoader::Resolve(const std::string& specifier, const std::string& referrer) -> ModuleSpecifier {
	ModuleSpecifier resolved = ResolveImport(specifier, referrer);
	std::string canonical = resolved.ToString();
	if (referrer == kRootReferrer) {
		whitelist.write()->insert(canonical);
	}

	const std::string& scheme = resolved.GetScheme();
	if (IsWebScheme(scheme)) {
		if (!options.allow_url_import) {
			throw PermissionError("web imports are not allowed here: " + specifier);
		}
	} else if (scheme == "file") {
		if (!options.allow_fs_import && !IsWhitelisted(resolved)) {
			throw PermissionError("requested module is not loaded: " + specifier);
		}
	} else if (scheme != kExtensionScheme) {
		throw ResolutionError("unrecognized schema for module import: " + specifier);
	}
	JSH_LOG_DEBUG("resolved %s from %s -> %s", specifier.c_str(), referrer.c_str(), canonical.c_str());
	return resolved;
}

void ModuleLoader::Load(uv_loop_t* loop, const ModuleSpecifier& specifier, LoadCallback callback) {
	const std::string& scheme = specifier.GetScheme();
	if (scheme == kExtensionScheme) {
		auto it = extension_modules.find(specifier.ToString());
		if (it == extension_modules.end()) {
			callback(std::make_exception_ptr(ResolutionError("extension module not found: " + specifier.ToString())), {});
		} else {
			callback(nullptr, ModuleSource{ModuleTypeFor(specifier), it->second});
		}
		return;
	}

	// Cache first
	auto cached = options.cache->Get(specifier);
	if (cached) {
		JSH_LOG_DEBUG("module cache hit: %s", specifier.ToString().c_str());
		callback(nullptr, std::move(cached));
		return;
	}

	auto on_fetch = [this, specifier, callback](std::exception_ptr error, std::string text) {
		if (error) {
			callback(error, {});
		} else {
			Deliver(specifier, std::move(text), callback);
		}
	};
	if (scheme == "file") {
		FetchFile(loop, specifier, std::move(on_fetch));
	} else if (IsWebScheme(scheme)) {
#ifdef JSH_URL_IMPORT
		FetchUrl(loop, specifier, std::move(on_fetch));
#else
		callback(std::make_exception_ptr(PermissionError(
			scheme + " imports are not allowed here: " + specifier.ToString() + " (built without URL import support)")), {});
#endif
	} else {
		callback(std::make_exception_ptr(PermissionError(
			scheme + " imports are not allowed here: " + specifier.ToString())), {});
	}
}

void ModuleLoader::Deliver(const ModuleSpecifier& specifier, std::string text, const LoadCallback& callback) {
	std::optional<ModuleSource> source;
	try {
		ModuleType type = ModuleTypeFor(specifier);
		// JSON is never transpiled
		std::string code = type == ModuleType::Json ? std::move(text) : Transpile(specifier, text);
		source.emplace(type, std::move(code));
		options.cache->Set(specifier, options.cache->CloneSource(specifier, *source));
	} catch (const Error& cc_error) {
		callback(std::current_exception(), {});
		return;
	}
	callback(nullptr, std::move(source));
}

auto ModuleLoader::Transpile(const ModuleSpecifier& specifier, const std::string& code) const -> std::string {
	try {
		return options.transpiler(specifier, code);
	} catch (const Error& cc_error) {
		throw;
	} catch (const std::exception& cc_error) {
		// Host transpilers may throw anything
		throw RuntimeError(specifier.ToString() + ": " + cc_error.what());
	}
}

void ModuleLoader::UpdateCodeCache(const ModuleSpecifier& specifier, ModuleSource::CodeCache code_cache) {
	auto source = options.cache->Get(specifier);
	if (source) {
		source->SetCodeCache(std::move(code_cache));
		options.cache->Set(specifier, std::move(*source));
	}
}

void ModuleLoader::RegisterExtensionModule(const ModuleSpecifier& specifier, std::string code) {
	extension_modules.insert_or_assign(specifier.ToString(), std::move(code));
}

auto ModuleLoader::IsWhitelisted(const ModuleSpecifier& specifier) -> bool {
	auto lock = whitelist.read();
	return lock->find(specifier.ToString()) != lock->end();
}

} // namespace jsh
