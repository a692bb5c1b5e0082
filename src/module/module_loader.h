#pragma once
#include "module_cache.h"
#include "module_source.h"
#include "specifier.h"
#include "transpiler.h"
#include "lib/lockable.h"
#include <uv.h>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace jsh {

struct LoaderOptions {
	// Any `file:` import is allowed, not just the ones the host loaded
	bool allow_fs_import = false;
	bool allow_url_import = false;
	std::shared_ptr<ModuleCacheProvider> cache;
	Transpiler transpiler;
};

/**
 * Resolves and fetches modules for one runtime. Resolution enforces the import policy, fetching
 * runs on the runtime's libuv loop and goes through the module cache.
 */
class ModuleLoader {
	public:
		using LoadCallback = std::function<void(std::exception_ptr error, std::optional<ModuleSource> source)>;

		explicit ModuleLoader(LoaderOptions options);
		ModuleLoader(const ModuleLoader&) = delete;
		auto operator=(const ModuleLoader&) = delete;
		~ModuleLoader() = default;

		/**
		 * Canonicalizes `specifier` against `referrer` and checks that it may be imported. Modules
		 * requested by the host (`referrer` is `kRootReferrer`) are added to the whitelist. Throws
		 * `PermissionError` or `ResolutionError`.
		 */
		auto Resolve(const std::string& specifier, const std::string& referrer) -> ModuleSpecifier;

		// Fetches a resolved module. `callback` is invoked on the loop thread, possibly before this
		// returns.
		void Load(uv_loop_t* loop, const ModuleSpecifier& specifier, LoadCallback callback);

		// Applies the transpiler to source the host supplied directly
		auto Transpile(const ModuleSpecifier& specifier, const std::string& code) const -> std::string;

		// Stores v8's code cache next to a source which came through the cache
		void UpdateCodeCache(const ModuleSpecifier& specifier, ModuleSource::CodeCache code_cache);

		// Extension modules are served from memory under `ext:<extension>/<file>`
		void RegisterExtensionModule(const ModuleSpecifier& specifier, std::string code);

		auto IsWhitelisted(const ModuleSpecifier& specifier) -> bool;

		// False when no cache provider was configured, code caches aren't worth producing then
		auto IsCaching() const -> bool { return caching; }

	private:
		void Deliver(const ModuleSpecifier& specifier, std::string text, const LoadCallback& callback);

		LoaderOptions options;
		lockable_t<std::unordered_set<std::string>> whitelist;
		std::unordered_map<std::string, std::string> extension_modules;
		bool caching;
};

} // namespace jsh
