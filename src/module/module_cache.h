#pragma once
#include "module_source.h"
#include "specifier.h"
#include "lib/lockable.h"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace jsh {

/**
 * Storage for transpiled module sources, keyed by specifier. Implementations must be safe to call
 * from several threads. Sources handed out by `Get` are independent copies.
 */
class ModuleCacheProvider {
	public:
		ModuleCacheProvider() = default;
		ModuleCacheProvider(const ModuleCacheProvider&) = delete;
		auto operator=(const ModuleCacheProvider&) = delete;
		virtual ~ModuleCacheProvider() = default;

		virtual void Set(const ModuleSpecifier& specifier, ModuleSource source) = 0;
		virtual auto Get(const ModuleSpecifier& specifier) -> std::optional<ModuleSource> = 0;

		// Deep copy of a source, used before anything is stored or returned
		virtual auto CloneSource(const ModuleSpecifier& /*specifier*/, const ModuleSource& source) const -> ModuleSource {
			return ModuleSource{source.GetType(), std::string{source.GetCode()}, source.GetCodeCache()};
		}
};

// Stores nothing, this is the default
class NullModuleCacheProvider final : public ModuleCacheProvider {
	public:
		void Set(const ModuleSpecifier& /*specifier*/, ModuleSource /*source*/) final {}
		auto Get(const ModuleSpecifier& /*specifier*/) -> std::optional<ModuleSource> final { return std::nullopt; }
};

class MemoryModuleCacheProvider final : public ModuleCacheProvider {
	public:
		void Set(const ModuleSpecifier& specifier, ModuleSource source) final;
		auto Get(const ModuleSpecifier& specifier) -> std::optional<ModuleSource> final;

	private:
		lockable_t<std::unordered_map<std::string, ModuleSource>> cache;
};

/**
 * Write-through cache which keeps one file per module under `root`, in front of which sits a
 * memory cache. Only the source text is persisted.
 */
class FsModuleCacheProvider final : public ModuleCacheProvider {
	public:
		explicit FsModuleCacheProvider(std::filesystem::path root) : root{std::move(root)} {}

		void Set(const ModuleSpecifier& specifier, ModuleSource source) final;
		auto Get(const ModuleSpecifier& specifier) -> std::optional<ModuleSource> final;

		// Location of the cache file for a specifier
		auto GetPath(const ModuleSpecifier& specifier) const -> std::filesystem::path;

	private:
		std::filesystem::path root;
		MemoryModuleCacheProvider cache;
};

} // namespace jsh
