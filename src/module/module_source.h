#pragma once
#include "specifier.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jsh {

enum class ModuleType { JavaScript, Json };

// Specifiers whose path ends in `.json` are JSON modules, everything else is JavaScript
auto ModuleTypeFor(const ModuleSpecifier& specifier) -> ModuleType;

/**
 * Source text of a module as handed to v8, after transpilation. `code_cache` holds v8's compiled
 * code cache when one has been produced. Copies are fully independent.
 */
class ModuleSource {
	public:
		using CodeCache = std::vector<uint8_t>;

		ModuleSource(ModuleType type, std::string code, std::optional<CodeCache> code_cache = std::nullopt) :
			type{type}, code{std::move(code)}, code_cache{std::move(code_cache)} {}

		auto GetType() const -> ModuleType { return type; }
		auto GetCode() const -> const std::string& { return code; }
		auto GetCodeCache() const -> const std::optional<CodeCache>& { return code_cache; }
		void SetCodeCache(CodeCache cache) { code_cache = std::move(cache); }

		auto operator==(const ModuleSource& right) const -> bool {
			return type == right.type && code == right.code && code_cache == right.code_cache;
		}

	private:
		ModuleType type;
		std::string code;
		std::optional<CodeCache> code_cache;
};

} // namespace jsh
