#pragma once
#include <optional>
#include <string>

namespace jsh {

/**
 * Canonical absolute module locator, ie `file:///home/user/main.js`. This is the key for the
 * module cache, the module map and the loader's whitelist.
 */
class ModuleSpecifier {
	public:
		// Parses an absolute URL. Returns nothing if `url` has no scheme.
		static auto Parse(const std::string& url) -> std::optional<ModuleSpecifier>;

		auto GetScheme() const -> const std::string& { return scheme; }
		auto GetAuthority() const -> const std::string& { return authority; }
		auto GetPath() const -> const std::string& { return path; }
		auto HasAuthority() const -> bool { return has_authority; }
		auto ToString() const -> std::string;

		// Local filesystem path of a `file:` specifier, with percent escapes decoded
		auto ToFilePath() const -> std::string;

		auto operator==(const ModuleSpecifier& right) const -> bool { return ToString() == right.ToString(); }
		auto operator!=(const ModuleSpecifier& right) const -> bool { return !(*this == right); }

	private:
		friend auto ResolveImport(const std::string& specifier, const std::string& referrer) -> ModuleSpecifier;
		friend auto ResolvePath(const std::string& path) -> ModuleSpecifier;

		std::string scheme;
		std::string authority;
		std::string path;
		// Query and fragment, kept verbatim
		std::string suffix;
		bool has_authority = false;
};

// Referrer used for imports requested by the host rather than by another module
constexpr const char* kRootReferrer = ".";

/**
 * Resolves an import specifier against the module which requested it. Relative specifiers must
 * start with `/`, `./` or `../`. With `kRootReferrer` the specifier is a filesystem path, ie a
 * host module's filename, and resolves against the working directory. Throws `ResolutionError`.
 */
auto ResolveImport(const std::string& specifier, const std::string& referrer) -> ModuleSpecifier;

// Turns a filesystem path into a `file:` specifier, relative to the working directory
auto ResolvePath(const std::string& path) -> ModuleSpecifier;

} // namespace jsh
