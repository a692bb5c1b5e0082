#pragma once
#include <string>
#include <vector>

namespace jsh {

/**
 * A unit of ESM source code. The filename may be relative, it is resolved against the working
 * directory when the module is loaded.
 */
class Module {
	public:
		Module() = default;
		Module(std::string filename, std::string contents) :
			filename{std::move(filename)}, contents{std::move(contents)} {}

		// Reads a module from disk. Throws `IoError`.
		static auto Load(const std::string& path) -> Module;
		// Every `.js`, `.mjs` and `.ts` file in a directory, ordered by name
		static auto LoadDir(const std::string& directory) -> std::vector<Module>;

		auto GetFilename() const -> const std::string& { return filename; }
		auto GetContents() const -> const std::string& { return contents; }

		auto operator==(const Module& right) const -> bool {
			return filename == right.filename && contents == right.contents;
		}
		auto operator!=(const Module& right) const -> bool {
			return !(*this == right);
		}

	private:
		std::string filename;
		std::string contents;
};

// Module embedded in the binary, see `JSH_MODULE`
class StaticModule {
	public:
		constexpr StaticModule(const char* filename, const char* contents) :
			filename{filename}, contents{contents} {}

		auto ToModule() const -> Module {
			return Module{filename, contents};
		}

	private:
		const char* filename;
		const char* contents;
};

} // namespace jsh

#define JSH_MODULE(filename, contents) ::jsh::StaticModule{filename, contents}
