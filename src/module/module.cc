#include "module.h"
#include "isolate/generic/error.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace jsh {

auto Module::Load(const std::string& path) -> Module {
	std::ifstream stream{path, std::ios::in | std::ios::binary};
	if (!stream) {
		throw IoError("failed to open " + path);
	}
	std::ostringstream buffer;
	buffer << stream.rdbuf();
	if (stream.bad()) {
		throw IoError("failed to read " + path);
	}
	return Module{path, buffer.str()};
}

auto Module::LoadDir(const std::string& directory) -> std::vector<Module> {
	std::error_code error;
	std::vector<std::string> paths;
	for (std::filesystem::directory_iterator it{directory, error}, end; !error && it != end; it.increment(error)) {
		auto extension = it->path().extension().string();
		if (it->is_regular_file() && (extension == ".js" || extension == ".mjs" || extension == ".ts")) {
			paths.emplace_back(it->path().string());
		}
	}
	if (error) {
		throw IoError(directory + ": " + error.message());
	}
	std::sort(paths.begin(), paths.end());
	std::vector<Module> modules;
	modules.reserve(paths.size());
	for (const auto& path : paths) {
		modules.emplace_back(Load(path));
	}
	return modules;
}

} // namespace jsh
