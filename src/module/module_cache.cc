#include "module_cache.h"
#include "lib/log.h"
#include <cctype>
#include <fstream>
#include <sstream>

namespace jsh {
namespace {

// Keeps a path segment to a safe character set so no specifier can escape the cache root
auto EscapeSegment(const std::string& segment) -> std::string {
	static constexpr const char* hex = "0123456789ABCDEF";
	if (segment == ".") {
		return "%2E";
	} else if (segment == "..") {
		return "%2E%2E";
	}
	std::string result;
	for (char ch : segment) {
		auto byte = static_cast<unsigned char>(ch);
		if (std::isalnum(byte) != 0 || ch == '.' || ch == '_' || ch == '-') {
			result += ch;
		} else {
			result += '%';
			result += hex[byte >> 4];
			result += hex[byte & 0xf];
		}
	}
	return result;
}

} // anonymous namespace

/**
 * MemoryModuleCacheProvider implementation
 */
void MemoryModuleCacheProvider::Set(const ModuleSpecifier& specifier, ModuleSource source) {
	auto lock = cache.write();
	lock->insert_or_assign(specifier.ToString(), std::move(source));
}

auto MemoryModuleCacheProvider::Get(const ModuleSpecifier& specifier) -> std::optional<ModuleSource> {
	auto lock = cache.read();
	auto it = lock->find(specifier.ToString());
	if (it == lock->end()) {
		return std::nullopt;
	}
	return CloneSource(specifier, it->second);
}

/**
 * FsModuleCacheProvider implementation
 */
auto FsModuleCacheProvider::GetPath(const ModuleSpecifier& specifier) const -> std::filesystem::path {
	std::filesystem::path path = root / EscapeSegment(specifier.GetScheme());
	if (!specifier.GetAuthority().empty()) {
		path /= EscapeSegment(specifier.GetAuthority());
	}
	std::string rest = specifier.ToString().substr(specifier.GetScheme().size() + 1);
	if (specifier.HasAuthority()) {
		rest = rest.substr(2 + specifier.GetAuthority().size());
	}
	size_t start = 0;
	while (start < rest.size()) {
		size_t end = rest.find('/', start);
		if (end == std::string::npos) {
			end = rest.size();
		}
		if (end > start) {
			path /= EscapeSegment(rest.substr(start, end - start));
		}
		start = end + 1;
	}
	return path;
}

void FsModuleCacheProvider::Set(const ModuleSpecifier& specifier, ModuleSource source) {
	auto path = GetPath(specifier);
	std::error_code error;
	std::filesystem::create_directories(path.parent_path(), error);
	if (error) {
		JSH_LOG_WARNING("module cache: %s: %s", path.parent_path().c_str(), error.message().c_str());
	} else {
		std::ofstream stream{path, std::ios::out | std::ios::binary | std::ios::trunc};
		stream << source.GetCode();
		if (!stream) {
			JSH_LOG_WARNING("module cache: failed to write %s", path.c_str());
		}
	}
	cache.Set(specifier, std::move(source));
}

auto FsModuleCacheProvider::Get(const ModuleSpecifier& specifier) -> std::optional<ModuleSource> {
	auto source = cache.Get(specifier);
	if (source) {
		return source;
	}
	std::ifstream stream{GetPath(specifier), std::ios::in | std::ios::binary};
	if (!stream) {
		return std::nullopt;
	}
	std::ostringstream buffer;
	buffer << stream.rdbuf();
	if (stream.bad()) {
		return std::nullopt;
	}
	ModuleSource loaded{ModuleTypeFor(specifier), buffer.str()};
	cache.Set(specifier, CloneSource(specifier, loaded));
	return loaded;
}

} // namespace jsh
