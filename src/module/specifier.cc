#include "specifier.h"
#include "isolate/generic/error.h"
#include <cctype>
#include <filesystem>
#include <vector>

namespace jsh {
namespace {

auto SchemeLength(const std::string& url) -> size_t {
	if (url.empty() || std::isalpha(static_cast<unsigned char>(url[0])) == 0) {
		return 0;
	}
	for (size_t ii = 1; ii < url.size(); ++ii) {
		char ch = url[ii];
		if (ch == ':') {
			// Single letters are drive names, not schemes
			return ii > 1 ? ii : 0;
		} else if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '+' && ch != '-' && ch != '.') {
			return 0;
		}
	}
	return 0;
}

// Removes `.` and `..` segments
auto NormalizePath(const std::string& path) -> std::string {
	std::vector<std::string> segments;
	size_t start = 0;
	bool absolute = !path.empty() && path[0] == '/';
	while (start <= path.size()) {
		size_t end = path.find('/', start);
		if (end == std::string::npos) {
			end = path.size();
		}
		std::string segment = path.substr(start, end - start);
		bool last = end == path.size();
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
			if (last) {
				segments.emplace_back();
			}
		} else if (segment == ".") {
			if (last) {
				segments.emplace_back();
			}
		} else if (!segment.empty() || last) {
			segments.emplace_back(std::move(segment));
		}
		start = end + 1;
	}
	std::string result = absolute ? "/" : "";
	for (size_t ii = 0; ii < segments.size(); ++ii) {
		if (ii != 0) {
			result += '/';
		}
		result += segments[ii];
	}
	return result;
}

auto SplitSuffix(std::string& path) -> std::string {
	size_t pos = path.find_first_of("?#");
	if (pos == std::string::npos) {
		return {};
	}
	std::string suffix = path.substr(pos);
	path.resize(pos);
	return suffix;
}

auto HexValue(char ch) -> int;

// `keep_escapes` leaves existing `%XX` sequences alone, for paths which are already URLs
auto PercentEncodePath(const std::string& path, bool keep_escapes) -> std::string {
	static constexpr const char* hex = "0123456789ABCDEF";
	std::string result;
	for (size_t ii = 0; ii < path.size(); ++ii) {
		char ch = path[ii];
		auto byte = static_cast<unsigned char>(ch);
		if (std::isalnum(byte) != 0 || std::string{"/-._~!$&'()*+,;=:@"}.find(ch) != std::string::npos) {
			result += ch;
		} else if (
			keep_escapes && ch == '%' && ii + 2 < path.size() &&
			HexValue(path[ii + 1]) >= 0 && HexValue(path[ii + 2]) >= 0
		) {
			result += ch;
		} else {
			result += '%';
			result += hex[byte >> 4];
			result += hex[byte & 0xf];
		}
	}
	return result;
}

auto HexValue(char ch) -> int {
	if (ch >= '0' && ch <= '9') {
		return ch - '0';
	} else if (ch >= 'a' && ch <= 'f') {
		return ch - 'a' + 10;
	} else if (ch >= 'A' && ch <= 'F') {
		return ch - 'A' + 10;
	}
	return -1;
}

auto WorkingDirectory() -> std::string {
	std::error_code error;
	auto cwd = std::filesystem::current_path(error);
	if (error) {
		throw ResolutionError("unable to read the working directory: " + error.message());
	}
	return cwd.generic_string();
}

} // anonymous namespace

auto ModuleSpecifier::Parse(const std::string& url) -> std::optional<ModuleSpecifier> {
	size_t scheme_length = SchemeLength(url);
	if (scheme_length == 0) {
		return std::nullopt;
	}
	ModuleSpecifier specifier;
	for (size_t ii = 0; ii < scheme_length; ++ii) {
		specifier.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url[ii])));
	}
	std::string rest = url.substr(scheme_length + 1);
	if (rest.compare(0, 2, "//") == 0) {
		specifier.has_authority = true;
		size_t end = rest.find_first_of("/?#", 2);
		if (end == std::string::npos) {
			end = rest.size();
		}
		specifier.authority = rest.substr(2, end - 2);
		rest = rest.substr(end);
		if (rest.empty() || rest[0] != '/') {
			rest.insert(0, "/");
		}
	}
	specifier.suffix = SplitSuffix(rest);
	specifier.path = PercentEncodePath(NormalizePath(rest), true);
	return specifier;
}

auto ModuleSpecifier::ToString() const -> std::string {
	std::string result = scheme + ":";
	if (has_authority) {
		result += "//" + authority;
	}
	return result + path + suffix;
}

auto ModuleSpecifier::ToFilePath() const -> std::string {
	std::string result;
	for (size_t ii = 0; ii < path.size(); ++ii) {
		if (path[ii] == '%' && ii + 2 < path.size() && HexValue(path[ii + 1]) >= 0 && HexValue(path[ii + 2]) >= 0) {
			result += static_cast<char>(HexValue(path[ii + 1]) * 16 + HexValue(path[ii + 2]));
			ii += 2;
		} else {
			result += path[ii];
		}
	}
	return result;
}

auto ResolvePath(const std::string& path) -> ModuleSpecifier {
	std::string absolute = std::filesystem::path{path}.generic_string();
	if (absolute.empty() || absolute[0] != '/') {
		absolute = WorkingDirectory() + "/" + absolute;
	}
	ModuleSpecifier specifier;
	specifier.scheme = "file";
	specifier.has_authority = true;
	specifier.path = PercentEncodePath(NormalizePath(absolute), false);
	return specifier;
}

auto ResolveImport(const std::string& specifier, const std::string& referrer) -> ModuleSpecifier {
	auto absolute = ModuleSpecifier::Parse(specifier);
	if (absolute) {
		return *absolute;
	}
	// The host names modules by filesystem path
	if (referrer == kRootReferrer) {
		return ResolvePath(specifier);
	}
	bool relative =
		specifier.compare(0, 1, "/") == 0 ||
		specifier.compare(0, 2, "./") == 0 ||
		specifier.compare(0, 3, "../") == 0;
	if (!relative) {
		throw ResolutionError(
			"Relative import path \"" + specifier + "\" not prefixed with / or ./ or ../ from \"" + referrer + "\"");
	}

	auto parsed = ModuleSpecifier::Parse(referrer);
	if (!parsed) {
		throw ResolutionError("invalid referrer \"" + referrer + "\" for import \"" + specifier + "\"");
	}
	ModuleSpecifier base = std::move(*parsed);

	std::string path = specifier;
	std::string suffix = SplitSuffix(path);
	if (path[0] != '/') {
		size_t slash = base.path.rfind('/');
		path = (slash == std::string::npos ? std::string{} : base.path.substr(0, slash + 1)) + path;
	}
	base.path = PercentEncodePath(NormalizePath(path), true);
	base.suffix = suffix;
	return base;
}

} // namespace jsh
