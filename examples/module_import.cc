// Loads a module from disk, along with everything it imports, and calls its entrypoint
//
//   module_import path/to/main.js [arguments...]

#include <api/jshost.h>

#include <chrono>
#include <cstdio>

// `using namespace` is omitted to better show which interfaces exist where.

int main(int argc, char** argv) {
	if (argc < 2) {
		std::fprintf(stderr, "usage: %s main.js [arguments...]\n", argv[0]);
		return 2;
	}

	// Local imports are allowed, transpiled sources are kept in memory for the life of the process.
	jsh::RuntimeOptions options;
	options.allow_fs_import = true;
	options.module_cache = std::make_shared<jsh::MemoryModuleCacheProvider>();
	options.timeout = std::chrono::seconds{5};
	options.default_entrypoint = "main";

	try {
		jsh::Runtime runtime{options};
		jsh::ModuleHandle handle = runtime.LoadModules(jsh::Module::Load(argv[1]));

		// Arguments are encoded when the call is made. Strings are the simplest thing to pass.
		jsh::Arguments arguments;
		for (int ii = 2; ii < argc; ++ii) {
			arguments.emplace_back(jsh::Arg(std::string{argv[ii]}));
		}

		// `Json` takes whatever the entrypoint returns
		jsh::Json result = runtime.CallEntrypoint<jsh::Json>(handle, arguments);
		std::printf("%s\n", result.Dump().c_str());
	} catch (const jsh::Error& error) {
		std::fprintf(stderr, "%s: %s\n", jsh::ErrorKindName(error.GetKind()), error.what());
		return 1;
	}
	return 0;
}
