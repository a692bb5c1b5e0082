#include "module/module_loader.h"
#include "isolate/generic/error.h"
#include "test_util.h"
#include <uv.h>
#include <gtest/gtest.h>

namespace jsh {
namespace {

class ModuleLoaderTest : public test::TempDirTest {
	protected:
		void SetUp() override {
			TempDirTest::SetUp();
			ASSERT_EQ(uv_loop_init(&loop), 0);
		}

		void TearDown() override {
			uv_run(&loop, UV_RUN_DEFAULT);
			uv_loop_close(&loop);
			TempDirTest::TearDown();
		}

		// Runs a load to completion and returns the source, rethrowing any error
		auto LoadSync(ModuleLoader& loader, const ModuleSpecifier& specifier) -> ModuleSource {
			std::exception_ptr error;
			std::optional<ModuleSource> result;
			bool done = false;
			loader.Load(&loop, specifier, [&](std::exception_ptr load_error, std::optional<ModuleSource> source) {
				error = load_error;
				result = std::move(source);
				done = true;
			});
			uv_run(&loop, UV_RUN_DEFAULT);
			EXPECT_TRUE(done);
			if (error) {
				std::rethrow_exception(error);
			}
			return std::move(*result);
		}

		uv_loop_t loop{};
};

TEST_F(ModuleLoaderTest, HostModulesAreWhitelisted) {
	ModuleLoader loader{LoaderOptions{}};
	std::string main = (dir / "main.js").string();
	std::string other = (dir / "other.js").string();
	auto resolved = loader.Resolve(main, kRootReferrer);
	EXPECT_TRUE(loader.IsWhitelisted(resolved));

	// Already loaded by the host, so a module may import it
	EXPECT_EQ(loader.Resolve("./main.js", ResolvePath(other).ToString()), resolved);

	try {
		loader.Resolve("./other.js", resolved.ToString());
		FAIL() << "expected a PermissionError";
	} catch (const PermissionError& error) {
		EXPECT_STREQ(error.what(), "requested module is not loaded: ./other.js");
	}
}

TEST_F(ModuleLoaderTest, BareHostFilenames) {
	ModuleLoader loader{LoaderOptions{}};
	auto resolved = loader.Resolve("main.js", kRootReferrer);
	EXPECT_EQ(resolved, ResolvePath("main.js"));
	EXPECT_TRUE(loader.IsWhitelisted(resolved));
	EXPECT_EQ(loader.Resolve("./main.js", ResolvePath("other.js").ToString()), resolved);
}

TEST_F(ModuleLoaderTest, WhitelistOnlyGrowsFromHost) {
	LoaderOptions options;
	options.allow_fs_import = true;
	ModuleLoader loader{options};
	auto main = loader.Resolve((dir / "main.js").string(), kRootReferrer);
	auto imported = loader.Resolve("./dep.js", main.ToString());
	EXPECT_FALSE(loader.IsWhitelisted(imported));
}

TEST_F(ModuleLoaderTest, WebImportsNeedPermission) {
	ModuleLoader loader{LoaderOptions{}};
	try {
		loader.Resolve("https://example.com/mod.js", "file:///src/main.js");
		FAIL() << "expected a PermissionError";
	} catch (const PermissionError& error) {
		EXPECT_STREQ(error.what(), "web imports are not allowed here: https://example.com/mod.js");
	}

	LoaderOptions options;
	options.allow_url_import = true;
	ModuleLoader permissive{options};
	EXPECT_EQ(permissive.Resolve("https://example.com/mod.js", "file:///src/main.js").GetScheme(), "https");
}

TEST_F(ModuleLoaderTest, UnknownSchemes) {
	ModuleLoader loader{LoaderOptions{}};
	try {
		loader.Resolve("data:text/javascript,export default 1", "file:///src/main.js");
		FAIL() << "expected a ResolutionError";
	} catch (const ResolutionError& error) {
		EXPECT_STREQ(error.what(), "unrecognized schema for module import: data:text/javascript,export default 1");
	}
}

TEST_F(ModuleLoaderTest, LoadsFilesAndTranspiles) {
	std::string path = WriteFile("mod.ts", "export const value: number = 1;");
	LoaderOptions options;
	options.transpiler = [](const ModuleSpecifier& /*specifier*/, const std::string& code) {
		std::string result = code;
		auto pos = result.find(": number");
		if (pos != std::string::npos) {
			result.erase(pos, 8);
		}
		return result;
	};
	ModuleLoader loader{options};
	auto source = LoadSync(loader, ResolvePath(path));
	EXPECT_EQ(source.GetCode(), "export const value = 1;");
	EXPECT_EQ(source.GetType(), ModuleType::JavaScript);
}

TEST_F(ModuleLoaderTest, JsonIsNotTranspiled) {
	std::string path = WriteFile("data.json", "{\"a\": 1}");
	LoaderOptions options;
	options.transpiler = [](const ModuleSpecifier& /*specifier*/, const std::string& /*code*/) -> std::string {
		throw RuntimeError("transpiler should not run");
	};
	ModuleLoader loader{options};
	auto source = LoadSync(loader, ResolvePath(path));
	EXPECT_EQ(source.GetType(), ModuleType::Json);
	EXPECT_EQ(source.GetCode(), "{\"a\": 1}");
}

TEST_F(ModuleLoaderTest, TranspilerExceptionsAreRuntimeErrors) {
	std::string path = WriteFile("broken.ts", "export const value: number = 1;");
	LoaderOptions options;
	options.transpiler = [](const ModuleSpecifier& /*specifier*/, const std::string& /*code*/) -> std::string {
		throw std::runtime_error("unexpected token");
	};
	ModuleLoader loader{options};
	try {
		LoadSync(loader, ResolvePath(path));
		FAIL() << "expected a RuntimeError";
	} catch (const RuntimeError& error) {
		EXPECT_NE(std::string{error.what()}.find("unexpected token"), std::string::npos);
	}
	EXPECT_THROW(loader.Transpile(ResolvePath(path), "1"), RuntimeError);
}

TEST_F(ModuleLoaderTest, MissingFileIsIoError) {
	ModuleLoader loader{LoaderOptions{}};
	EXPECT_THROW(LoadSync(loader, ResolvePath((dir / "missing.js").string())), IoError);
}

TEST_F(ModuleLoaderTest, CachedSourcesAreFetchedOnce) {
	std::string path = WriteFile("cached.js", "export default 1;");
	LoaderOptions options;
	options.cache = std::make_shared<MemoryModuleCacheProvider>();
	ModuleLoader loader{options};
	auto specifier = ResolvePath(path);
	EXPECT_EQ(LoadSync(loader, specifier).GetCode(), "export default 1;");
	WriteFile("cached.js", "export default 2;");
	EXPECT_EQ(LoadSync(loader, specifier).GetCode(), "export default 1;");
}

TEST_F(ModuleLoaderTest, ExtensionModules) {
	ModuleLoader loader{LoaderOptions{}};
	auto specifier = *ModuleSpecifier::Parse("ext:greeter/index.js");
	loader.RegisterExtensionModule(specifier, "export const hello = 'world';");
	EXPECT_EQ(LoadSync(loader, specifier).GetCode(), "export const hello = 'world';");
	EXPECT_THROW(LoadSync(loader, *ModuleSpecifier::Parse("ext:greeter/missing.js")), ResolutionError);
}

} // anonymous namespace
} // namespace jsh
