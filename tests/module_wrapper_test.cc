#include "api/jshost.h"
#include "test_util.h"
#include <gtest/gtest.h>

namespace jsh {
namespace {

TEST(ModuleWrapperTest, Books) {
	auto books = ModuleWrapper::NewFromFile(test::FixturePath("books.js"));
	EXPECT_EQ(books.Keys(), (std::vector<std::string>{"MY_FAVOURITE_FOOD", "addBook", "listBooks"}));
	EXPECT_EQ(books.Get<std::string>("MY_FAVOURITE_FOOD"), "saskatoonberries");
	EXPECT_TRUE(books.IsCallable("addBook"));
	EXPECT_FALSE(books.IsCallable("MY_FAVOURITE_FOOD"));
	EXPECT_FALSE(books.IsCallable("removeBook"));

	EXPECT_EQ(books.Call<int32_t>("addBook", MakeArguments("Dune")), 1);
	EXPECT_EQ(books.Call<int32_t>("addBook", MakeArguments("Emma")), 2);
	EXPECT_EQ(books.Call<std::vector<std::string>>("listBooks"), (std::vector<std::string>{"Dune", "Emma"}));
}

TEST(ModuleWrapperTest, CallStored) {
	auto wrapper = ModuleWrapper::NewFromModule(Module{"test.js", "export const square = v => v * v;"});
	Function square = wrapper.GetRuntime().GetFunctionByName(wrapper.GetModuleContext(), "square");
	EXPECT_EQ(wrapper.CallStored<int32_t>(square, MakeArguments(9)), 81);
}

TEST(ModuleWrapperTest, IsCallableCapturesNothing) {
	auto wrapper = ModuleWrapper::NewFromModule(Module{"test.js", "export const square = v => v * v;"});
	size_t before = wrapper.GetRuntime().GetStoredFunctionCount();
	for (int ii = 0; ii < 100; ++ii) {
		EXPECT_TRUE(wrapper.IsCallable("square"));
	}
	EXPECT_EQ(wrapper.GetRuntime().GetStoredFunctionCount(), before);
}

TEST(ModuleWrapperTest, MissingFile) {
	EXPECT_THROW(ModuleWrapper::NewFromFile(test::FixturePath("missing.js")), IoError);
}

TEST(ModuleWrapperTest, ImportsNeedFsPermission) {
	EXPECT_THROW(ModuleWrapper::NewFromFile(test::FixturePath("main.js")), PermissionError);

	RuntimeOptions options;
	options.allow_fs_import = true;
	auto main = ModuleWrapper::NewFromFile(test::FixturePath("main.js"), options);
	EXPECT_EQ(main.Get<int32_t>("sum"), 5);
	EXPECT_EQ(main.Get<std::string>("name"), "fixtures");
	auto& runtime = main.GetRuntime();
	EXPECT_EQ(runtime.CallEntrypoint<int32_t>(main.GetModuleContext(), MakeArguments(1, 2)), 30);
}

TEST(ModuleWrapperTest, DynamicImportAndMeta) {
	RuntimeOptions options;
	options.allow_fs_import = true;
	auto dynamic = ModuleWrapper::NewFromFile(test::FixturePath("dynamic.js"), options);
	EXPECT_EQ(dynamic.Call<int32_t>("loadMath"), 42);
	EXPECT_EQ(dynamic.Call<std::string>("metaUrl"), ResolvePath(test::FixturePath("dynamic.js")).ToString());
	// Loaded as a side module
	EXPECT_FALSE(dynamic.Call<bool>("isMain"));
}

TEST(ModuleWrapperTest, MainModuleMeta) {
	Runtime runtime;
	auto handle = runtime.LoadModules(Module{"test.js", "export const main = import.meta.main;"});
	EXPECT_TRUE(runtime.GetValue<bool>(handle, "main"));
}

TEST(UtilitiesTest, Evaluate) {
	EXPECT_EQ(Evaluate<int32_t>("5 + 5"), 10);
	EXPECT_EQ(Evaluate<Json>("({ a: [1, 'b'] })").Dump(), "{\"a\":[1,\"b\"]}");
}

TEST(UtilitiesTest, Validate) {
	EXPECT_TRUE(Validate("export const a = 1;"));
	EXPECT_FALSE(Validate("export const = ;"));
	EXPECT_FALSE(Validate("throw new Error('nope');"));
}

TEST(UtilitiesTest, Import) {
	auto books = Import(test::FixturePath("books.js"));
	EXPECT_EQ(books.Get<std::string>("MY_FAVOURITE_FOOD"), "saskatoonberries");
}

TEST(UtilitiesTest, ResolvePathUrl) {
	EXPECT_EQ(ResolvePathUrl("/srv/app/main.js"), "file:///srv/app/main.js");
}

TEST(ModuleTest, LoadDirIsSortedAndFiltered) {
	auto modules = Module::LoadDir(test::FixturePath(""));
	std::vector<std::string> names;
	for (const auto& module : modules) {
		names.emplace_back(std::filesystem::path{module.GetFilename()}.filename().string());
	}
	EXPECT_EQ(names, (std::vector<std::string>{"books.js", "dynamic.js", "main.js"}));
}

TEST(ModuleTest, StaticModules) {
	constexpr auto embedded = JSH_MODULE("embedded.js", "export default 1;");
	EXPECT_EQ(embedded.ToModule(), (Module{"embedded.js", "export default 1;"}));
}

} // anonymous namespace
} // namespace jsh
