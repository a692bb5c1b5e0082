#include "module/module_cache.h"
#include "test_util.h"
#include <gtest/gtest.h>

namespace jsh {
namespace {

auto Specifier(const std::string& url) -> ModuleSpecifier {
	return *ModuleSpecifier::Parse(url);
}

TEST(MemoryModuleCacheTest, StoresBySpecifier) {
	MemoryModuleCacheProvider cache;
	auto specifier = Specifier("file:///src/a.js");
	EXPECT_FALSE(cache.Get(specifier));
	cache.Set(specifier, ModuleSource{ModuleType::JavaScript, "export default 1;"});
	auto source = cache.Get(specifier);
	ASSERT_TRUE(source);
	EXPECT_EQ(source->GetCode(), "export default 1;");
	EXPECT_FALSE(cache.Get(Specifier("file:///src/b.js")));
}

TEST(MemoryModuleCacheTest, CopiesAreIndependent) {
	MemoryModuleCacheProvider cache;
	auto specifier = Specifier("file:///src/a.js");
	cache.Set(specifier, ModuleSource{ModuleType::JavaScript, "code"});
	auto first = cache.Get(specifier);
	first->SetCodeCache({1, 2, 3});
	auto second = cache.Get(specifier);
	EXPECT_FALSE(second->GetCodeCache());
}

TEST(NullModuleCacheTest, StoresNothing) {
	NullModuleCacheProvider cache;
	auto specifier = Specifier("file:///src/a.js");
	cache.Set(specifier, ModuleSource{ModuleType::JavaScript, "code"});
	EXPECT_FALSE(cache.Get(specifier));
}

using FsModuleCacheTest = test::TempDirTest;

TEST_F(FsModuleCacheTest, PersistsAcrossInstances) {
	auto specifier = Specifier("https://example.com/lib/mod.js");
	{
		FsModuleCacheProvider cache{dir};
		cache.Set(specifier, ModuleSource{ModuleType::JavaScript, "export const a = 1;"});
	}
	FsModuleCacheProvider cache{dir};
	auto source = cache.Get(specifier);
	ASSERT_TRUE(source);
	EXPECT_EQ(source->GetCode(), "export const a = 1;");
	EXPECT_EQ(source->GetType(), ModuleType::JavaScript);
}

TEST_F(FsModuleCacheTest, PathsStayUnderRoot) {
	FsModuleCacheProvider cache{dir};
	auto path = cache.GetPath(Specifier("https://example.com/a/%2E%2E/%2E%2E/etc/passwd"));
	auto relative = path.lexically_relative(dir);
	EXPECT_FALSE(relative.empty());
	EXPECT_NE(relative.begin()->string(), "..");
}

TEST_F(FsModuleCacheTest, JsonTypeFollowsExtension) {
	auto specifier = Specifier("file:///data/config.json");
	{
		FsModuleCacheProvider cache{dir};
		cache.Set(specifier, ModuleSource{ModuleType::Json, "{}"});
	}
	FsModuleCacheProvider cache{dir};
	EXPECT_EQ(cache.Get(specifier)->GetType(), ModuleType::Json);
}

} // anonymous namespace
} // namespace jsh
