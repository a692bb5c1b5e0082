#include "module/specifier.h"
#include "isolate/generic/error.h"
#include <filesystem>
#include <gtest/gtest.h>

namespace jsh {
namespace {

TEST(SpecifierTest, ParsesAbsoluteUrls) {
	auto specifier = ModuleSpecifier::Parse("HTTPS://example.com/lib/../mod.js?v=1");
	ASSERT_TRUE(specifier);
	EXPECT_EQ(specifier->GetScheme(), "https");
	EXPECT_EQ(specifier->GetAuthority(), "example.com");
	EXPECT_EQ(specifier->GetPath(), "/mod.js");
	EXPECT_EQ(specifier->ToString(), "https://example.com/mod.js?v=1");
}

TEST(SpecifierTest, RejectsSchemeless) {
	EXPECT_FALSE(ModuleSpecifier::Parse("./mod.js"));
	EXPECT_FALSE(ModuleSpecifier::Parse("mod.js"));
	EXPECT_FALSE(ModuleSpecifier::Parse("C:/mod.js"));
}

TEST(SpecifierTest, ResolvesRelativeToReferrer) {
	EXPECT_EQ(ResolveImport("./b.js", "file:///src/a.js").ToString(), "file:///src/b.js");
	EXPECT_EQ(ResolveImport("../b.js", "file:///src/lib/a.js").ToString(), "file:///src/b.js");
	EXPECT_EQ(ResolveImport("/b.js", "https://example.com/x/a.js").ToString(), "https://example.com/b.js");
	EXPECT_EQ(ResolveImport("ext:console/a.js", "file:///src/a.js").ToString(), "ext:console/a.js");
}

TEST(SpecifierTest, RootReferrerUsesWorkingDirectory) {
	auto expected = ResolvePath(std::filesystem::current_path().string() + "/test.js");
	EXPECT_EQ(ResolveImport("./test.js", kRootReferrer), expected);
	EXPECT_EQ(ResolvePath("test.js"), expected);
}

TEST(SpecifierTest, HostFilenamesArePaths) {
	auto cwd = std::filesystem::current_path().string();
	EXPECT_EQ(ResolveImport("test.js", kRootReferrer), ResolvePath(cwd + "/test.js"));
	EXPECT_EQ(ResolveImport("dir/y.js", kRootReferrer), ResolvePath(cwd + "/dir/y.js"));
	EXPECT_EQ(ResolveImport("/srv/app/main.js", kRootReferrer).ToString(), "file:///srv/app/main.js");
	EXPECT_EQ(ResolveImport("https://example.com/a.js", kRootReferrer).ToString(), "https://example.com/a.js");
}

TEST(SpecifierTest, RelativeImportsAreEncodedLikePaths) {
	auto host = ResolvePath("/tmp/my dir/a.js");
	EXPECT_EQ(ResolveImport("./my dir/a.js", "file:///tmp/b.js"), host);
	EXPECT_EQ(ResolveImport("./a.js", host.ToString()), host);
	// Existing escapes are kept as they are
	EXPECT_EQ(ResolveImport("./my%20dir/a.js", "file:///tmp/b.js"), host);
	EXPECT_EQ(ModuleSpecifier::Parse("file:///tmp/my dir/a.js"), host);
}

TEST(SpecifierTest, BareSpecifiersAreErrors) {
	EXPECT_THROW(ResolveImport("lodash", "file:///src/a.js"), ResolutionError);
}

TEST(SpecifierTest, FilePathRoundTrip) {
	auto specifier = ResolvePath("/tmp/with space/mod.js");
	EXPECT_EQ(specifier.ToString(), "file:///tmp/with%20space/mod.js");
	EXPECT_EQ(specifier.ToFilePath(), "/tmp/with space/mod.js");
}

} // anonymous namespace
} // namespace jsh
