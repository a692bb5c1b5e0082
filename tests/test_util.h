#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>

namespace jsh {
namespace test {

inline auto FixturePath(const std::string& name) -> std::string {
	return std::string{JSH_TEST_DIR} + "/fixtures/" + name;
}

// Scratch directory which is removed with the fixture
class TempDirTest : public ::testing::Test {
	protected:
		void SetUp() override {
			const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
			dir = std::filesystem::temp_directory_path() /
				(std::string{"jshost_"} + info->test_suite_name() + "_" + info->name());
			std::filesystem::remove_all(dir);
			std::filesystem::create_directories(dir);
		}

		void TearDown() override {
			std::error_code error;
			std::filesystem::remove_all(dir, error);
		}

		auto WriteFile(const std::string& name, const std::string& contents) -> std::string {
			auto path = dir / name;
			std::filesystem::create_directories(path.parent_path());
			std::ofstream stream{path, std::ios::out | std::ios::trunc};
			stream << contents;
			return path.string();
		}

		std::filesystem::path dir;
};

} // namespace test
} // namespace jsh
