// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include <sysguard/platform.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace sysguard::platform::test {

TEST(PlatformTest, OsNameIsKnown) {
    std::string name = os_name();

    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS" || name == "Unknown");
    EXPECT_EQ(name, os_name());
}

TEST(PlatformTest, Utf8PathRoundTrip) {
    const std::string original = "rules/\xd0\xbf\xd1\x80\xd0\xb0\xd0\xb2\xd0\xb8\xd0\xbb\xd0\xb0.yml";

    auto path = path_from_utf8(original);

    EXPECT_EQ(path_to_utf8(path), original);
    EXPECT_EQ(path.extension().string(), ".yml");
}

TEST(PlatformTest, EmptyPath) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_EQ(path_to_utf8(std::filesystem::path()), "");
}

TEST(PlatformTest, MakeTempFileCreatesDistinctWritableFiles) {
    auto first = make_temp_file("sysguard_platform");
    auto second = make_temp_file("sysguard_platform");

    EXPECT_NE(first, second);
    EXPECT_TRUE(std::filesystem::exists(first));
    EXPECT_TRUE(std::filesystem::exists(second));

    {
        std::ofstream out(first);
        out << "rules: []\n";
    }
    EXPECT_GT(std::filesystem::file_size(first), 0u);

    std::error_code ec;
    std::filesystem::remove(first, ec);
    std::filesystem::remove(second, ec);
}

TEST(PlatformTest, MakeTempFileUsesTempDirectoryAndPrefix) {
    auto path = make_temp_file("sysguard_prefix");

    EXPECT_EQ(std::filesystem::canonical(path.parent_path()),
              std::filesystem::canonical(std::filesystem::temp_directory_path()));
    EXPECT_EQ(path_to_utf8(path.filename()).rfind("sysguard_prefix_", 0), 0u);
    EXPECT_EQ(std::filesystem::file_size(path), 0u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace sysguard::platform::test
