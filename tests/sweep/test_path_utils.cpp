#include <gtest/gtest.h>
#include <sweep/util/path_utils.hpp>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace sweep;

// ============================================================================
// Path relations
// ============================================================================

TEST(PathUtilsTest, WithinComparesSegments) {
    EXPECT_TRUE(is_within("/a/b/c", "/a/b"));
    EXPECT_TRUE(is_within("/a/b/", "/a/b"));
    EXPECT_FALSE(is_within("/a/bc", "/a/b"));
    EXPECT_FALSE(is_within("/a", "/a/b"));
    EXPECT_TRUE(paths_overlap("/a", "/a/b"));
    EXPECT_FALSE(paths_overlap("/data", "/database"));
}

TEST(PathUtilsTest, FormatSizePicksUnit) {
    EXPECT_EQ(format_size(512), "512.00 B");
    EXPECT_EQ(format_size(1536 * 1024), "1.50 MB");
}

// ============================================================================
// Home directory
// ============================================================================

class HomeDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* home = std::getenv("HOME");
        had_home_ = home != nullptr;
        if (had_home_) saved_home_ = home;
    }

    void TearDown() override {
        if (had_home_) {
            ::setenv("HOME", saved_home_.c_str(), 1);
        } else {
            ::unsetenv("HOME");
        }
    }

    bool had_home_ = false;
    std::string saved_home_;
};

TEST_F(HomeDirectoryTest, ExpandsTilde) {
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(expand_home("~"), fs::path("/home/tester"));
    EXPECT_EQ(expand_home("~/Library"), fs::path("/home/tester/Library"));
    EXPECT_EQ(expand_home("~other/x"), fs::path("~other/x"));
    EXPECT_EQ(expand_home("/abs"), fs::path("/abs"));
}

TEST_F(HomeDirectoryTest, PasswordLookupFromManyThreads) {
    ::unsetenv("HOME");
    const fs::path expected = home_directory();
    EXPECT_FALSE(expected.empty());

    std::vector<fs::path> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&seen, i] {
            for (int round = 0; round < 50; ++round) {
                seen[i] = home_directory();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& path : seen) {
        EXPECT_EQ(path, expected);
    }
}
