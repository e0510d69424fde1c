#include <gtest/gtest.h>
#include <sweep/config.hpp>
#include <sweep/exclusion_rules.hpp>

#include "test_doubles.hpp"

#include <filesystem>
#include <fstream>

using namespace sweep;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = sweep::test::scratch_dir("sweep_config");
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void write(const std::string& content) {
        std::ofstream out(test_dir_ / "config.json");
        out << content;
    }

    fs::path test_dir_;
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    auto config = load_config(test_dir_ / "absent.json");
    ASSERT_TRUE(config.ok()) << config.error().to_string();
    EXPECT_EQ(config->bundle_extension, ".app");
    EXPECT_TRUE(config->backup_enabled);
    EXPECT_EQ(config->large_file_threshold, LARGE_FILE_THRESHOLD);
    EXPECT_EQ(config->excluded_locations.size(), ExclusionEngine::builtin_categories().size());
    EXPECT_EQ(config->backup_location.filename(), "sweep_backups");
}

TEST_F(ConfigTest, UnparsableFileIsInvalidArgument) {
    write("{ not json");
    auto config = load_config(test_dir_ / "config.json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, WrongTypeIsInvalidArgument) {
    write(R"({"search_roots": "/not/an/array"})");
    auto config = load_config(test_dir_ / "config.json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, ValuesOverrideDefaults) {
    write(R"({
        "search_roots": ["/opt/apps"],
        "bundle_extension": ".bundle",
        "backup_enabled": false,
        "large_file_threshold": 1024,
        "max_workers": 3,
        "removal_batch_size": 50,
        "app_patterns": {"Zed": ["zed-*"]}
    })");
    auto config = load_config(test_dir_ / "config.json");
    ASSERT_TRUE(config.ok()) << config.error().to_string();

    ASSERT_EQ(config->search_roots.size(), 1);
    EXPECT_EQ(config->search_roots[0], fs::path("/opt/apps"));
    EXPECT_EQ(config->bundle_extension, ".bundle");
    EXPECT_FALSE(config->backup_enabled);
    EXPECT_EQ(config->large_file_threshold, 1024);
    EXPECT_EQ(config->max_workers, 3);
    EXPECT_EQ(config->removal_batch_size, 50);
    ASSERT_EQ(config->app_patterns.count("zed"), 1);
    EXPECT_EQ(config->app_patterns.at("zed")[0], "zed-*");
}

TEST_F(ConfigTest, ExclusionsMergeWithBuiltins) {
    write(R"({"excluded_locations": {
        "custom": {"enabled": true, "paths": ["Scratch"]},
        "media": {"enabled": false, "paths": ["Movies"]}
    }})");
    auto config = load_config(test_dir_ / "config.json");
    ASSERT_TRUE(config.ok()) << config.error().to_string();

    EXPECT_EQ(config->excluded_locations.size(),
              ExclusionEngine::builtin_categories().size() + 1);
    EXPECT_EQ(config->excluded_locations.at("custom").fragments,
              std::vector<std::string>{"Scratch"});
    EXPECT_FALSE(config->excluded_locations.at("media").enabled);
    EXPECT_FALSE(config->excluded_locations.at("development").fragments.empty());
}

TEST_F(ConfigTest, ResolveDefaultsFillsEmptyLists) {
    SweepConfig config;
    resolve_defaults(config, "/home/u");
    EXPECT_EQ(config.search_roots, default_search_roots("/home/u"));
    EXPECT_EQ(config.snapshot_categories.size(), 2);

    SweepConfig custom;
    custom.search_roots = {"/opt"};
    resolve_defaults(custom, "/home/u");
    ASSERT_EQ(custom.search_roots.size(), 1);
    EXPECT_EQ(custom.search_roots[0], fs::path("/opt"));
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    SweepConfig config = default_config();
    config.search_roots = {"/a", "/b"};
    config.max_workers = 7;
    SnapshotCategory category;
    category.name = "home";
    category.root = "/home/u";
    category.paths = {"/home/u/Documents"};
    config.snapshot_categories = {category};

    const fs::path path = test_dir_ / "nested" / "config.json";
    ASSERT_TRUE(save_config(config, path).ok());

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.ok()) << loaded.error().to_string();
    EXPECT_EQ(loaded->search_roots, config.search_roots);
    EXPECT_EQ(loaded->max_workers, 7);
    ASSERT_EQ(loaded->snapshot_categories.size(), 1);
    EXPECT_EQ(loaded->snapshot_categories[0].paths[0], fs::path("/home/u/Documents"));
}
