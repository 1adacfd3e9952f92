//
// Created by gregorian-rayne on 2/25/26.
//

#include <gtest/gtest.h>
#include "gcs/core/config.hpp"
#include "gcs/utils/time_utils.hpp"
#include <fstream>
#include <filesystem>

using namespace gcs;
using namespace gcs::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "gcs_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_test_file(const std::string& filename, const std::string& content) const {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path.string();
    }

    fs::path temp_dir;
};

TEST_F(ConfigTest, DefaultConfig) {
    const auto config = Config::default_config();

    EXPECT_EQ(config.repository.path, ".");
    EXPECT_EQ(config.repository.ref, "HEAD");
    EXPECT_TRUE(config.repository.exclude.empty());
    EXPECT_TRUE(config.filters.since.empty());
    EXPECT_TRUE(config.filters.path_prefix.empty());
    EXPECT_EQ(config.traversal.merge_policy, MergePolicy::FirstParent);
    EXPECT_FALSE(config.identity.transliterate);
    EXPECT_TRUE(config.identity.aliases.empty());
    EXPECT_EQ(config.performance.num_threads, 0);
    EXPECT_EQ(config.performance.batch_size, 64);
    EXPECT_EQ(config.performance.snapshot_interval, 0);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, LoadFromStringToml) {
    const std::string toml_config = R"(
        [repository]
        path = "/srv/repo"
        ref = "main"
        exclude = "v1.0"

        [filters]
        since = "2024-01-01"
        until = "2024-12-31T23:59:59Z"
        path_prefix = "src"

        [traversal]
        merge_policy = "skip-merges"

        [identity]
        transliterate = true

        [identity.aliases]
        "old@example.com" = "new@example.com"
        "jdoe" = "Jane Doe <jane@example.com>"

        [performance]
        num_threads = 4
        batch_size = 16
        snapshot_interval = 100

        [logging]
        level = "debug"
    )";

    const auto result = Config::load_from_string(toml_config);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& config = result.value();

    EXPECT_EQ(config.repository.path, "/srv/repo");
    EXPECT_EQ(config.repository.ref, "main");
    EXPECT_EQ(config.repository.exclude, "v1.0");
    EXPECT_EQ(config.filters.since, "2024-01-01");
    EXPECT_EQ(config.filters.path_prefix, "src");
    EXPECT_EQ(config.traversal.merge_policy, MergePolicy::SkipMerges);
    EXPECT_TRUE(config.identity.transliterate);
    ASSERT_EQ(config.identity.aliases.size(), 2u);
    EXPECT_EQ(config.performance.num_threads, 4);
    EXPECT_EQ(config.performance.batch_size, 16);
    EXPECT_EQ(config.performance.snapshot_interval, 100);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    const auto result = Config::load_from_string("[repository]\nref = \"develop\"\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().repository.ref, "develop");
    EXPECT_EQ(result.value().repository.path, ".");
    EXPECT_EQ(result.value().performance.batch_size, 64);
}

TEST_F(ConfigTest, LoadFromInvalidString) {
    const auto result = Config::load_from_string("[repository\npath = ");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, UnknownMergePolicyRejected) {
    const auto result = Config::load_from_string("[traversal]\nmerge_policy = \"all-parents\"\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, NonStringAliasRejected) {
    const auto result = Config::load_from_string("[identity.aliases]\n\"bob\" = 42\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, SectionOfWrongTypeIsIgnored) {
    const auto result = Config::load_from_string("repository = 3\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().repository.path, ".");
}

TEST_F(ConfigTest, ValidateInvalidConfig) {
    Config config = Config::default_config();
    config.filters.since = "last tuesday";
    config.performance.batch_size = 0;
    config.performance.num_threads = -1;
    config.logging.level = "loud";

    const auto result = config.validate();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    const std::string& message = result.error().message();
    EXPECT_NE(message.find("filters.since"), std::string::npos);
    EXPECT_NE(message.find("batch_size"), std::string::npos);
    EXPECT_NE(message.find("num_threads"), std::string::npos);
    EXPECT_NE(message.find("logging.level"), std::string::npos);
}

TEST_F(ConfigTest, SinceAfterUntilRejected) {
    Config config = Config::default_config();
    config.filters.since = "2024-06-01";
    config.filters.until = "2024-01-01";
    EXPECT_TRUE(config.validate().is_err());
    EXPECT_TRUE(config.to_scope().is_err());
}

TEST_F(ConfigTest, SameDaySinceAndUntilCoverTheDay) {
    Config config = Config::default_config();
    config.filters.since = "2024-03-05";
    config.filters.until = "2024-03-05";

    const auto scope = config.to_scope();
    ASSERT_TRUE(scope.is_ok());
    ASSERT_TRUE(scope.value().since && scope.value().until);
    EXPECT_EQ(time_utils::format_iso8601(*scope.value().since), "2024-03-05T00:00:00Z");
    EXPECT_EQ(time_utils::format_iso8601(*scope.value().until), "2024-03-05T23:59:59Z");
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto config_path = create_test_file("gcs.toml", "[repository]\nref = \"release\"\n");

    const auto result = Config::load_from_file(config_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().repository.ref, "release");
}

TEST_F(ConfigTest, LoadFromNonExistentFile) {
    const auto result = Config::load_from_file("/nonexistent/gcs.toml");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, FileErrorsCarryPath) {
    const auto config_path = create_test_file("broken.toml", "[performance]\nbatch_size = -5\n");

    const auto result = Config::load_from_file(config_path);
    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(result.error().has_context());
    EXPECT_NE(result.error().context()->find("broken.toml"), std::string::npos);
}

TEST_F(ConfigTest, ToScope) {
    Config config = Config::default_config();
    config.repository.path = "/work/project";
    config.repository.ref = "main";
    config.repository.exclude = "origin/main";
    config.filters.since = "2024-01-01";
    config.filters.path_prefix = "lib";
    config.traversal.merge_policy = MergePolicy::SkipMerges;

    const auto scope = config.to_scope();
    ASSERT_TRUE(scope.is_ok());
    EXPECT_EQ(scope.value().repository, fs::path("/work/project"));
    EXPECT_EQ(scope.value().start_ref, "main");
    ASSERT_TRUE(scope.value().exclude_ref.has_value());
    EXPECT_EQ(*scope.value().exclude_ref, "origin/main");
    ASSERT_TRUE(scope.value().since.has_value());
    EXPECT_EQ(time_utils::format_date(*scope.value().since), "2024-01-01");
    EXPECT_FALSE(scope.value().until.has_value());
    EXPECT_EQ(scope.value().path_prefix, "lib");
    EXPECT_EQ(scope.value().merge_policy, MergePolicy::SkipMerges);
}

TEST_F(ConfigTest, ToBuildOptions) {
    Config config = Config::default_config();
    config.performance.num_threads = 3;
    config.performance.batch_size = 8;
    config.performance.snapshot_interval = 50;
    config.identity.transliterate = true;
    config.identity.aliases.push_back({"a@x", "b@x"});

    const auto options = config.to_build_options();
    EXPECT_EQ(options.num_threads, 3u);
    EXPECT_EQ(options.batch_size, 8u);
    EXPECT_EQ(options.snapshot_interval, 50u);
    EXPECT_TRUE(options.identity.transliterate);
    ASSERT_EQ(options.identity.aliases.size(), 1u);
}

TEST_F(ConfigTest, ToStringLoadsBack) {
    Config config = Config::default_config();
    config.repository.ref = "main";
    config.filters.since = "2024-01-01";
    config.traversal.merge_policy = MergePolicy::SkipMerges;
    config.identity.aliases.push_back({"old \"quoted\" name", "New Name"});

    const auto reloaded = Config::load_from_string(config.to_string());
    ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();
    EXPECT_EQ(reloaded.value().repository.ref, "main");
    EXPECT_EQ(reloaded.value().filters.since, "2024-01-01");
    EXPECT_EQ(reloaded.value().traversal.merge_policy, MergePolicy::SkipMerges);
    ASSERT_EQ(reloaded.value().identity.aliases.size(), 1u);
    EXPECT_EQ(reloaded.value().identity.aliases[0].from, "old \"quoted\" name");
}
