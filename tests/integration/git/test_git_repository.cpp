//
// Created by gregorian-rayne on 2/26/26.
//

#include "gcs/engine/statistics_engine.hpp"
#include "gcs/git/git_repository.hpp"
#include "gcs/utils/time_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <type_traits>

namespace gcs::git
{
    namespace {

        constexpr std::int64_t kRootTime = 1700000000;

        void write_file(const fs::path& path, const std::string& content) {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << content;
        }

    }  // namespace

    /**
     * Builds a two-commit repository with the git CLI:
     *   root:   Alice adds a.txt (3 lines)
     *   second: Bob edits a.txt (+2 -1), adds data.bin, co-authored by Alice
     */
    class GitRepositoryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            if (!is_git_available()) {
                GTEST_SKIP() << "git executable not available";
            }

            std::random_device rd;
            dir_ = fs::temp_directory_path() / ("gcs-git-test-" + std::to_string(rd()));
            fs::create_directories(dir_);

            git({"init", "-q"});
            git({"config", "user.name", "Alice"});
            git({"config", "user.email", "alice@example.com"});
            git({"config", "commit.gpgsign", "false"});

            write_file(dir_ / "a.txt", "one\ntwo\nthree\n");
            git({"add", "a.txt"});
            git({"commit", "-q", "-m", "first", "--date=" + std::to_string(kRootTime) + " +0000"});

            write_file(dir_ / "a.txt", "one\nTWO\nthree\nfour\n");
            write_file(dir_ / "data.bin", std::string("\x00\x01\x02\x00" "binary", 10));
            git({"add", "a.txt", "data.bin"});
            git({"commit", "-q",
                 "--author=Bob Jones <bob@example.com>",
                 "--date=" + std::to_string(kRootTime + 60) + " +0000",
                 "-m", "second",
                 "-m", "Co-authored-by: Alice <alice@example.com>"});
        }

        void TearDown() override {
            if (!dir_.empty()) {
                std::error_code ec;
                fs::remove_all(dir_, ec);
            }
        }

        void git(const std::vector<std::string>& args) const {
            auto result = execute_git(args, dir_);
            ASSERT_TRUE(result.is_ok()) << result.error().to_string();
            ASSERT_TRUE(result.value().succeeded()) << result.value().stderr_output;
        }

        std::shared_ptr<GitRepository> open_repo() const {
            auto repo = GitRepository::open(dir_);
            EXPECT_TRUE(repo.is_ok()) << repo.error().to_string();
            return repo.is_ok() ? repo.value() : nullptr;
        }

        fs::path dir_;
    };

    TEST_F(GitRepositoryTest, ResolvesHeadAndParents) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);

        auto head = repo->resolve_start("HEAD");
        ASSERT_TRUE(head.is_ok()) << head.error().to_string();
        EXPECT_EQ(head.value().size(), 40u);

        auto parents = repo->parents(head.value());
        ASSERT_TRUE(parents.is_ok());
        ASSERT_EQ(parents.value().size(), 1u);

        auto root_parents = repo->parents(parents.value()[0]);
        ASSERT_TRUE(root_parents.is_ok());
        EXPECT_TRUE(root_parents.value().empty());

        auto by_id = repo->resolve_start(head.value());
        ASSERT_TRUE(by_id.is_ok());
        EXPECT_EQ(by_id.value(), head.value());
    }

    TEST_F(GitRepositoryTest, UnknownReference) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);

        auto missing = repo->resolve_start("no-such-branch");
        ASSERT_TRUE(missing.is_err());
        EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

        auto option_like = repo->resolve_start("--all");
        ASSERT_TRUE(option_like.is_err());
        EXPECT_EQ(option_like.error().code(), ErrorCode::NotFound);
    }

    TEST_F(GitRepositoryTest, ReadsMetadata) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);
        const auto head = repo->resolve_start("HEAD").value();

        auto meta = repo->metadata(head);
        ASSERT_TRUE(meta.is_ok()) << meta.error().to_string();
        EXPECT_EQ(meta.value().author.name, "Bob Jones");
        EXPECT_EQ(meta.value().author.email, "bob@example.com");
        EXPECT_EQ(meta.value().committer.name, "Alice");
        EXPECT_EQ(time_utils::to_epoch_seconds(meta.value().timestamp), kRootTime + 60);
        EXPECT_NE(meta.value().message.find("Co-authored-by: Alice"), std::string::npos);
    }

    TEST_F(GitRepositoryTest, DiffAgainstParent) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);
        const auto head = repo->resolve_start("HEAD").value();

        auto diff = repo->diff_against_parent(head, 0);
        ASSERT_TRUE(diff.is_ok()) << diff.error().to_string();
        auto changes = diff.value();
        std::ranges::sort(changes, {}, &FileChange::path);

        ASSERT_EQ(changes.size(), 2u);
        EXPECT_EQ(changes[0], (FileChange{"a.txt", 2, 1, false}));
        EXPECT_EQ(changes[1], (FileChange{"data.bin", 0, 0, true}));
    }

    TEST_F(GitRepositoryTest, DiffOfRootCommit) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);
        const auto head = repo->resolve_start("HEAD").value();
        const auto root = repo->parents(head).value().front();

        auto diff = repo->diff_against_parent(root, 0);
        ASSERT_TRUE(diff.is_ok()) << diff.error().to_string();
        ASSERT_EQ(diff.value().size(), 1u);
        EXPECT_EQ(diff.value()[0], (FileChange{"a.txt", 3, 0, false}));
    }

    TEST_F(GitRepositoryTest, DiffParentIndexOutOfRange) {
        const auto repo = open_repo();
        ASSERT_NE(repo, nullptr);
        const auto head = repo->resolve_start("HEAD").value();

        auto diff = repo->diff_against_parent(head, 1);
        ASSERT_TRUE(diff.is_err());
        EXPECT_EQ(diff.error().code(), ErrorCode::InvalidArgument);
    }

    TEST_F(GitRepositoryTest, BuildsStatisticsEndToEnd) {
        TraversalScope scope;
        scope.repository = dir_;

        auto table = engine::build_statistics(scope);
        ASSERT_TRUE(table.is_ok()) << table.error().to_string();

        const auto totals = table.value()->totals();
        EXPECT_EQ(totals.commits, 2u);
        EXPECT_EQ(totals.insertions, 5u);
        EXPECT_EQ(totals.deletions, 1u);
        EXPECT_EQ(totals.authors, 2u);

        const auto* alice = table.value()->find_author("alice@example.com");
        ASSERT_NE(alice, nullptr);
        EXPECT_EQ(alice->commits, 2u);
        EXPECT_EQ(alice->insertions, 4u);
        EXPECT_EQ(alice->deletions, 0u);

        const auto* bob = table.value()->find_author("bob@example.com");
        ASSERT_NE(bob, nullptr);
        EXPECT_EQ(bob->commits, 1u);
        EXPECT_EQ(bob->insertions, 1u);
        EXPECT_EQ(bob->deletions, 1u);

        const auto pairs = table.value()->pairings("bob@example.com");
        ASSERT_EQ(pairs.size(), 1u);
        EXPECT_EQ(pairs[0].partner, "alice@example.com");
        EXPECT_EQ(pairs[0].as_driver, 1u);
    }

    class ExecuteGitTest : public ::testing::Test {
    protected:
        void SetUp() override {
            if (!is_git_available()) {
                GTEST_SKIP() << "git executable not available";
            }
        }

        /**
         * Runs a throwaway shell alias through execute_git.
         */
        static Result<CommandResult, Error> run_alias(const std::string& script, const Duration timeout) {
            return execute_git({"-c", "alias.gcs-test=!" + script, "gcs-test"},
                               fs::temp_directory_path(), timeout);
        }
    };

    TEST_F(ExecuteGitTest, ChildIgnoresInterrupt) {
        // The shell sends SIGINT to itself, as a terminal Ctrl+C would.
        auto result = run_alias("kill -INT $$; echo alive", std::chrono::seconds(30));
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        EXPECT_TRUE(result.value().succeeded()) << result.value().stderr_output;
        EXPECT_NE(result.value().stdout_output.find("alive"), std::string::npos);
    }

    TEST_F(ExecuteGitTest, TimeoutIsReportedAsTimeout) {
        auto result = run_alias("sleep 2", std::chrono::milliseconds(200));
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::GitError);
        EXPECT_EQ(result.error().message(), "Git command timed out");
    }

    TEST_F(ExecuteGitTest, KilledChildIsNotATimeout) {
        auto result = run_alias("kill -TERM $PPID; sleep 1", std::chrono::seconds(30));
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        EXPECT_FALSE(result.value().timed_out);
        EXPECT_FALSE(result.value().succeeded());
    }

    TEST(GitRepositoryOpenTest, NonRepositoryDirectory) {
        if (!is_git_available()) {
            GTEST_SKIP() << "git executable not available";
        }
        std::random_device rd;
        const fs::path dir = fs::temp_directory_path() / ("gcs-plain-dir-" + std::to_string(rd()));
        fs::create_directories(dir);

        auto repo = GitRepository::open(dir);
        std::error_code ec;
        fs::remove_all(dir, ec);

        ASSERT_TRUE(repo.is_err());
        EXPECT_EQ(repo.error().code(), ErrorCode::RepositoryNotFound);
    }

    TEST(GitRepositoryOpenTest, MissingDirectory) {
        auto repo = GitRepository::open("/nonexistent/gcs/path/12345");
        ASSERT_TRUE(repo.is_err());
        EXPECT_EQ(repo.error().code(), ErrorCode::RepositoryNotFound);
    }

    TEST(GitRepositoryOpenTest, OnlyOpenConstructs) {
        static_assert(!std::is_constructible_v<GitRepository, fs::path, Duration>);
        static_assert(!std::is_default_constructible_v<GitRepository>);
        SUCCEED();
    }

}  // namespace gcs::git
