//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef GCS_GIT_GIT_REPOSITORY_HPP
#define GCS_GIT_GIT_REPOSITORY_HPP

/**
 * @file git_repository.hpp
 * @brief IRepository backed by the git command line.
 *
 * Commands used:
 *   rev-parse --verify <ref>^{commit}
 *   show -s --format=<NUL separated fields> <id>
 *   diff-tree -r --numstat -z --no-renames [--root] <parent> <id>
 *
 * Parsing is split out into free functions so it can be tested on captured
 * output.
 */

#include "gcs/git/repository.hpp"
#include "gcs/git/process.hpp"

#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace gcs::git {

    /**
     * Everything `git show -s` reports for one commit.
     */
    struct ParsedCommit {
        CommitId id;
        std::vector<CommitId> parents;
        CommitMetadata metadata;
    };

    /**
     * The --format argument whose output parse_commit_show() expects.
     * Fields: id, parents, author name, author email, author time,
     * committer name, committer email, committer time, raw message.
     */
    [[nodiscard]] const std::string& commit_show_format();

    /**
     * Parses output produced with commit_show_format().
     *
     * @return CorruptHistory when fields are missing or malformed.
     */
    [[nodiscard]] Result<ParsedCommit, Error> parse_commit_show(std::string_view output);

    /**
     * Parses `diff-tree -r --numstat -z --no-renames` output. Binary entries
     * ("-\t-\tpath") become binary FileChanges with zero counts. A leading
     * commit id record (printed for single-commit diff-tree) is skipped.
     *
     * @return CorruptHistory when a record cannot be read.
     */
    [[nodiscard]] Result<std::vector<FileChange>, Error> parse_numstat(std::string_view output);

    class GitRepository final : public IRepository {
        struct PrivateKey {
            explicit PrivateKey() = default;
        };

    public:
        /**
         * @return RepositoryNotFound if @p path does not exist or is not a
         *         git work tree / git dir.
         */
        static Result<std::shared_ptr<GitRepository>, Error> open(
            const fs::path& path,
            Duration timeout = kDefaultGitTimeout
        );

        /**
         * Use open(); the key keeps construction inside this class.
         */
        GitRepository(PrivateKey, fs::path root, Duration timeout);

        [[nodiscard]] Result<CommitId, Error> resolve_start(const std::string& ref) override;
        [[nodiscard]] Result<std::vector<CommitId>, Error> parents(const CommitId& id) override;
        [[nodiscard]] Result<CommitMetadata, Error> metadata(const CommitId& id) override;
        [[nodiscard]] Result<std::vector<FileChange>, Error> diff_against_parent(
            const CommitId& id,
            std::size_t parent_index
        ) override;
        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] const fs::path& root() const noexcept { return root_; }

    private:
        /**
         * Returns the cached commit, fetching it on first use.
         */
        Result<ParsedCommit, Error> lookup(const CommitId& id);

        fs::path root_;
        Duration timeout_;

        std::mutex cache_mutex_;
        std::unordered_map<CommitId, ParsedCommit> cache_;
    };

}  // namespace gcs::git

#endif //GCS_GIT_GIT_REPOSITORY_HPP
