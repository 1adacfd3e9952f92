//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef GCS_GIT_REPOSITORY_HPP
#define GCS_GIT_REPOSITORY_HPP

/**
 * @file repository.hpp
 * @brief Read-only access to a repository's commit graph and diffs.
 *
 * The walker and the engine only see this interface. GitRepository is the
 * production implementation; tests use an in-memory graph.
 *
 * Implementations must allow metadata() and diff_against_parent() to be
 * called concurrently from worker threads.
 */

#include "gcs/result.hpp"
#include "gcs/error.hpp"
#include "gcs/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gcs::git {

    class IRepository {
    public:
        virtual ~IRepository() = default;

        /**
         * Resolves a reference (branch, tag, HEAD, abbreviated id) to a commit.
         *
         * @return The commit id, or NotFound if @p ref names no commit.
         */
        [[nodiscard]] virtual Result<CommitId, Error> resolve_start(const std::string& ref) = 0;

        /**
         * Parent ids in recorded order. Empty for a root commit.
         */
        [[nodiscard]] virtual Result<std::vector<CommitId>, Error> parents(const CommitId& id) = 0;

        [[nodiscard]] virtual Result<CommitMetadata, Error> metadata(const CommitId& id) = 0;

        /**
         * Per-file line counts of @p id against parent number @p parent_index.
         * A root commit is diffed against the empty tree and ignores the index.
         * Binary files come back with binary = true and zero counts.
         */
        [[nodiscard]] virtual Result<std::vector<FileChange>, Error> diff_against_parent(
            const CommitId& id,
            std::size_t parent_index
        ) = 0;

        /**
         * Human-readable location, used in log messages.
         */
        [[nodiscard]] virtual std::string describe() const = 0;
    };

    using RepositoryPtr = std::shared_ptr<IRepository>;

    /**
     * Opens the repository at @p path with the git executable.
     *
     * @return RepositoryNotFound if @p path is not inside a repository.
     */
    [[nodiscard]] Result<RepositoryPtr, Error> open_repository(const fs::path& path);

}  // namespace gcs::git

#endif //GCS_GIT_REPOSITORY_HPP
