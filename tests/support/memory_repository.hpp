//
// Created by gregorian-rayne on 2/22/26.
//

#ifndef GCS_TESTS_MEMORY_REPOSITORY_HPP
#define GCS_TESTS_MEMORY_REPOSITORY_HPP

/**
 * @file memory_repository.hpp
 * @brief In-memory commit graph for walker, aggregator and engine tests.
 */

#include "gcs/git/repository.hpp"
#include "gcs/utils/time_utils.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace gcs::test {

    /**
     * Seconds since the epoch as a Timestamp.
     */
    inline Timestamp at(const std::int64_t seconds) {
        return time_utils::from_epoch_seconds(seconds);
    }

    inline Signature person(const std::string& name, const std::string& email) {
        return Signature{name, email};
    }

    struct FakeCommit {
        CommitId id;
        std::vector<CommitId> parents;
        Signature author;
        Timestamp timestamp;
        std::string message;
        std::vector<FileChange> changes;   // against the first parent
    };

    class MemoryRepository final : public git::IRepository {
    public:
        MemoryRepository& add(FakeCommit commit) {
            const CommitId id = commit.id;
            commits_[id] = std::move(commit);
            return *this;
        }

        MemoryRepository& add(
            const CommitId& id,
            std::vector<CommitId> parents,
            const Signature& author,
            const std::int64_t seconds,
            std::vector<FileChange> changes = {},
            std::string message = "change"
        ) {
            return add(FakeCommit{id, std::move(parents), author, at(seconds), std::move(message), std::move(changes)});
        }

        MemoryRepository& set_ref(const std::string& name, const CommitId& id) {
            refs_[name] = id;
            return *this;
        }

        /**
         * Makes diff_against_parent() fail for @p id.
         */
        MemoryRepository& fail_diff(const CommitId& id) {
            std::lock_guard lock(mutex_);
            failing_diffs_.insert(id);
            return *this;
        }

        /**
         * Makes parents() fail for @p id.
         */
        MemoryRepository& fail_parents(const CommitId& id) {
            std::lock_guard lock(mutex_);
            failing_parents_.insert(id);
            return *this;
        }

        /**
         * Runs @p hook each time an injected parents() or diff failure is
         * served, before the error is returned.
         */
        MemoryRepository& on_failure(std::function<void()> hook) {
            std::lock_guard lock(mutex_);
            failure_hook_ = std::move(hook);
            return *this;
        }

        [[nodiscard]] Result<CommitId, Error> resolve_start(const std::string& ref) override {
            if (const auto it = refs_.find(ref); it != refs_.end()) {
                return Result<CommitId, Error>::success(it->second);
            }
            if (commits_.contains(ref)) {
                return Result<CommitId, Error>::success(ref);
            }
            return Result<CommitId, Error>::failure(Error::not_found("Unknown revision", ref));
        }

        [[nodiscard]] Result<std::vector<CommitId>, Error> parents(const CommitId& id) override {
            {
                std::lock_guard lock(mutex_);
                if (failing_parents_.contains(id)) {
                    if (failure_hook_) failure_hook_();
                    return Result<std::vector<CommitId>, Error>::failure(Error::git_error("Object is unreadable", id));
                }
            }
            const auto it = commits_.find(id);
            if (it == commits_.end()) {
                return Result<std::vector<CommitId>, Error>::failure(Error::not_found("Missing object", id));
            }
            return Result<std::vector<CommitId>, Error>::success(it->second.parents);
        }

        [[nodiscard]] Result<CommitMetadata, Error> metadata(const CommitId& id) override {
            const auto it = commits_.find(id);
            if (it == commits_.end()) {
                return Result<CommitMetadata, Error>::failure(Error::not_found("Missing object", id));
            }
            CommitMetadata meta;
            meta.author = it->second.author;
            meta.committer = it->second.author;
            meta.timestamp = it->second.timestamp;
            meta.commit_time = it->second.timestamp;
            meta.message = it->second.message;
            return Result<CommitMetadata, Error>::success(std::move(meta));
        }

        [[nodiscard]] Result<std::vector<FileChange>, Error> diff_against_parent(
            const CommitId& id,
            const std::size_t parent_index
        ) override {
            ++diff_calls_;
            {
                std::lock_guard lock(mutex_);
                if (failing_diffs_.contains(id)) {
                    if (failure_hook_) failure_hook_();
                    return Result<std::vector<FileChange>, Error>::failure(
                        Error::diff_unavailable("Diff failed", id)
                    );
                }
            }
            const auto it = commits_.find(id);
            if (it == commits_.end()) {
                return Result<std::vector<FileChange>, Error>::failure(Error::not_found("Missing object", id));
            }
            if (!it->second.parents.empty() && parent_index >= it->second.parents.size()) {
                return Result<std::vector<FileChange>, Error>::failure(
                    Error::invalid_argument("Parent index out of range", id)
                );
            }
            return Result<std::vector<FileChange>, Error>::success(it->second.changes);
        }

        [[nodiscard]] std::string describe() const override {
            return "memory repository (" + std::to_string(commits_.size()) + " commits)";
        }

        [[nodiscard]] std::size_t diff_calls() const noexcept { return diff_calls_.load(); }

    private:
        std::map<CommitId, FakeCommit> commits_;
        std::unordered_map<std::string, CommitId> refs_;
        std::set<CommitId> failing_diffs_;
        std::set<CommitId> failing_parents_;
        std::function<void()> failure_hook_;
        std::atomic<std::size_t> diff_calls_{0};
        std::mutex mutex_;
    };

    inline FileChange change(const std::string& path, const std::uint64_t insertions, const std::uint64_t deletions) {
        return FileChange{path, insertions, deletions, false};
    }

    inline FileChange binary(const std::string& path) {
        return FileChange{path, 0, 0, true};
    }

}  // namespace gcs::test

#endif //GCS_TESTS_MEMORY_REPOSITORY_HPP
