//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_TYPES_HPP
#define GCS_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by the walker, resolver and aggregator.
 *
 * - Basic types: Duration, Timestamp, CommitId
 * - Commit data: Signature, CommitMetadata, CommitRecord
 * - Diff data: FileChange, DiffStat
 * - Traversal scope: MergePolicy, TraversalScope
 *
 * Commit records are immutable once read from the repository and are owned by
 * the walker / aggregator for the duration of one traversal.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gcs {

    namespace fs = std::filesystem;

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Full hexadecimal object id of a commit.
     */
    using CommitId = std::string;

    // ============================================================================
    // Commit data
    // ============================================================================

    /**
     * Raw name/email pair as recorded in the repository.
     */
    struct Signature {
        std::string name;
        std::string email;

        bool operator==(const Signature&) const = default;
    };

    /**
     * Everything the accessor reports about a commit besides its parents.
     */
    struct CommitMetadata {
        Signature author;
        Signature committer;
        Timestamp timestamp;       // author time
        Timestamp commit_time;
        std::string message;
    };

    struct CommitRecord {
        CommitId id;
        Signature author;
        Signature committer;
        Timestamp timestamp;
        std::vector<CommitId> parents;   // empty for a root, 2+ for a merge
        std::string message;

        [[nodiscard]] bool is_root() const noexcept { return parents.empty(); }
        [[nodiscard]] bool is_merge() const noexcept { return parents.size() > 1; }
    };

    // ============================================================================
    // Diff data
    // ============================================================================

    /**
     * Line counts for one file of a commit's diff.
     *
     * Binary files carry zero counts; they still count as touched.
     */
    struct FileChange {
        std::string path;
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        bool binary = false;

        bool operator==(const FileChange&) const = default;
    };

    /**
     * Sum of a commit's file changes.
     */
    struct DiffStat {
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        std::size_t files = 0;

        static DiffStat of(const std::vector<FileChange>& changes) noexcept {
            DiffStat total;
            for (const auto& change : changes) {
                total.insertions += change.insertions;
                total.deletions += change.deletions;
                ++total.files;
            }
            return total;
        }
    };

    // ============================================================================
    // Traversal scope
    // ============================================================================

    /**
     * How merge commits are credited.
     */
    enum class MergePolicy {
        FirstParent,   // diff against the first parent only
        SkipMerges     // merges are walked through but not credited
    };

    inline const char* to_string(const MergePolicy policy) noexcept {
        switch (policy) {
            case MergePolicy::FirstParent: return "first-parent";
            case MergePolicy::SkipMerges:  return "skip-merges";
        }
        return "unknown";
    }

    inline std::optional<MergePolicy> merge_policy_from_string(const std::string& str) {
        if (str == "first-parent" || str == "first_parent") return MergePolicy::FirstParent;
        if (str == "skip-merges" || str == "skip_merges" || str == "skip") return MergePolicy::SkipMerges;
        return std::nullopt;
    }

    /**
     * Parameters of one traversal. Stored on the resulting table so the
     * build can be reproduced.
     */
    struct TraversalScope {
        fs::path repository = ".";
        std::string start_ref = "HEAD";
        std::optional<std::string> exclude_ref;   // lower bound of an A..B range
        std::optional<Timestamp> since;
        std::optional<Timestamp> until;
        std::string path_prefix;
        MergePolicy merge_policy = MergePolicy::FirstParent;
    };

}  // namespace gcs

#endif //GCS_TYPES_HPP
