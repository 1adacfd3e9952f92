//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef GCS_COMMIT_WALKER_HPP
#define GCS_COMMIT_WALKER_HPP

/**
 * @file commit_walker.hpp
 * @brief Deterministic reverse-chronological topological commit walk.
 *
 * Order:
 * - a commit is emitted only after all of its children in the walk;
 * - among commits whose children are all done, the newest author time goes
 *   first, ties broken by ascending id.
 *
 * The walk is lazy from the caller's side: next() hands out one commit at a
 * time. Ancestry is discovered on the first call (parents and metadata of
 * every reachable commit), which is where cycles and unreadable objects are
 * detected.
 *
 * Usage:
 * @code
 *     walk::VisitedSet visited;
 *     walk::CommitWalker walker(repo, head, visited, filters, token);
 *     while (true) {
 *         auto next = walker.next();
 *         if (next.is_err()) return next.error();
 *         if (!next.value()) break;
 *         process(*next.value());
 *     }
 * @endcode
 */

#include "gcs/git/repository.hpp"
#include "gcs/walk/cancellation.hpp"

#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gcs::walk {

    struct WalkFilters {
        std::optional<Timestamp> since;   // inclusive
        std::optional<Timestamp> until;   // inclusive

        /**
         * Carried for the diff stage; the walker itself does not look at
         * file paths.
         */
        std::string path_prefix;

        /**
         * Commits reachable from these are neither walked nor emitted
         * (the A side of an A..B range).
         */
        std::vector<CommitId> hidden;

        [[nodiscard]] bool in_window(Timestamp ts) const noexcept {
            return (!since || ts >= *since) && (!until || ts <= *until);
        }
    };

    /**
     * Ids already reached. Owned by the caller; a walker only inserts. Commits
     * present before the walk starts are treated as already processed.
     */
    class VisitedSet {
    public:
        /**
         * @return true if @p id was not in the set before.
         */
        bool insert(const CommitId& id) { return ids_.insert(id).second; }

        [[nodiscard]] bool contains(const CommitId& id) const { return ids_.contains(id); }
        [[nodiscard]] std::size_t size() const noexcept { return ids_.size(); }
        [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }
        void clear() noexcept { ids_.clear(); }

    private:
        std::unordered_set<CommitId> ids_;
    };

    struct WalkStats {
        std::size_t discovered = 0;   // commits in the walk graph
        std::size_t emitted = 0;
        std::size_t filtered = 0;     // outside since/until
        std::size_t hidden = 0;       // reachable from a hidden tip
    };

    class CommitWalker {
    public:
        CommitWalker(
            git::IRepository& repo,
            CommitId start,
            VisitedSet& visited,
            WalkFilters filters = {},
            CancellationToken cancel = {}
        );

        /**
         * @return The next commit, nullopt at the end, or
         *         CorruptHistory / Cancelled.
         */
        Result<std::optional<CommitRecord>, Error> next();

        [[nodiscard]] const WalkFilters& filters() const noexcept { return filters_; }
        [[nodiscard]] const WalkStats& stats() const noexcept { return stats_; }

    private:
        struct Node {
            CommitRecord record;
            std::size_t pending_children = 0;
        };

        struct ReadyEntry {
            Timestamp timestamp;
            CommitId id;
        };

        struct ReadyOrder {
            bool operator()(const ReadyEntry& a, const ReadyEntry& b) const noexcept {
                if (a.timestamp != b.timestamp) {
                    return a.timestamp < b.timestamp;
                }
                return a.id > b.id;
            }
        };

        Result<void, Error> prepare();
        Result<void, Error> collect_hidden();
        void push_ready(const Node& node);

        git::IRepository& repo_;
        CommitId start_;
        VisitedSet& visited_;
        WalkFilters filters_;
        CancellationToken cancel_;

        bool prepared_ = false;
        bool finished_ = false;
        std::unordered_set<CommitId> hidden_;
        std::unordered_map<CommitId, Node> graph_;
        std::priority_queue<ReadyEntry, std::vector<ReadyEntry>, ReadyOrder> ready_;
        std::size_t processed_ = 0;
        WalkStats stats_;
    };

    /**
     * Drains @p walker into a vector.
     */
    [[nodiscard]] Result<std::vector<CommitRecord>, Error> collect(CommitWalker& walker);

}  // namespace gcs::walk

#endif //GCS_COMMIT_WALKER_HPP
