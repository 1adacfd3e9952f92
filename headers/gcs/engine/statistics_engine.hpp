//
// Created by gregorian-rayne on 2/17/26.
//

#ifndef GCS_STATISTICS_ENGINE_HPP
#define GCS_STATISTICS_ENGINE_HPP

/**
 * @file statistics_engine.hpp
 * @brief Builds a StatisticsTable from a repository and a traversal scope.
 *
 * Pipeline:
 *   resolve refs -> walk (single thread) -> diff batches (thread pool)
 *   -> resolve identities and fold (walk order) -> hand off table
 *
 * The build blocks until it finishes, fails or is cancelled. On failure or
 * cancellation nothing is published; snapshots sent before that point are
 * flagged partial.
 */

#include "gcs/git/repository.hpp"
#include "gcs/identity/identity_resolver.hpp"
#include "gcs/stats/statistics_table.hpp"
#include "gcs/walk/cancellation.hpp"

#include <functional>
#include <memory>

namespace gcs::engine {

    using TablePtr = std::shared_ptr<const stats::StatisticsTable>;

    struct BuildProgress {
        std::size_t commits_folded = 0;
        std::size_t commits_discovered = 0;
    };

    struct BuildOptions {
        unsigned int num_threads = 0;     // 0: hardware concurrency
        std::size_t batch_size = 64;      // commits diffed per pool round
        identity::ResolverOptions identity;

        /**
         * Publish a partial table every this many folded commits; 0 disables.
         */
        std::size_t snapshot_interval = 0;
        std::function<void(TablePtr)> on_snapshot;

        std::function<void(const BuildProgress&)> on_progress;
    };

    /**
     * Normalized path prefix check: "src" and "src/" both match "src/a.cpp"
     * and "src" itself, but not "srcx/a.cpp". An empty prefix matches all.
     */
    [[nodiscard]] bool path_in_scope(std::string_view path, std::string_view prefix) noexcept;

    class StatisticsEngine {
    public:
        explicit StatisticsEngine(git::RepositoryPtr repository);

        /**
         * Runs one traversal over scope.start_ref (minus scope.exclude_ref).
         *
         * @return The table, or RepositoryNotFound (unknown ref),
         *         CorruptHistory, Cancelled, InvalidArgument.
         */
        [[nodiscard]] Result<TablePtr, Error> build(
            const TraversalScope& scope,
            const CancellationToken& cancel = {},
            const BuildOptions& options = {}
        ) const;

        [[nodiscard]] const git::IRepository& repository() const noexcept { return *repository_; }

    private:
        git::RepositoryPtr repository_;
    };

    /**
     * Opens scope.repository and builds its table.
     */
    [[nodiscard]] Result<TablePtr, Error> build_statistics(
        const TraversalScope& scope,
        const CancellationToken& cancel = {},
        const BuildOptions& options = {}
    );

}  // namespace gcs::engine

#endif //GCS_STATISTICS_ENGINE_HPP
