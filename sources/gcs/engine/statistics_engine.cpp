//
// Created by gregorian-rayne on 2/17/26.
//

#include "gcs/engine/statistics_engine.hpp"
#include "gcs/stats/credit_aggregator.hpp"
#include "gcs/utils/parallel.hpp"
#include "gcs/utils/string_utils.hpp"
#include "gcs/walk/commit_walker.hpp"
#include "gcs/log.hpp"

#include <chrono>
#include <future>

namespace gcs::engine
{
    namespace {

        using DiffResult = Result<std::vector<FileChange>, Error>;

        Result<CommitId, Error> resolve_ref(git::IRepository& repo, const std::string& ref) {
            auto id = repo.resolve_start(ref);
            if (id.is_err() && id.error().code() == ErrorCode::NotFound) {
                return Result<CommitId, Error>::failure(
                    Error::repository_not_found("Start reference not found", ref)
                );
            }
            return id;
        }

        DiffResult first_parent_diff(git::IRepository& repo, const CommitId& id) {
            try {
                auto diff = repo.diff_against_parent(id, 0);
                if (diff.is_err() && diff.error().code() != ErrorCode::DiffUnavailable) {
                    return DiffResult::failure(diff.error().with_code(ErrorCode::DiffUnavailable));
                }
                return diff;
            } catch (const std::exception& e) {
                return DiffResult::failure(Error::diff_unavailable(e.what(), id));
            }
        }

        std::vector<FileChange> restrict_to_prefix(std::vector<FileChange> changes, const std::string_view prefix) {
            if (prefix.empty()) {
                return changes;
            }
            std::erase_if(changes, [prefix](const FileChange& change) {
                return !path_in_scope(change.path, prefix);
            });
            return changes;
        }

    }  // namespace

    bool path_in_scope(const std::string_view path, std::string_view prefix) noexcept {
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.remove_suffix(1);
        }
        if (prefix.empty()) {
            return true;
        }
        if (!string_utils::starts_with(path, prefix)) {
            return false;
        }
        return path.size() == prefix.size() || path[prefix.size()] == '/';
    }

    StatisticsEngine::StatisticsEngine(git::RepositoryPtr repository)
        : repository_(std::move(repository)) {}

    Result<TablePtr, Error> StatisticsEngine::build(
        const TraversalScope& scope,
        const CancellationToken& cancel,
        const BuildOptions& options
    ) const {
        using BuildResult = Result<TablePtr, Error>;

        if (!repository_) {
            return BuildResult::failure(Error::invalid_argument("No repository"));
        }
        if (scope.since && scope.until && *scope.since > *scope.until) {
            return BuildResult::failure(Error::invalid_argument("'since' is later than 'until'"));
        }

        const auto start_time = std::chrono::steady_clock::now();
        git::IRepository& repo = *repository_;

        auto start = resolve_ref(repo, scope.start_ref);
        if (start.is_err()) {
            return BuildResult::failure(cancel.is_cancelled() ? Error::cancelled() : start.error());
        }

        walk::WalkFilters filters;
        filters.since = scope.since;
        filters.until = scope.until;
        filters.path_prefix = scope.path_prefix;
        if (scope.exclude_ref) {
            auto hidden = resolve_ref(repo, *scope.exclude_ref);
            if (hidden.is_err()) {
                return BuildResult::failure(cancel.is_cancelled() ? Error::cancelled() : hidden.error());
            }
            filters.hidden.push_back(std::move(hidden).value());
        }

        walk::VisitedSet visited;
        walk::CommitWalker walker(repo, start.value(), visited, filters, cancel);
        identity::IdentityResolver resolver(options.identity);
        stats::CreditAggregator aggregator(scope);
        parallel::ThreadPool pool(options.num_threads);

        const std::size_t batch_size = options.batch_size > 0 ? options.batch_size : 1;
        std::size_t skipped_merges = 0;
        std::size_t out_of_scope = 0;
        std::size_t since_snapshot = 0;
        bool done = false;

        log::debug("Building statistics for " + repo.describe() + " from " + scope.start_ref);

        while (!done) {
            std::vector<CommitRecord> batch;
            batch.reserve(batch_size);
            while (batch.size() < batch_size) {
                auto next = walker.next();
                if (next.is_err()) {
                    return BuildResult::failure(next.error());
                }
                if (!next.value()) {
                    done = true;
                    break;
                }
                CommitRecord& record = *next.value();
                if (record.is_merge() && scope.merge_policy == MergePolicy::SkipMerges) {
                    ++skipped_merges;
                    continue;
                }
                batch.push_back(std::move(record));
            }

            std::vector<std::future<DiffResult>> diffs;
            diffs.reserve(batch.size());
            for (const auto& record : batch) {
                diffs.push_back(pool.submit([&repo, id = record.id]() {
                    return first_parent_diff(repo, id);
                }));
            }

            for (std::size_t i = 0; i < batch.size(); ++i) {
                DiffResult diff = diffs[i].get();
                if (cancel.is_cancelled()) {
                    // Drain the rest so no task outlives this frame's references.
                    for (std::size_t j = i + 1; j < diffs.size(); ++j) {
                        diffs[j].wait();
                    }
                    return BuildResult::failure(Error::cancelled());
                }

                const CommitRecord& record = batch[i];
                stats::CommitContribution contribution;
                contribution.id = record.id;
                contribution.timestamp = record.timestamp;

                if (diff.is_ok()) {
                    contribution.changes = restrict_to_prefix(std::move(diff).value(), scope.path_prefix);
                    if (!scope.path_prefix.empty() && contribution.changes.empty()) {
                        ++out_of_scope;
                        continue;
                    }
                } else {
                    log::warn("Diff unavailable for " + record.id + ": " + diff.error().to_string());
                    contribution.diff_error = diff.error().with_context(record.id);
                }

                contribution.identities = resolver.resolve_commit(record.author, record.message);
                aggregator.add(contribution);

                if (options.snapshot_interval > 0 && options.on_snapshot &&
                    ++since_snapshot >= options.snapshot_interval) {
                    since_snapshot = 0;
                    options.on_snapshot(aggregator.snapshot());
                }
            }

            if (options.on_progress) {
                options.on_progress(BuildProgress{
                    static_cast<std::size_t>(aggregator.commits_folded()),
                    walker.stats().discovered
                });
            }
        }

        // Diff failures seen just before an interrupt are not real warnings.
        if (cancel.is_cancelled()) {
            return BuildResult::failure(Error::cancelled());
        }

        const auto& walk_stats = walker.stats();
        log::debug("Walk: " + std::to_string(walk_stats.discovered) + " discovered, " +
                   std::to_string(walk_stats.emitted) + " emitted, " +
                   std::to_string(walk_stats.filtered) + " outside the time window, " +
                   std::to_string(skipped_merges) + " merge(s) skipped, " +
                   std::to_string(out_of_scope) + " outside the path prefix");

        auto table = aggregator.finish();

        const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);
        log::info("Folded " + std::to_string(table->totals().commits) + " commit(s) by " +
                  std::to_string(table->author_count()) + " author(s) in " +
                  string_utils::format_duration(elapsed.count()));

        return BuildResult::success(std::move(table));
    }

    Result<TablePtr, Error> build_statistics(
        const TraversalScope& scope,
        const CancellationToken& cancel,
        const BuildOptions& options
    ) {
        auto repo = git::open_repository(scope.repository);
        if (repo.is_err()) {
            return Result<TablePtr, Error>::failure(repo.error());
        }
        const StatisticsEngine engine(std::move(repo).value());
        return engine.build(scope, cancel, options);
    }

}  // namespace gcs::engine
