//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef GCS_CREDIT_AGGREGATOR_HPP
#define GCS_CREDIT_AGGREGATOR_HPP

/**
 * @file credit_aggregator.hpp
 * @brief Folds per-commit contributions into a StatisticsTable.
 *
 * Every update is a sum, a set insertion or a min/max, so the finished table
 * does not depend on the order in which commits are added.
 */

#include "gcs/identity/identity.hpp"
#include "gcs/stats/credit.hpp"
#include "gcs/stats/statistics_table.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>

namespace gcs::stats {

    /**
     * Everything the fold needs to know about one commit.
     */
    struct CommitContribution {
        CommitId id;
        Timestamp timestamp;
        std::vector<identity::AuthorIdentity> identities;   // primary author first
        std::vector<FileChange> changes;
        std::optional<Error> diff_error;   // set: credited for the commit count only
    };

    class CreditAggregator {
    public:
        explicit CreditAggregator(TraversalScope scope = {});

        void add(const CommitContribution& commit);

        [[nodiscard]] std::uint64_t commits_folded() const noexcept { return table_.commits_; }

        /**
         * Copy of the current state, flagged partial.
         */
        [[nodiscard]] std::shared_ptr<const StatisticsTable> snapshot() const;

        /**
         * Hands off the completed table. The aggregator is empty afterwards.
         */
        [[nodiscard]] std::shared_ptr<const StatisticsTable> finish();

    private:
        ContributionRecord& author_record(const identity::AuthorIdentity& identity);
        void credit_file(const identity::AuthorIdentity& identity, const FileChange& change,
                         const Share& share, Timestamp timestamp);
        void count_pairings(const std::vector<identity::AuthorIdentity>& identities);

        /**
         * Diff warnings ordered by commit id.
         */
        [[nodiscard]] std::vector<Error> collect_warnings() const;

        StatisticsTable table_;
        std::set<std::string> paths_;
        std::map<CommitId, Error> warnings_;
    };

}  // namespace gcs::stats

#endif //GCS_CREDIT_AGGREGATOR_HPP
