//
// Created by gregorian-rayne on 2/15/26.
//

#include "gcs/stats/credit_aggregator.hpp"

#include <algorithm>

namespace gcs::stats
{
    CreditAggregator::CreditAggregator(TraversalScope scope) {
        table_.scope_ = std::move(scope);
    }

    ContributionRecord& CreditAggregator::author_record(const identity::AuthorIdentity& identity) {
        auto [it, inserted] = table_.authors_.try_emplace(identity.key);
        if (inserted) {
            it->second.key = identity.key;
            it->second.display_name = identity.display_name;
            it->second.email = identity.email;
        }
        return it->second;
    }

    void CreditAggregator::credit_file(
        const identity::AuthorIdentity& identity,
        const FileChange& change,
        const Share& share,
        const Timestamp timestamp
    ) {
        if (share.insertions == 0 && share.deletions == 0 && !change.binary) {
            return;
        }

        auto& files = table_.files_[identity.key];
        auto [it, inserted] = files.try_emplace(change.path);
        auto& record = it->second;
        if (inserted) {
            record.path = change.path;
            record.key = identity.key;
            ++table_.authors_[identity.key].files_touched;
        }
        record.insertions += share.insertions;
        record.deletions += share.deletions;
        ++record.commits;
        record.last_commit = record.last_commit ? std::max(*record.last_commit, timestamp) : timestamp;
    }

    void CreditAggregator::count_pairings(const std::vector<identity::AuthorIdentity>& identities) {
        auto bump = [this](const identity::AuthorIdentity& self,
                           const identity::AuthorIdentity& partner,
                           const bool driver) {
            auto [it, inserted] = table_.pairings_[self.key].try_emplace(partner.key);
            auto& record = it->second;
            if (inserted) {
                record.key = self.key;
                record.partner = partner.key;
                record.partner_name = partner.display_name;
            }
            ++record.total;
            if (driver) {
                ++record.as_driver;
            }
        };

        const auto& primary = identities.front();
        for (std::size_t i = 1; i < identities.size(); ++i) {
            bump(primary, identities[i], true);
            bump(identities[i], primary, false);

            for (std::size_t j = i + 1; j < identities.size(); ++j) {
                bump(identities[i], identities[j], false);
                bump(identities[j], identities[i], false);
            }
        }
    }

    void CreditAggregator::add(const CommitContribution& commit) {
        if (commit.identities.empty()) {
            return;
        }

        ++table_.commits_;

        for (const auto& identity : commit.identities) {
            auto& record = author_record(identity);
            ++record.commits;
            record.first_commit = record.first_commit
                ? std::min(*record.first_commit, commit.timestamp)
                : commit.timestamp;
            record.last_commit = record.last_commit
                ? std::max(*record.last_commit, commit.timestamp)
                : commit.timestamp;
        }

        count_pairings(commit.identities);

        if (commit.diff_error) {
            warnings_.insert_or_assign(commit.id, *commit.diff_error);
            return;
        }

        const std::size_t n = commit.identities.size();
        const DiffStat total = DiffStat::of(commit.changes);
        const auto shares = split_credit(total.insertions, total.deletions, n);
        for (std::size_t i = 0; i < n; ++i) {
            auto& record = table_.authors_[commit.identities[i].key];
            record.insertions += shares[i].insertions;
            record.deletions += shares[i].deletions;
        }

        for (const auto& change : commit.changes) {
            paths_.insert(change.path);
            const auto file_shares = split_credit(change.insertions, change.deletions, n);
            for (std::size_t i = 0; i < n; ++i) {
                credit_file(commit.identities[i], change, file_shares[i], commit.timestamp);
            }
        }
        table_.distinct_files_ = paths_.size();
    }

    std::shared_ptr<const StatisticsTable> CreditAggregator::snapshot() const {
        auto copy = std::make_shared<StatisticsTable>(table_);
        copy->partial_ = true;
        copy->warnings_ = collect_warnings();
        return copy;
    }

    std::shared_ptr<const StatisticsTable> CreditAggregator::finish() {
        auto result = std::make_shared<StatisticsTable>(std::move(table_));
        result->partial_ = false;
        result->warnings_ = collect_warnings();

        TraversalScope scope = result->scope_;
        table_ = StatisticsTable{};
        table_.scope_ = std::move(scope);
        paths_.clear();
        warnings_.clear();
        return result;
    }

    std::vector<Error> CreditAggregator::collect_warnings() const {
        std::vector<Error> warnings;
        warnings.reserve(warnings_.size());
        for (const auto& [id, warning] : warnings_) {
            warnings.push_back(warning);
        }
        return warnings;
    }

}  // namespace gcs::stats
