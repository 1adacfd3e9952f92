//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef GCS_STATISTICS_TABLE_HPP
#define GCS_STATISTICS_TABLE_HPP

/**
 * @file statistics_table.hpp
 * @brief Aggregated contribution statistics of one traversal.
 *
 * A table is produced by CreditAggregator and then shared read-only as
 * std::shared_ptr<const StatisticsTable>. Queries return sorted copies; no
 * query changes the stored totals and none touches the repository. A new
 * scope means a new table.
 */

#include "gcs/error.hpp"
#include "gcs/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gcs::stats {

    struct ContributionRecord {
        std::string key;
        std::string display_name;
        std::string email;
        std::uint64_t commits = 0;
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        std::size_t files_touched = 0;
        std::optional<Timestamp> first_commit;
        std::optional<Timestamp> last_commit;
    };

    struct FileContributionRecord {
        std::string path;
        std::string key;
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        std::uint64_t commits = 0;
        std::optional<Timestamp> last_commit;
    };

    /**
     * Shared commits of an ordered (identity, partner) pair. as_driver counts
     * the commits where the identity was the primary author.
     */
    struct PairingRecord {
        std::string key;
        std::string partner;
        std::string partner_name;
        std::uint64_t total = 0;
        std::uint64_t as_driver = 0;
    };

    /**
     * Directory roll-up of file contributions.
     */
    struct PathStat {
        std::string path;   // "." for files at the repository root
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        std::size_t files = 0;
        std::size_t authors = 0;
    };

    struct Totals {
        std::uint64_t commits = 0;
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;
        std::size_t files = 0;
        std::size_t authors = 0;
    };

    enum class SortKey {
        Commits,
        Insertions,
        Deletions,
        FilesTouched,
        Name,
        LastCommit
    };

    enum class SortOrder {
        Descending,
        Ascending
    };

    [[nodiscard]] const char* to_string(SortKey key) noexcept;
    [[nodiscard]] std::optional<SortKey> sort_key_from_string(const std::string& str);

    class CreditAggregator;

    class StatisticsTable {
    public:
        StatisticsTable() = default;

        /**
         * Authors sorted by @p key. Ties are broken by canonical key
         * ascending, whatever @p order is.
         */
        [[nodiscard]] std::vector<ContributionRecord> authors(
            SortKey key = SortKey::Commits,
            SortOrder order = SortOrder::Descending
        ) const;

        /**
         * Per-file breakdown of one identity. FilesTouched sorts by commits,
         * Name by path; ties are broken by path ascending. Empty for an
         * unknown key.
         */
        [[nodiscard]] std::vector<FileContributionRecord> author_files(
            const std::string& key,
            SortKey sort = SortKey::Insertions,
            SortOrder order = SortOrder::Descending
        ) const;

        [[nodiscard]] const ContributionRecord* find_author(const std::string& key) const;

        [[nodiscard]] Totals totals() const;

        /**
         * Partners of @p key, most shared commits first, then by partner key.
         */
        [[nodiscard]] std::vector<PairingRecord> pairings(const std::string& key) const;

        /**
         * Insertions and deletions rolled up to the first @p depth directory
         * components, largest change volume first. Restricted to @p author
         * when given.
         */
        [[nodiscard]] std::vector<PathStat> hot_paths(
            std::size_t depth,
            const std::optional<std::string>& author = std::nullopt
        ) const;

        [[nodiscard]] const TraversalScope& scope() const noexcept { return scope_; }
        /**
         * DiffUnavailable conditions, one per affected commit, ordered by commit id.
         */
        [[nodiscard]] const std::vector<Error>& warnings() const noexcept { return warnings_; }

        /**
         * True for snapshots handed out while a build is still running.
         */
        [[nodiscard]] bool is_partial() const noexcept { return partial_; }

        [[nodiscard]] std::size_t author_count() const noexcept { return authors_.size(); }
        [[nodiscard]] bool empty() const noexcept { return authors_.empty(); }

        [[nodiscard]] nlohmann::json to_json() const;

    private:
        friend class CreditAggregator;

        TraversalScope scope_;
        std::map<std::string, ContributionRecord> authors_;
        std::map<std::string, std::map<std::string, FileContributionRecord>> files_;
        std::map<std::string, std::map<std::string, PairingRecord>> pairings_;
        std::uint64_t commits_ = 0;
        std::size_t distinct_files_ = 0;
        std::vector<Error> warnings_;
        bool partial_ = false;
    };

    [[nodiscard]] nlohmann::json to_json(const ContributionRecord& record);
    [[nodiscard]] nlohmann::json to_json(const FileContributionRecord& record);
    [[nodiscard]] nlohmann::json to_json(const PairingRecord& record);
    [[nodiscard]] nlohmann::json to_json(const PathStat& stat);

}  // namespace gcs::stats

#endif //GCS_STATISTICS_TABLE_HPP
