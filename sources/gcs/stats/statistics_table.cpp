//
// Created by gregorian-rayne on 2/15/26.
//

#include "gcs/stats/statistics_table.hpp"
#include "gcs/utils/string_utils.hpp"
#include "gcs/utils/time_utils.hpp"

#include <algorithm>
#include <limits>
#include <ranges>
#include <set>

namespace gcs::stats
{
    namespace {

        using json = nlohmann::json;

        /**
         * Orders by @p primary in the requested direction, then by @p tie
         * ascending.
         */
        template<typename T, typename Primary, typename Tie>
        void sort_records(std::vector<T>& rows, const SortOrder order, Primary primary, Tie tie) {
            std::ranges::sort(rows, [&](const T& a, const T& b) {
                const auto pa = primary(a);
                const auto pb = primary(b);
                if (pa != pb) {
                    return order == SortOrder::Descending ? pb < pa : pa < pb;
                }
                return tie(a) < tie(b);
            });
        }

        std::int64_t time_rank(const std::optional<Timestamp>& ts) {
            return ts ? time_utils::to_epoch_seconds(*ts) : std::numeric_limits<std::int64_t>::min();
        }

        std::string directory_prefix(const std::string& path, const std::size_t depth) {
            auto parts = string_utils::split(path, '/');
            parts.pop_back();   // file name
            if (parts.empty() || depth == 0) {
                return ".";
            }
            if (parts.size() > depth) {
                parts.resize(depth);
            }
            return string_utils::join(parts, "/");
        }

        json optional_time(const std::optional<Timestamp>& ts) {
            return ts ? json(time_utils::format_iso8601(*ts)) : json(nullptr);
        }

    }  // namespace

    const char* to_string(const SortKey key) noexcept {
        switch (key) {
            case SortKey::Commits:      return "commits";
            case SortKey::Insertions:   return "insertions";
            case SortKey::Deletions:    return "deletions";
            case SortKey::FilesTouched: return "files";
            case SortKey::Name:         return "name";
            case SortKey::LastCommit:   return "last-commit";
        }
        return "unknown";
    }

    std::optional<SortKey> sort_key_from_string(const std::string& str) {
        const std::string lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "commits") return SortKey::Commits;
        if (lower == "insertions" || lower == "added") return SortKey::Insertions;
        if (lower == "deletions" || lower == "removed") return SortKey::Deletions;
        if (lower == "files" || lower == "files-touched" || lower == "files_touched") return SortKey::FilesTouched;
        if (lower == "name") return SortKey::Name;
        if (lower == "last-commit" || lower == "last_commit" || lower == "last") return SortKey::LastCommit;
        return std::nullopt;
    }

    std::vector<ContributionRecord> StatisticsTable::authors(const SortKey key, const SortOrder order) const {
        std::vector<ContributionRecord> rows;
        rows.reserve(authors_.size());
        for (const auto& record : authors_ | std::views::values) {
            rows.push_back(record);
        }

        const auto tie = [](const ContributionRecord& r) -> const std::string& { return r.key; };
        switch (key) {
            case SortKey::Commits:
                sort_records(rows, order, [](const ContributionRecord& r) { return r.commits; }, tie);
                break;
            case SortKey::Insertions:
                sort_records(rows, order, [](const ContributionRecord& r) { return r.insertions; }, tie);
                break;
            case SortKey::Deletions:
                sort_records(rows, order, [](const ContributionRecord& r) { return r.deletions; }, tie);
                break;
            case SortKey::FilesTouched:
                sort_records(rows, order, [](const ContributionRecord& r) { return r.files_touched; }, tie);
                break;
            case SortKey::Name:
                sort_records(rows, order, [](const ContributionRecord& r) {
                    return string_utils::to_lower(r.display_name);
                }, tie);
                break;
            case SortKey::LastCommit:
                sort_records(rows, order, [](const ContributionRecord& r) { return time_rank(r.last_commit); }, tie);
                break;
        }
        return rows;
    }

    std::vector<FileContributionRecord> StatisticsTable::author_files(
        const std::string& key,
        const SortKey sort,
        const SortOrder order
    ) const {
        std::vector<FileContributionRecord> rows;
        const auto it = files_.find(key);
        if (it == files_.end()) {
            return rows;
        }
        rows.reserve(it->second.size());
        for (const auto& record : it->second | std::views::values) {
            rows.push_back(record);
        }

        const auto tie = [](const FileContributionRecord& r) -> const std::string& { return r.path; };
        switch (sort) {
            case SortKey::Commits:
            case SortKey::FilesTouched:
                sort_records(rows, order, [](const FileContributionRecord& r) { return r.commits; }, tie);
                break;
            case SortKey::Insertions:
                sort_records(rows, order, [](const FileContributionRecord& r) { return r.insertions; }, tie);
                break;
            case SortKey::Deletions:
                sort_records(rows, order, [](const FileContributionRecord& r) { return r.deletions; }, tie);
                break;
            case SortKey::Name:
                sort_records(rows, order, [](const FileContributionRecord& r) { return r.path; }, tie);
                break;
            case SortKey::LastCommit:
                sort_records(rows, order, [](const FileContributionRecord& r) { return time_rank(r.last_commit); }, tie);
                break;
        }
        return rows;
    }

    const ContributionRecord* StatisticsTable::find_author(const std::string& key) const {
        const auto it = authors_.find(key);
        return it == authors_.end() ? nullptr : &it->second;
    }

    Totals StatisticsTable::totals() const {
        Totals totals;
        totals.commits = commits_;
        totals.files = distinct_files_;
        totals.authors = authors_.size();
        for (const auto& record : authors_ | std::views::values) {
            totals.insertions += record.insertions;
            totals.deletions += record.deletions;
        }
        return totals;
    }

    std::vector<PairingRecord> StatisticsTable::pairings(const std::string& key) const {
        std::vector<PairingRecord> rows;
        const auto it = pairings_.find(key);
        if (it == pairings_.end()) {
            return rows;
        }
        for (const auto& record : it->second | std::views::values) {
            rows.push_back(record);
        }
        sort_records(rows, SortOrder::Descending,
                     [](const PairingRecord& r) { return r.total; },
                     [](const PairingRecord& r) -> const std::string& { return r.partner; });
        return rows;
    }

    std::vector<PathStat> StatisticsTable::hot_paths(
        const std::size_t depth,
        const std::optional<std::string>& author
    ) const {
        struct Bucket {
            PathStat stat;
            std::set<std::string> files;
            std::set<std::string> authors;
        };
        std::map<std::string, Bucket> buckets;

        for (const auto& [key, files] : files_) {
            if (author && *author != key) {
                continue;
            }
            for (const auto& [path, record] : files) {
                const std::string dir = directory_prefix(path, depth);
                auto& bucket = buckets[dir];
                bucket.stat.path = dir;
                bucket.stat.insertions += record.insertions;
                bucket.stat.deletions += record.deletions;
                bucket.files.insert(path);
                bucket.authors.insert(key);
            }
        }

        std::vector<PathStat> rows;
        rows.reserve(buckets.size());
        for (auto& bucket : buckets | std::views::values) {
            bucket.stat.files = bucket.files.size();
            bucket.stat.authors = bucket.authors.size();
            rows.push_back(std::move(bucket.stat));
        }
        sort_records(rows, SortOrder::Descending,
                     [](const PathStat& s) { return s.insertions + s.deletions; },
                     [](const PathStat& s) -> const std::string& { return s.path; });
        return rows;
    }

    // =============================================================================
    // JSON
    // =============================================================================

    json to_json(const ContributionRecord& record) {
        return {
            {"key", record.key},
            {"name", record.display_name},
            {"email", record.email},
            {"commits", record.commits},
            {"insertions", record.insertions},
            {"deletions", record.deletions},
            {"files_touched", record.files_touched},
            {"first_commit", optional_time(record.first_commit)},
            {"last_commit", optional_time(record.last_commit)}
        };
    }

    json to_json(const FileContributionRecord& record) {
        return {
            {"path", record.path},
            {"author", record.key},
            {"insertions", record.insertions},
            {"deletions", record.deletions},
            {"commits", record.commits},
            {"last_commit", optional_time(record.last_commit)}
        };
    }

    json to_json(const PairingRecord& record) {
        return {
            {"author", record.key},
            {"partner", record.partner},
            {"partner_name", record.partner_name},
            {"total", record.total},
            {"as_driver", record.as_driver}
        };
    }

    json to_json(const PathStat& stat) {
        return {
            {"path", stat.path},
            {"insertions", stat.insertions},
            {"deletions", stat.deletions},
            {"files", stat.files},
            {"authors", stat.authors}
        };
    }

    json StatisticsTable::to_json() const {
        json scope = {
            {"repository", scope_.repository.string()},
            {"start_ref", scope_.start_ref},
            {"merge_policy", gcs::to_string(scope_.merge_policy)},
            {"path_prefix", scope_.path_prefix}
        };
        scope["exclude_ref"] = scope_.exclude_ref ? json(*scope_.exclude_ref) : json(nullptr);
        scope["since"] = optional_time(scope_.since);
        scope["until"] = optional_time(scope_.until);

        const Totals t = totals();
        json authors_json = json::array();
        for (const auto& record : authors()) {
            authors_json.push_back(stats::to_json(record));
        }

        json warnings_json = json::array();
        for (const auto& warning : warnings_) {
            warnings_json.push_back(warning.to_string());
        }

        return {
            {"scope", scope},
            {"partial", partial_},
            {"totals", {
                {"commits", t.commits},
                {"insertions", t.insertions},
                {"deletions", t.deletions},
                {"files", t.files},
                {"authors", t.authors}
            }},
            {"authors", authors_json},
            {"warnings", warnings_json}
        };
    }

}  // namespace gcs::stats
