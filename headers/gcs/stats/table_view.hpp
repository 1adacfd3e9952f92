//
// Created by gregorian-rayne on 2/16/26.
//

#ifndef GCS_TABLE_VIEW_HPP
#define GCS_TABLE_VIEW_HPP

/**
 * @file table_view.hpp
 * @brief Presentation state over a finished StatisticsTable.
 *
 * Holds the sort key, order and a case-insensitive search filter. Changing
 * any of them recomputes rows from the shared table; totals are never
 * touched.
 */

#include "gcs/stats/statistics_table.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gcs::stats {

    class TableView {
    public:
        explicit TableView(std::shared_ptr<const StatisticsTable> table,
                           SortKey key = SortKey::Commits,
                           SortOrder order = SortOrder::Descending);

        void set_sort(SortKey key);
        void set_order(SortOrder order);
        void toggle_order();

        /**
         * Keeps authors whose display name or key contains @p needle
         * (ASCII case-insensitive). An empty needle clears the filter.
         */
        void set_filter(std::string needle);

        /**
         * Swaps in a rebuilt table, keeping sort and filter.
         */
        void set_table(std::shared_ptr<const StatisticsTable> table);

        [[nodiscard]] const std::vector<ContributionRecord>& rows() const noexcept { return rows_; }

        /**
         * File rows of @p key, sorted with the view's key and order.
         */
        [[nodiscard]] std::vector<FileContributionRecord> files_of(const std::string& key) const;

        [[nodiscard]] SortKey sort_key() const noexcept { return key_; }
        [[nodiscard]] SortOrder sort_order() const noexcept { return order_; }
        [[nodiscard]] const std::string& filter() const noexcept { return filter_; }
        [[nodiscard]] const StatisticsTable& table() const noexcept { return *table_; }

    private:
        void refresh();

        std::shared_ptr<const StatisticsTable> table_;
        SortKey key_;
        SortOrder order_;
        std::string filter_;
        std::vector<ContributionRecord> rows_;
    };

}  // namespace gcs::stats

#endif //GCS_TABLE_VIEW_HPP
