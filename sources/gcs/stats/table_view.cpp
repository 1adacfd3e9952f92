//
// Created by gregorian-rayne on 2/16/26.
//

#include "gcs/stats/table_view.hpp"
#include "gcs/utils/string_utils.hpp"

#include <algorithm>

namespace gcs::stats
{
    TableView::TableView(std::shared_ptr<const StatisticsTable> table, const SortKey key, const SortOrder order)
        : table_(table ? std::move(table) : std::make_shared<const StatisticsTable>())
        , key_(key)
        , order_(order) {
        refresh();
    }

    void TableView::set_sort(const SortKey key) {
        key_ = key;
        refresh();
    }

    void TableView::set_order(const SortOrder order) {
        order_ = order;
        refresh();
    }

    void TableView::toggle_order() {
        set_order(order_ == SortOrder::Descending ? SortOrder::Ascending : SortOrder::Descending);
    }

    void TableView::set_filter(std::string needle) {
        filter_ = std::string(string_utils::trim(needle));
        refresh();
    }

    void TableView::set_table(std::shared_ptr<const StatisticsTable> table) {
        if (table) {
            table_ = std::move(table);
            refresh();
        }
    }

    std::vector<FileContributionRecord> TableView::files_of(const std::string& key) const {
        return table_->author_files(key, key_, order_);
    }

    void TableView::refresh() {
        rows_ = table_->authors(key_, order_);
        if (filter_.empty()) {
            return;
        }
        std::erase_if(rows_, [this](const ContributionRecord& r) {
            return !string_utils::icontains(r.display_name, filter_) &&
                   !string_utils::icontains(r.key, filter_);
        });
    }

}  // namespace gcs::stats
