//
// Created by gregorian-rayne on 2/19/26.
//

#ifndef GCS_FORMATTER_HPP
#define GCS_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal rendering of statistics tables.
 */

#include "gcs/types.hpp"
#include "gcs/stats/statistics_table.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gcs::cli
{
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;
        extern const char* GREEN;

        /**
         * True when colors are enabled and stdout is a terminal.
         */
        bool enabled();
        void set_enabled(bool enable);

    }  // namespace colors

    [[nodiscard]] bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Aligned plain-text table.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);
        void clear();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        bool show_headers_ = true;
    };

    /**
     * Formats a count with comma separators: 1234567 -> "1,234,567".
     */
    [[nodiscard]] std::string format_count(std::uint64_t count);

    /**
     * "YYYY-MM-DD", or "-" when absent.
     */
    [[nodiscard]] std::string format_date(const std::optional<Timestamp>& ts);

    /**
     * Truncates from the left with "..." to fit @p max_width.
     */
    [[nodiscard]] std::string format_path(const std::string& path, std::size_t max_width = 60);

    /**
     * Bar of @p width cells filled in proportion to value / max_value.
     */
    [[nodiscard]] std::string bar_graph(double value, double max_value, std::size_t width = 20);

    // Table builders for each subcommand. @p limit 0 means all rows.

    [[nodiscard]] Table authors_table(const std::vector<stats::ContributionRecord>& rows,
                                      const stats::Totals& totals, std::size_t limit);
    [[nodiscard]] Table files_table(const std::vector<stats::FileContributionRecord>& rows, std::size_t limit);
    [[nodiscard]] Table paths_table(const std::vector<stats::PathStat>& rows, std::size_t limit);
    [[nodiscard]] Table pairs_table(const std::string& display_name,
                                    const std::vector<stats::PairingRecord>& rows, std::size_t limit);

    /**
     * One-line summary: commits, authors, files, +insertions / -deletions.
     */
    [[nodiscard]] std::string summary_line(const stats::Totals& totals);

}  // namespace gcs::cli

#endif //GCS_FORMATTER_HPP
