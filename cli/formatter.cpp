//
// Created by gregorian-rayne on 2/19/26.
//

#include "gcs/cli/formatter.hpp"
#include "gcs/utils/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace gcs::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";
        const char* GREEN = "\033[32m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_count(const std::uint64_t count) {
        std::string result = std::to_string(count);

        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string format_date(const std::optional<Timestamp>& ts) {
        return ts ? time_utils::format_date(*ts) : "-";
    }

    std::string format_path(const std::string& path, const std::size_t max_width) {
        if (path.length() <= max_width) {
            return path;
        }
        const std::string ellipsis = "...";
        return ellipsis + path.substr(path.length() - max_width + ellipsis.length());
    }

    std::string bar_graph(const double value, double max_value, const std::size_t width) {
        if (max_value <= 0) max_value = 1.0;
        const double pct = std::clamp(value / max_value, 0.0, 1.0);
        const auto filled = static_cast<std::size_t>(pct * static_cast<double>(width));

        std::string result;
        if (colors::enabled()) {
            result += colors::GREEN;
            for (std::size_t i = 0; i < filled; ++i) {
                result += "█";
            }
            result += colors::RESET;
            result += colors::DIM;
            for (std::size_t i = filled; i < width; ++i) {
                result += "░";
            }
            result += colors::RESET;
        } else {
            result.append(filled, '#');
            result.append(width - filled, '-');
        }
        return result;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
    }

    void Table::clear() {
        rows_.clear();
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                if (i < row.size()) {
                    max_width = std::max(max_width, row[i].length());
                }
            }
            columns_[i].width = max_width;
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header = false) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else if (i + 1 < temp.columns_.size()) {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i + 1 < temp.columns_.size()) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i + 1 < temp.columns_.size()) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (const auto& row : temp.rows_) {
            render_row(row);
        }
    }

    // ============================================================================
    // Statistics tables
    // ============================================================================

    namespace {

        std::size_t row_limit(const std::size_t size, const std::size_t limit) {
            return limit == 0 ? size : std::min(size, limit);
        }

        std::string share_of(const std::uint64_t part, const std::uint64_t whole) {
            if (whole == 0) {
                return "-";
            }
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1)
               << 100.0 * static_cast<double>(part) / static_cast<double>(whole) << "%";
            return ss.str();
        }

    }  // namespace

    Table authors_table(
        const std::vector<stats::ContributionRecord>& rows,
        const stats::Totals& totals,
        const std::size_t limit
    ) {
        Table table({
            {"#", 0, true},
            {"Author", 0, false},
            {"Commits", 0, true},
            {"Added", 0, true},
            {"Removed", 0, true},
            {"Files", 0, true},
            {"Share", 0, true},
            {"Last commit", 0, false},
            {"Key", 0, false},
        });

        const std::uint64_t changed = totals.insertions + totals.deletions;
        for (std::size_t i = 0; i < row_limit(rows.size(), limit); ++i) {
            const auto& r = rows[i];
            table.add_row({
                std::to_string(i + 1),
                r.display_name,
                format_count(r.commits),
                "+" + format_count(r.insertions),
                "-" + format_count(r.deletions),
                format_count(r.files_touched),
                share_of(r.insertions + r.deletions, changed),
                format_date(r.last_commit),
                r.key
            });
        }
        return table;
    }

    Table files_table(const std::vector<stats::FileContributionRecord>& rows, const std::size_t limit) {
        Table table({
            {"Commits", 0, true},
            {"Added", 0, true},
            {"Removed", 0, true},
            {"Last commit", 0, false},
            {"Path", 0, false},
        });

        for (std::size_t i = 0; i < row_limit(rows.size(), limit); ++i) {
            const auto& r = rows[i];
            table.add_row({
                format_count(r.commits),
                "+" + format_count(r.insertions),
                "-" + format_count(r.deletions),
                format_date(r.last_commit),
                format_path(r.path)
            });
        }
        return table;
    }

    Table paths_table(const std::vector<stats::PathStat>& rows, const std::size_t limit) {
        Table table({
            {"Changes", 0, true},
            {"", 0, false},
            {"Added", 0, true},
            {"Removed", 0, true},
            {"Files", 0, true},
            {"Authors", 0, true},
            {"Path", 0, false},
        });

        const double top = rows.empty() ? 0.0 : static_cast<double>(rows.front().insertions + rows.front().deletions);
        for (std::size_t i = 0; i < row_limit(rows.size(), limit); ++i) {
            const auto& r = rows[i];
            const auto changes = r.insertions + r.deletions;
            table.add_row({
                format_count(changes),
                bar_graph(static_cast<double>(changes), top, 16),
                "+" + format_count(r.insertions),
                "-" + format_count(r.deletions),
                format_count(r.files),
                format_count(r.authors),
                format_path(r.path)
            });
        }
        return table;
    }

    Table pairs_table(
        const std::string& display_name,
        const std::vector<stats::PairingRecord>& rows,
        const std::size_t limit
    ) {
        Table table({
            {"Author", 0, false},
            {"Partner", 0, false},
            {"Shared", 0, true},
            {"Driving", 0, true},
            {"Navigating", 0, true},
        });

        for (std::size_t i = 0; i < row_limit(rows.size(), limit); ++i) {
            const auto& r = rows[i];
            table.add_row({
                i == 0 ? display_name : "",
                r.partner_name,
                format_count(r.total),
                format_count(r.as_driver),
                format_count(r.total - r.as_driver)
            });
        }
        return table;
    }

    std::string summary_line(const stats::Totals& totals) {
        std::ostringstream ss;
        ss << format_count(totals.commits) << " commit(s), "
           << format_count(totals.authors) << " author(s), "
           << format_count(totals.files) << " file(s), "
           << "+" << format_count(totals.insertions) << " / -" << format_count(totals.deletions);
        return ss.str();
    }

}  // namespace gcs::cli
