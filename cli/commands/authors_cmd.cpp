//
// Created by gregorian-rayne on 2/20/26.
//

/**
 * @file authors_cmd.cpp
 * @brief `gcs authors`: the contribution table, one row per author.
 */

#include "gcs/gcs.hpp"
#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/cli/formatter.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace gcs::cli
{
    class AuthorsCommand final : public StatsCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "authors";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Commits, insertions and deletions per author";
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (!args.positional().empty()) {
                return "Unknown command or unexpected argument: " + args.positional().front();
            }
            if (auto key = sort_key(args); key.is_err()) {
                return key.error().message() + ": " + args.get_or("sort", "");
            }
            if (args.has("top") && !args.get_int("top")) {
                return "--top expects a number";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto table = build_table(args);
            if (table.is_err()) {
                return report_failure(table.error());
            }

            stats::TableView view(table.value(), sort_key(args).value_or(stats::SortKey::Commits), sort_order(args));
            view.set_filter(args.get_or("filter", ""));

            std::vector<stats::ContributionRecord> rows = view.rows();
            if (const std::size_t limit = top(args); limit > 0 && rows.size() > limit) {
                rows.resize(limit);
            }

            if (is_json()) {
                nlohmann::json out = table.value()->to_json();
                out["authors"] = nlohmann::json::array();
                for (const auto& row : rows) {
                    out["authors"].push_back(stats::to_json(row));
                }
                std::cout << out.dump(2) << "\n";
                return kExitOk;
            }

            report_warnings(*table.value());
            if (rows.empty()) {
                print("No commits in range.");
                return kExitOk;
            }
            print(authors_table(rows, table.value()->totals(), 0).render());
            print(summary_line(table.value()->totals()));
            return kExitOk;
        }
    };

    namespace {
        struct AuthorsCommandRegistrar {
            AuthorsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AuthorsCommand>()
                );
            }
        } authors_registrar;
    }
}  // namespace gcs::cli
