//
// Created by gregorian-rayne on 2/21/26.
//

/**
 * @file pairs_cmd.cpp
 * @brief `gcs pairs [AUTHOR]`: who co-authors with whom.
 */

#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/cli/formatter.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace gcs::cli
{
    class PairsCommand final : public StatsCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "pairs";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Pair-programming partners from Co-authored-by trailers";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gcs pairs [AUTHOR] [OPTIONS]";
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "At most one author may be given";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto table = build_table(args);
            if (table.is_err()) {
                return report_failure(table.error());
            }

            std::vector<std::string> keys;
            if (!args.positional().empty()) {
                auto key = resolve_author(*table.value(), args.positional().front());
                if (key.is_err()) {
                    print_error(key.error().to_string());
                    return kExitFailure;
                }
                keys.push_back(key.value());
            } else {
                for (const auto& record : table.value()->authors(stats::SortKey::Commits, stats::SortOrder::Descending)) {
                    if (!table.value()->pairings(record.key).empty()) {
                        keys.push_back(record.key);
                    }
                }
            }

            const std::size_t limit = top(args);

            if (is_json()) {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& key : keys) {
                    nlohmann::json entry;
                    entry["author"] = key;
                    entry["partners"] = nlohmann::json::array();
                    auto rows = table.value()->pairings(key);
                    if (limit > 0 && rows.size() > limit) {
                        rows.resize(limit);
                    }
                    for (const auto& row : rows) {
                        entry["partners"].push_back(stats::to_json(row));
                    }
                    out.push_back(std::move(entry));
                }
                std::cout << out.dump(2) << "\n";
                return kExitOk;
            }

            report_warnings(*table.value());
            if (keys.empty() || table.value()->pairings(keys.front()).empty()) {
                print("No co-authored commits in range.");
                return kExitOk;
            }
            for (const auto& key : keys) {
                const auto* author = table.value()->find_author(key);
                print(pairs_table(author ? author->display_name : key, table.value()->pairings(key), limit).render());
            }
            return kExitOk;
        }
    };

    namespace {
        struct PairsCommandRegistrar {
            PairsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<PairsCommand>()
                );
            }
        } pairs_registrar;
    }
}  // namespace gcs::cli
