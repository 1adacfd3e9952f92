//
// Created by gregorian-rayne on 2/20/26.
//

/**
 * @file files_cmd.cpp
 * @brief `gcs files AUTHOR`: per-file breakdown of one author.
 */

#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/cli/formatter.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace gcs::cli
{
    class FilesCommand final : public StatsCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "files";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Files one author changed, with their share of the lines";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gcs files AUTHOR [OPTIONS]";
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one author (email, key or part of a name)";
            }
            if (auto key = sort_key(args); key.is_err()) {
                return key.error().message() + ": " + args.get_or("sort", "");
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto table = build_table(args);
            if (table.is_err()) {
                return report_failure(table.error());
            }

            auto key = resolve_author(*table.value(), args.positional().front());
            if (key.is_err()) {
                print_error(key.error().to_string());
                return kExitFailure;
            }

            // Without --sort the files come out largest change first.
            const stats::SortKey sort = args.has("sort")
                ? sort_key(args).value_or(stats::SortKey::Insertions)
                : stats::SortKey::Insertions;
            std::vector<stats::FileContributionRecord> rows =
                table.value()->author_files(key.value(), sort, sort_order(args));
            if (const std::size_t limit = top(args); limit > 0 && rows.size() > limit) {
                rows.resize(limit);
            }

            const stats::ContributionRecord* author = table.value()->find_author(key.value());

            if (is_json()) {
                nlohmann::json out;
                out["author"] = stats::to_json(*author);
                out["files"] = nlohmann::json::array();
                for (const auto& row : rows) {
                    out["files"].push_back(stats::to_json(row));
                }
                std::cout << out.dump(2) << "\n";
                return kExitOk;
            }

            report_warnings(*table.value());
            const std::string heading = colors::enabled()
                ? std::string(colors::BOLD) + author->display_name + colors::RESET
                : author->display_name;
            print(heading + " <" + author->email + ">  " +
                  format_count(author->commits) + " commits, " +
                  format_count(author->files_touched) + " files");
            if (rows.empty()) {
                print("No line changes recorded for this author.");
                return kExitOk;
            }
            print(files_table(rows, 0).render());
            return kExitOk;
        }
    };

    namespace {
        struct FilesCommandRegistrar {
            FilesCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<FilesCommand>()
                );
            }
        } files_registrar;
    }
}  // namespace gcs::cli
