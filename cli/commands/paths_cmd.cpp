//
// Created by gregorian-rayne on 2/21/26.
//

/**
 * @file paths_cmd.cpp
 * @brief `gcs paths [AUTHOR]`: change volume rolled up by directory.
 */

#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/cli/formatter.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace gcs::cli
{
    namespace {
        constexpr int kDefaultDepth = 4;
    }

    class PathsCommand final : public StatsCommand {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "paths";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Hot directories by lines changed";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gcs paths [AUTHOR] [OPTIONS]";
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "At most one author may be given";
            }
            if (args.has("depth")) {
                const auto depth = args.get_int("depth");
                if (!depth || *depth < 0) {
                    return "--depth expects a non-negative number";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto table = build_table(args);
            if (table.is_err()) {
                return report_failure(table.error());
            }

            std::optional<std::string> author;
            if (!args.positional().empty()) {
                auto key = resolve_author(*table.value(), args.positional().front());
                if (key.is_err()) {
                    print_error(key.error().to_string());
                    return kExitFailure;
                }
                author = key.value();
            }

            const auto depth = static_cast<std::size_t>(args.get_int("depth").value_or(kDefaultDepth));
            std::vector<stats::PathStat> rows = table.value()->hot_paths(depth, author);
            if (const std::size_t limit = top(args); limit > 0 && rows.size() > limit) {
                rows.resize(limit);
            }

            if (is_json()) {
                nlohmann::json out;
                out["depth"] = depth;
                out["author"] = author ? nlohmann::json(*author) : nlohmann::json(nullptr);
                out["paths"] = nlohmann::json::array();
                for (const auto& row : rows) {
                    out["paths"].push_back(stats::to_json(row));
                }
                std::cout << out.dump(2) << "\n";
                return kExitOk;
            }

            report_warnings(*table.value());
            if (rows.empty()) {
                print("No line changes in range.");
                return kExitOk;
            }
            print(paths_table(rows, 0).render());
            return kExitOk;
        }

    protected:
        [[nodiscard]] std::vector<ArgDef> extra_arguments() const override {
            return {
                {"depth", 'd', "Directory levels to roll up to", false, true, std::to_string(kDefaultDepth), "N"},
            };
        }
    };

    namespace {
        struct PathsCommandRegistrar {
            PathsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<PathsCommand>()
                );
            }
        } paths_registrar;
    }
}  // namespace gcs::cli
