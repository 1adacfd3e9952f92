//
// Created by gregorian-rayne on 2/20/26.
//

#ifndef GCS_STATS_COMMAND_HPP
#define GCS_STATS_COMMAND_HPP

/**
 * @file stats_command.hpp
 * @brief Shared options and table building for the statistics subcommands.
 *
 * Option precedence: built-in defaults, then --config FILE, then the
 * individual command-line options.
 */

#include "gcs/cli/commands/command.hpp"
#include "gcs/core/config.hpp"
#include "gcs/engine/statistics_engine.hpp"
#include "gcs/stats/statistics_table.hpp"

#include <memory>

namespace gcs::cli
{
    /**
     * Process exit codes.
     */
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitFailure = 1;
    inline constexpr int kExitUsage = 2;
    inline constexpr int kExitCancelled = 130;

    class StatsCommand : public Command {
    public:
        [[nodiscard]] std::vector<ArgDef> arguments() const override;

    protected:
        /**
         * Options specific to one subcommand, appended to the shared ones.
         */
        [[nodiscard]] virtual std::vector<ArgDef> extra_arguments() const { return {}; }

        /**
         * Resolves configuration from @p args; usage errors come back as
         * InvalidArgument or ConfigError.
         */
        [[nodiscard]] Result<core::Config, Error> resolve_config(const ParsedArgs& args) const;

        /**
         * Builds the table for @p args. Ctrl+C cancels the build.
         */
        [[nodiscard]] Result<engine::TablePtr, Error> build_table(const ParsedArgs& args);

        [[nodiscard]] static Result<stats::SortKey, Error> sort_key(const ParsedArgs& args);
        [[nodiscard]] static stats::SortOrder sort_order(const ParsedArgs& args);
        [[nodiscard]] static std::size_t top(const ParsedArgs& args);

        /**
         * Finds an author by canonical key, or by a unique case-insensitive
         * match on display name.
         */
        [[nodiscard]] static Result<std::string, Error> resolve_author(
            const stats::StatisticsTable& table,
            const std::string& query
        );

        /**
         * Prints @p error and maps it to an exit code.
         */
        int report_failure(const Error& error) const;

        /**
         * Prints the table's warnings (all of them with -v, a count otherwise).
         */
        void report_warnings(const stats::StatisticsTable& table) const;
    };

}  // namespace gcs::cli

#endif //GCS_STATS_COMMAND_HPP
