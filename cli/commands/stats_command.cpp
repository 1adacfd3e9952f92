//
// Created by gregorian-rayne on 2/20/26.
//

#include "gcs/cli/commands/stats_command.hpp"
#include "gcs/cli/formatter.hpp"
#include "gcs/cli/progress.hpp"
#include "gcs/git/repository.hpp"
#include "gcs/log.hpp"
#include "gcs/utils/string_utils.hpp"
#include "gcs/utils/time_utils.hpp"
#include "gcs/walk/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace gcs::cli
{
    namespace {

        std::atomic g_stop_requested{false};

        void handle_sigint(int) {
            g_stop_requested.store(true);
        }

        /**
         * Installs the SIGINT handler for its lifetime and forwards a
         * Ctrl+C to @p token.
         */
        class InterruptGuard {
        public:
            explicit InterruptGuard(CancellationToken token)
                : previous_(std::signal(SIGINT, handle_sigint)) {
                g_stop_requested.store(false);
                watcher_ = std::jthread([token = std::move(token)](const std::stop_token& stop) {
                    while (!stop.stop_requested()) {
                        if (g_stop_requested.load()) {
                            token.cancel();
                            return;
                        }
                        std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    }
                });
            }

            ~InterruptGuard() {
                watcher_.request_stop();
                if (watcher_.joinable()) {
                    watcher_.join();
                }
                std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
            }

            InterruptGuard(const InterruptGuard&) = delete;
            InterruptGuard& operator=(const InterruptGuard&) = delete;

        private:
            using Handler = void (*)(int);
            Handler previous_;
            std::jthread watcher_;
        };

        Result<Timestamp, Error> parse_date_option(const std::string& name, const std::string& value) {
            if (const auto ts = time_utils::parse_timestamp(value)) {
                return Result<Timestamp, Error>::success(*ts);
            }
            return Result<Timestamp, Error>::failure(
                Error::invalid_argument("--" + name + " expects YYYY-MM-DD[THH:MM:SS] or epoch seconds", value)
            );
        }

    }  // namespace

    std::vector<ArgDef> StatsCommand::arguments() const {
        std::vector<ArgDef> args = {
            {"repo", 'r', "Repository path", false, true, "", "PATH"},
            {"ref", 0, "Start reference", false, true, "", "REF"},
            {"exclude", 'x', "Exclude commits reachable from REF (REF..start)", false, true, "", "REF"},
            {"since", 0, "Only commits at or after DATE", false, true, "", "DATE"},
            {"until", 0, "Only commits at or before DATE", false, true, "", "DATE"},
            {"path", 'p', "Only count files under PREFIX", false, true, "", "PREFIX"},
            {"skip-merges", 0, "Do not credit merge commits", false, false, "", ""},
            {"transliterate", 0, "Spell out umlauts when merging names", false, false, "", ""},
            {"sort", 's', "Sort by commits, insertions, deletions, files, name, last-commit", false, true, "", "KEY"},
            {"asc", 0, "Sort ascending", false, false, "", ""},
            {"filter", 'f', "Only authors whose name or key contains TEXT", false, true, "", "TEXT"},
            {"top", 'n', "Number of rows to show (0 = all)", false, true, "0", "N"},
            {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
            {"jobs", 'j', "Diff worker threads (0 = all cores)", false, true, "", "N"},
            {"no-color", 0, "Disable colored output", false, false, "", ""},
        };
        for (auto& extra : extra_arguments()) {
            args.push_back(std::move(extra));
        }
        return args;
    }

    Result<core::Config, Error> StatsCommand::resolve_config(const ParsedArgs& args) const {
        core::Config config = core::Config::default_config();

        if (const auto path = args.get("config")) {
            auto loaded = core::Config::load_from_file(*path);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded).value();
            print_debug("Loaded configuration from " + *path);
        }

        if (const auto repo = args.get("repo")) config.repository.path = *repo;
        if (const auto ref = args.get("ref")) config.repository.ref = *ref;
        if (const auto exclude = args.get("exclude")) config.repository.exclude = *exclude;
        if (const auto since = args.get("since")) {
            if (auto parsed = parse_date_option("since", *since); parsed.is_err()) {
                return Result<core::Config, Error>::failure(parsed.error());
            }
            config.filters.since = *since;
        }
        if (const auto until = args.get("until")) {
            if (auto parsed = parse_date_option("until", *until); parsed.is_err()) {
                return Result<core::Config, Error>::failure(parsed.error());
            }
            config.filters.until = *until;
        }
        if (const auto prefix = args.get("path")) config.filters.path_prefix = *prefix;
        if (args.get_flag("skip-merges")) config.traversal.merge_policy = MergePolicy::SkipMerges;
        if (args.get_flag("transliterate")) config.identity.transliterate = true;

        if (args.has("jobs")) {
            const auto jobs = args.get_int("jobs");
            if (!jobs || *jobs < 0) {
                return Result<core::Config, Error>::failure(
                    Error::invalid_argument("--jobs expects a non-negative number", args.get_or("jobs", ""))
                );
            }
            config.performance.num_threads = *jobs;
        }

        if (args.get_flag("quiet")) {
            config.logging.level = "error";
        } else if (args.flag_count("verbose") >= 2) {
            config.logging.level = "debug";
        } else if (args.get_flag("verbose")) {
            config.logging.level = "info";
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<core::Config, Error>::failure(valid.error());
        }
        return Result<core::Config, Error>::success(std::move(config));
    }

    Result<engine::TablePtr, Error> StatsCommand::build_table(const ParsedArgs& args) {
        auto config = resolve_config(args);
        if (config.is_err()) {
            return Result<engine::TablePtr, Error>::failure(config.error());
        }

        log::set_level(log::level_from_string(config.value().logging.level).value_or(log::Level::Warn));
        if (args.get_flag("no-color")) {
            colors::set_enabled(false);
        }

        auto scope = config.value().to_scope();
        if (scope.is_err()) {
            return Result<engine::TablePtr, Error>::failure(scope.error());
        }

        auto repo = git::open_repository(scope.value().repository);
        if (repo.is_err()) {
            return Result<engine::TablePtr, Error>::failure(repo.error());
        }
        print_verbose("Repository: " + repo.value()->describe());

        engine::BuildOptions options = config.value().to_build_options();

        ProgressBar progress("Walking history");
        if (!is_quiet() && !is_json()) {
            options.on_progress = [&progress](const engine::BuildProgress& p) {
                progress.update(p.commits_folded, p.commits_discovered);
            };
        }

        const CancellationToken cancel;
        const InterruptGuard guard(cancel);
        const engine::StatisticsEngine engine(std::move(repo).value());
        auto table = engine.build(scope.value(), cancel, options);
        progress.finish();
        return table;
    }

    Result<stats::SortKey, Error> StatsCommand::sort_key(const ParsedArgs& args) {
        const auto value = args.get("sort");
        if (!value) {
            return Result<stats::SortKey, Error>::success(stats::SortKey::Commits);
        }
        if (const auto key = stats::sort_key_from_string(*value)) {
            return Result<stats::SortKey, Error>::success(*key);
        }
        return Result<stats::SortKey, Error>::failure(Error::invalid_argument("Unknown sort key", *value));
    }

    stats::SortOrder StatsCommand::sort_order(const ParsedArgs& args) {
        return args.get_flag("asc") ? stats::SortOrder::Ascending : stats::SortOrder::Descending;
    }

    std::size_t StatsCommand::top(const ParsedArgs& args) {
        const int n = args.get_int("top").value_or(0);
        return n > 0 ? static_cast<std::size_t>(n) : 0;
    }

    Result<std::string, Error> StatsCommand::resolve_author(
        const stats::StatisticsTable& table,
        const std::string& query
    ) {
        if (table.find_author(query)) {
            return Result<std::string, Error>::success(query);
        }
        if (const std::string lowered = string_utils::to_lower(string_utils::trim(query)); table.find_author(lowered)) {
            return Result<std::string, Error>::success(lowered);
        }

        std::vector<std::string> matches;
        for (const auto& record : table.authors(stats::SortKey::Name, stats::SortOrder::Ascending)) {
            if (string_utils::icontains(record.display_name, query)) {
                matches.push_back(record.key);
            }
        }
        if (matches.size() == 1) {
            return Result<std::string, Error>::success(matches.front());
        }
        if (matches.empty()) {
            return Result<std::string, Error>::failure(Error::not_found("No author matches", query));
        }
        return Result<std::string, Error>::failure(
            Error::invalid_argument("Ambiguous author, candidates: " + string_utils::join(matches, ", "), query)
        );
    }

    int StatsCommand::report_failure(const Error& error) const {
        switch (error.code()) {
            case ErrorCode::Cancelled:
                print_warning("Interrupted, no statistics were produced");
                return kExitCancelled;
            case ErrorCode::InvalidArgument:
            case ErrorCode::ConfigError:
                print_error(error.to_string());
                return kExitUsage;
            default:
                print_error(error.to_string());
                return kExitFailure;
        }
    }

    void StatsCommand::report_warnings(const stats::StatisticsTable& table) const {
        const auto& warnings = table.warnings();
        if (warnings.empty()) {
            return;
        }
        if (is_verbose()) {
            for (const auto& warning : warnings) {
                print_warning(warning.to_string());
            }
        } else {
            print_warning(std::to_string(warnings.size()) +
                          " commit(s) counted without line statistics (use -v for details)");
        }
    }

}  // namespace gcs::cli
