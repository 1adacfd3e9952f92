//
// Created by gregorian-rayne on 2/18/26.
//

#include "gcs/core/config.hpp"
#include "gcs/log.hpp"
#include "gcs/utils/string_utils.hpp"
#include "gcs/utils/time_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace gcs::core
{
    namespace {

        std::string quoted(const std::string& value) {
            std::string out = "\"";
            for (const char c : value) {
                if (c == '"' || c == '\\') {
                    out += '\\';
                }
                out += c;
            }
            out += '"';
            return out;
        }

    }  // namespace

    Config Config::default_config() {
        return Config{};
    }

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration file not found", path.string())
            );
        }

        std::ostringstream content;
        content << file.rdbuf();
        return load_from_string(content.str()).map_error([&path](Error error) {
            return error.with_context(path.string());
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (auto* repo_table = tbl["repository"].as_table()) {
                auto& repo = *repo_table;
                if (repo["path"]) config.repository.path = repo["path"].value_or(std::string{"."});
                if (repo["ref"]) config.repository.ref = repo["ref"].value_or(std::string{"HEAD"});
                if (repo["exclude"]) config.repository.exclude = repo["exclude"].value_or(std::string{});
            }

            if (auto* filters_table = tbl["filters"].as_table()) {
                auto& filters = *filters_table;
                if (filters["since"]) config.filters.since = filters["since"].value_or(std::string{});
                if (filters["until"]) config.filters.until = filters["until"].value_or(std::string{});
                if (filters["path_prefix"]) config.filters.path_prefix = filters["path_prefix"].value_or(std::string{});
            }

            if (auto* traversal_table = tbl["traversal"].as_table()) {
                auto& traversal = *traversal_table;
                if (traversal["merge_policy"]) {
                    const std::string policy = traversal["merge_policy"].value_or(std::string{"first-parent"});
                    const auto parsed = merge_policy_from_string(policy);
                    if (!parsed) {
                        return Result<Config, Error>::failure(
                            Error::config_error("Unknown merge_policy", policy)
                        );
                    }
                    config.traversal.merge_policy = *parsed;
                }
            }

            if (auto* ident_table = tbl["identity"].as_table()) {
                auto& ident = *ident_table;
                if (ident["transliterate"])
                    config.identity.transliterate = ident["transliterate"].value_or(false);

                if (auto* aliases = ident["aliases"].as_table()) {
                    for (auto&& [from, to] : *aliases) {
                        const auto target = to.value<std::string>();
                        if (!target) {
                            return Result<Config, Error>::failure(
                                Error::config_error("Alias target must be a string", std::string(from.str()))
                            );
                        }
                        config.identity.aliases.push_back(identity::Alias{std::string(from.str()), *target});
                    }
                }
            }

            if (auto* perf_table = tbl["performance"].as_table()) {
                auto& perf = *perf_table;
                if (perf["num_threads"])
                    config.performance.num_threads = perf["num_threads"].value_or(0);
                if (perf["batch_size"])
                    config.performance.batch_size = perf["batch_size"].value_or(64);
                if (perf["snapshot_interval"])
                    config.performance.snapshot_interval = perf["snapshot_interval"].value_or(0);
            }

            if (auto* logging_table = tbl["logging"].as_table()) {
                auto& logging = *logging_table;
                if (logging["level"])
                    config.logging.level = logging["level"].value_or(std::string{"warn"});
            }

            if (auto validation_result = config.validate(); validation_result.is_err()) {
                return Result<Config, Error>::failure(validation_result.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration", std::string(err.what()))
            );
        }
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (repository.path.empty()) {
            errors.emplace_back("repository.path must not be empty");
        }
        if (repository.ref.empty()) {
            errors.emplace_back("repository.ref must not be empty");
        }

        const auto since = filters.since.empty() ? std::nullopt : time_utils::parse_timestamp(filters.since);
        const auto until = filters.until.empty() ? std::nullopt : time_utils::parse_until(filters.until);
        if (!filters.since.empty() && !since) {
            errors.emplace_back("filters.since is not a date: " + filters.since);
        }
        if (!filters.until.empty() && !until) {
            errors.emplace_back("filters.until is not a date: " + filters.until);
        }
        if (since && until && *since > *until) {
            errors.emplace_back("filters.since is later than filters.until");
        }

        if (performance.num_threads < 0) {
            errors.emplace_back("num_threads must be non-negative");
        }
        if (performance.batch_size <= 0) {
            errors.emplace_back("batch_size must be positive");
        }
        if (performance.snapshot_interval < 0) {
            errors.emplace_back("snapshot_interval must be non-negative");
        }

        if (!log::level_from_string(logging.level)) {
            errors.emplace_back("unknown logging.level: " + logging.level);
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    Result<TraversalScope, Error> Config::to_scope() const {
        if (auto valid = validate(); valid.is_err()) {
            return Result<TraversalScope, Error>::failure(valid.error());
        }

        TraversalScope scope;
        scope.repository = repository.path;
        scope.start_ref = repository.ref;
        if (!repository.exclude.empty()) {
            scope.exclude_ref = repository.exclude;
        }
        if (!filters.since.empty()) {
            scope.since = time_utils::parse_timestamp(filters.since);
        }
        if (!filters.until.empty()) {
            scope.until = time_utils::parse_until(filters.until);
        }
        scope.path_prefix = filters.path_prefix;
        scope.merge_policy = traversal.merge_policy;
        return Result<TraversalScope, Error>::success(std::move(scope));
    }

    engine::BuildOptions Config::to_build_options() const {
        engine::BuildOptions options;
        options.num_threads = static_cast<unsigned int>(std::max(performance.num_threads, 0));
        options.batch_size = static_cast<std::size_t>(std::max(performance.batch_size, 1));
        options.snapshot_interval = static_cast<std::size_t>(std::max(performance.snapshot_interval, 0));
        options.identity.transliterate = identity.transliterate;
        options.identity.aliases = identity.aliases;
        return options;
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[repository]\n";
        ss << "path = " << quoted(repository.path) << "\n";
        ss << "ref = " << quoted(repository.ref) << "\n";
        if (!repository.exclude.empty()) {
            ss << "exclude = " << quoted(repository.exclude) << "\n";
        }
        ss << "\n";

        ss << "[filters]\n";
        if (!filters.since.empty()) ss << "since = " << quoted(filters.since) << "\n";
        if (!filters.until.empty()) ss << "until = " << quoted(filters.until) << "\n";
        ss << "path_prefix = " << quoted(filters.path_prefix) << "\n\n";

        ss << "[traversal]\n";
        ss << "merge_policy = " << quoted(gcs::to_string(traversal.merge_policy)) << "\n\n";

        ss << "[identity]\n";
        ss << "transliterate = " << (identity.transliterate ? "true" : "false") << "\n\n";
        if (!identity.aliases.empty()) {
            ss << "[identity.aliases]\n";
            for (const auto& alias : identity.aliases) {
                ss << quoted(alias.from) << " = " << quoted(alias.to) << "\n";
            }
            ss << "\n";
        }

        ss << "[performance]\n";
        ss << "num_threads = " << performance.num_threads << "\n";
        ss << "batch_size = " << performance.batch_size << "\n";
        ss << "snapshot_interval = " << performance.snapshot_interval << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(logging.level) << "\n";

        return ss.str();
    }

}  // namespace gcs::core
