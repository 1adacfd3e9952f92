//
// Created by gregorian-rayne on 2/18/26.
//

#ifndef GCS_CONFIG_HPP
#define GCS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for a statistics build.
 *
 * Example:
 * @code
 *     [repository]
 *     path = "."
 *     ref = "main"
 *     exclude = "v1.0"          # walk v1.0..main
 *
 *     [filters]
 *     since = "2024-01-01"
 *     until = "2024-12-31T23:59:59Z"
 *     path_prefix = "src"
 *
 *     [traversal]
 *     merge_policy = "first-parent"   # or "skip-merges"
 *
 *     [identity]
 *     transliterate = true
 *
 *     [identity.aliases]
 *     "old@example.com" = "new@example.com"
 *     "jdoe" = "Jane Doe <jane@example.com>"
 *
 *     [performance]
 *     num_threads = 0           # 0: hardware concurrency
 *     batch_size = 64
 *     snapshot_interval = 0
 *
 *     [logging]
 *     level = "warn"
 * @endcode
 */

#include "gcs/result.hpp"
#include "gcs/error.hpp"
#include "gcs/types.hpp"
#include "gcs/engine/statistics_engine.hpp"
#include "gcs/identity/identity_resolver.hpp"

#include <string>
#include <vector>

namespace gcs::core {

    struct RepositoryConfig {
        std::string path = ".";
        std::string ref = "HEAD";
        std::string exclude;
    };

    struct FilterConfig {
        std::string since;
        std::string until;
        std::string path_prefix;
    };

    struct TraversalConfig {
        MergePolicy merge_policy = MergePolicy::FirstParent;
    };

    struct IdentityConfig {
        bool transliterate = false;
        std::vector<identity::Alias> aliases;
    };

    struct PerformanceConfig {
        int num_threads = 0;
        int batch_size = 64;
        int snapshot_interval = 0;
    };

    struct LoggingConfig {
        std::string level = "warn";
    };

    struct Config {
        RepositoryConfig repository;
        FilterConfig filters;
        TraversalConfig traversal;
        IdentityConfig identity;
        PerformanceConfig performance;
        LoggingConfig logging;

        static Config default_config();

        /**
         * @return ConfigError for unreadable files, parse errors and values
         *         that fail validate().
         */
        static Result<Config, Error> load_from_file(const fs::path& path);
        static Result<Config, Error> load_from_string(const std::string& content);

        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Converts to a traversal scope; dates are parsed here.
         */
        [[nodiscard]] Result<TraversalScope, Error> to_scope() const;

        [[nodiscard]] engine::BuildOptions to_build_options() const;

        /**
         * Renders the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace gcs::core

#endif //GCS_CONFIG_HPP
