//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef GCS_LOG_HPP
#define GCS_LOG_HPP

/**
 * @file log.hpp
 * @brief Verbosity-gated diagnostics.
 *
 * Messages go to stderr by default:
 *   error: <msg>
 *   warning: <msg>
 *   <msg>                 (info)
 *   [DEBUG] <msg>
 *
 * The sink can be replaced (tests capture output this way). All functions are
 * safe to call from worker threads.
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gcs::log {

    enum class Level {
        Quiet = 0,
        Error = 1,
        Warn = 2,
        Info = 3,
        Debug = 4
    };

    using Sink = std::function<void(Level, std::string_view)>;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() noexcept;
    [[nodiscard]] bool enabled(Level level) noexcept;

    /**
     * Replaces the output sink. Passing an empty function restores stderr.
     */
    void set_sink(Sink sink);

    void error(std::string_view msg);
    void warn(std::string_view msg);
    void info(std::string_view msg);
    void debug(std::string_view msg);

    [[nodiscard]] const char* to_string(Level level) noexcept;

    /**
     * Parses "quiet", "error", "warn"/"warning", "info", "debug" (any case).
     */
    [[nodiscard]] std::optional<Level> level_from_string(std::string_view str);

}  // namespace gcs::log

#endif //GCS_LOG_HPP
