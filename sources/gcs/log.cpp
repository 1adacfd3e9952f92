//
// Created by gregorian-rayne on 2/10/26.
//

#include "gcs/log.hpp"
#include "gcs/utils/string_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace gcs::log
{
    namespace {

        std::atomic<Level> g_level{Level::Warn};
        std::mutex g_sink_mutex;
        Sink g_sink;

        void write_stderr(const Level level, const std::string_view msg) {
            switch (level) {
                case Level::Error: std::cerr << "error: " << msg << "\n"; break;
                case Level::Warn:  std::cerr << "warning: " << msg << "\n"; break;
                case Level::Debug: std::cerr << "[DEBUG] " << msg << "\n"; break;
                default:           std::cerr << msg << "\n"; break;
            }
        }

        void emit(const Level level, const std::string_view msg) {
            if (!enabled(level)) {
                return;
            }
            std::lock_guard lock(g_sink_mutex);
            if (g_sink) {
                g_sink(level, msg);
            } else {
                write_stderr(level, msg);
            }
        }

    }  // namespace

    void set_level(const Level level) noexcept {
        g_level.store(level);
    }

    Level level() noexcept {
        return g_level.load();
    }

    bool enabled(const Level level) noexcept {
        return level != Level::Quiet && static_cast<int>(level) <= static_cast<int>(g_level.load());
    }

    void set_sink(Sink sink) {
        std::lock_guard lock(g_sink_mutex);
        g_sink = std::move(sink);
    }

    void error(const std::string_view msg) { emit(Level::Error, msg); }
    void warn(const std::string_view msg) { emit(Level::Warn, msg); }
    void info(const std::string_view msg) { emit(Level::Info, msg); }
    void debug(const std::string_view msg) { emit(Level::Debug, msg); }

    const char* to_string(const Level level) noexcept {
        switch (level) {
            case Level::Quiet: return "quiet";
            case Level::Error: return "error";
            case Level::Warn:  return "warn";
            case Level::Info:  return "info";
            case Level::Debug: return "debug";
        }
        return "unknown";
    }

    std::optional<Level> level_from_string(const std::string_view str) {
        const std::string lower = string_utils::to_lower(string_utils::trim(str));
        if (lower == "quiet" || lower == "off") return Level::Quiet;
        if (lower == "error") return Level::Error;
        if (lower == "warn" || lower == "warning") return Level::Warn;
        if (lower == "info") return Level::Info;
        if (lower == "debug") return Level::Debug;
        return std::nullopt;
    }

}  // namespace gcs::log
