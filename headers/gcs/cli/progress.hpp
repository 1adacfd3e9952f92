//
// Created by gregorian-rayne on 2/19/26.
//

#ifndef GCS_PROGRESS_HPP
#define GCS_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Build progress on stderr.
 *
 * Drawn only when stderr is a terminal, so redirected and --json output stay
 * clean.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace gcs::cli
{
    struct ProgressStyle {
        std::string fill_char = "█";
        std::string empty_char = "░";
        std::size_t bar_width = 30;
    };

    class ProgressBar {
    public:
        explicit ProgressBar(std::string_view label, ProgressStyle style = {});
        ~ProgressBar();

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        /**
         * @param total 0 while the total is still unknown.
         */
        void update(std::size_t current, std::size_t total);

        /**
         * Clears the line. Called by the destructor if not called before.
         */
        void finish();

        [[nodiscard]] bool active() const noexcept { return enabled_ && !finished_; }

    private:
        void render() const;

        std::string label_;
        ProgressStyle style_;
        std::size_t current_ = 0;
        std::size_t total_ = 0;
        std::chrono::steady_clock::time_point start_time_;
        bool enabled_;
        bool finished_ = false;
    };

}  // namespace gcs::cli

#endif //GCS_PROGRESS_HPP
