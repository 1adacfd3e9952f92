//
// Created by gregorian-rayne on 2/19/26.
//

#include "gcs/cli/progress.hpp"
#include "gcs/utils/string_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace gcs::cli
{
    namespace {

        bool stderr_is_tty() {
            return isatty(fileno(stderr)) != 0;
        }

        void clear_line() {
            std::cerr << "\r\033[K";
        }

    }  // namespace

    ProgressBar::ProgressBar(const std::string_view label, ProgressStyle style)
        : label_(label)
        , style_(std::move(style))
        , start_time_(std::chrono::steady_clock::now())
        , enabled_(stderr_is_tty())
    {}

    ProgressBar::~ProgressBar() {
        finish();
    }

    void ProgressBar::update(const std::size_t current, const std::size_t total) {
        current_ = current;
        total_ = total;
        if (active()) {
            render();
        }
    }

    void ProgressBar::finish() {
        if (finished_) return;
        finished_ = true;
        if (enabled_) {
            clear_line();
            std::cerr << std::flush;
        }
    }

    void ProgressBar::render() const {
        std::ostringstream ss;
        ss << "\r";
        if (!label_.empty()) {
            ss << label_ << " ";
        }

        if (total_ > 0) {
            const double pct = std::min(1.0, static_cast<double>(current_) / static_cast<double>(total_));
            const auto filled = static_cast<std::size_t>(pct * static_cast<double>(style_.bar_width));

            ss << "[";
            for (std::size_t i = 0; i < style_.bar_width; ++i) {
                ss << (i < filled ? style_.fill_char : style_.empty_char);
            }
            ss << "] " << std::fixed << std::setprecision(0) << (pct * 100) << "% "
               << current_ << "/" << total_;
        } else {
            ss << current_ << " commit(s)";
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
        ss << " " << string_utils::format_duration(elapsed.count());

        clear_line();
        std::cerr << ss.str() << std::flush;
    }

}  // namespace gcs::cli
