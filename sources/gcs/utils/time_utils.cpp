//
// Created by gregorian-rayne on 2/10/26.
//

#include "gcs/utils/time_utils.hpp"
#include "gcs/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gcs::time_utils
{
    namespace {

        /**
         * Reads exactly @p width decimal digits at @p pos.
         */
        std::optional<int> read_fixed(const std::string_view text, const std::size_t pos, const std::size_t width) {
            if (pos + width > text.size()) {
                return std::nullopt;
            }
            int value = 0;
            const char* first = text.data() + pos;
            const char* last = first + width;
            if (const auto [ptr, ec] = std::from_chars(first, last, value); ec != std::errc{} || ptr != last) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<std::chrono::sys_days> parse_date_part(const std::string_view text) {
            if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
                return std::nullopt;
            }
            const auto y = read_fixed(text, 0, 4);
            const auto m = read_fixed(text, 5, 2);
            const auto d = read_fixed(text, 8, 2);
            if (!y || !m || !d) {
                return std::nullopt;
            }
            const std::chrono::year_month_day ymd{
                std::chrono::year{*y},
                std::chrono::month{static_cast<unsigned>(*m)},
                std::chrono::day{static_cast<unsigned>(*d)}
            };
            if (!ymd.ok()) {
                return std::nullopt;
            }
            return std::chrono::sys_days{ymd};
        }

    }  // namespace

    std::optional<Timestamp> parse_timestamp(const std::string_view raw) {
        const std::string_view text = string_utils::trim(raw);
        if (text.empty()) {
            return std::nullopt;
        }

        if (std::ranges::all_of(text, [](const unsigned char c) { return std::isdigit(c); })) {
            std::int64_t seconds = 0;
            if (const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
                ec == std::errc{} && ptr == text.data() + text.size()) {
                return from_epoch_seconds(seconds);
            }
            return std::nullopt;
        }

        const auto day = parse_date_part(text);
        if (!day) {
            return std::nullopt;
        }
        if (text.size() == 10) {
            return Timestamp{*day};
        }

        std::string_view rest = text.substr(10);
        if (rest.back() == 'Z') {
            rest.remove_suffix(1);
        }
        if (rest.size() != 9 || (rest[0] != 'T' && rest[0] != ' ') || rest[3] != ':' || rest[6] != ':') {
            return std::nullopt;
        }
        const auto hh = read_fixed(rest, 1, 2);
        const auto mm = read_fixed(rest, 4, 2);
        const auto ss = read_fixed(rest, 7, 2);
        if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 60) {
            return std::nullopt;
        }

        return Timestamp{*day} + std::chrono::hours{*hh} + std::chrono::minutes{*mm} + std::chrono::seconds{*ss};
    }

    std::optional<Timestamp> parse_until(const std::string_view raw) {
        const auto ts = parse_timestamp(raw);
        if (!ts) {
            return std::nullopt;
        }
        if (const std::string_view text = string_utils::trim(raw); text.size() == 10 && parse_date_part(text)) {
            return *ts + std::chrono::days{1} - std::chrono::seconds{1};
        }
        return ts;
    }

    Timestamp from_epoch_seconds(const std::int64_t seconds) noexcept {
        return Timestamp{std::chrono::seconds{seconds}};
    }

    std::int64_t to_epoch_seconds(const Timestamp ts) noexcept {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    std::string format_iso8601(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::string format_date(const Timestamp ts) {
        return format_iso8601(ts).substr(0, 10);
    }

}  // namespace gcs::time_utils
