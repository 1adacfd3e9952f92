//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef GCS_TIME_UTILS_HPP
#define GCS_TIME_UTILS_HPP

#include "gcs/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gcs::time_utils {

    /**
     * Parses a point in time given as
     *   - "YYYY-MM-DD" (midnight UTC),
     *   - "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z' (UTC),
     *   - or seconds since the epoch.
     *
     * @return The timestamp, or nullopt for anything else.
     */
    [[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

    /**
     * Like parse_timestamp, for the inclusive end of a window: a bare
     * "YYYY-MM-DD" means the last second of that day (23:59:59 UTC).
     */
    [[nodiscard]] std::optional<Timestamp> parse_until(std::string_view text);

    /**
     * Converts seconds since the epoch to a Timestamp.
     */
    [[nodiscard]] Timestamp from_epoch_seconds(std::int64_t seconds) noexcept;

    [[nodiscard]] std::int64_t to_epoch_seconds(Timestamp ts) noexcept;

    /**
     * Formats as "YYYY-MM-DDTHH:MM:SSZ" (UTC).
     */
    [[nodiscard]] std::string format_iso8601(Timestamp ts);

    /**
     * Formats as "YYYY-MM-DD" (UTC).
     */
    [[nodiscard]] std::string format_date(Timestamp ts);

}  // namespace gcs::time_utils

#endif //GCS_TIME_UTILS_HPP
