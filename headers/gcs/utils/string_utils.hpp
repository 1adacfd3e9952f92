//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_STRING_UTILS_HPP
#define GCS_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers for parsing git output and commit messages.
 *
 * ASCII-only case handling: names and emails are compared byte-wise after
 * lower-casing A-Z. Non-ASCII bytes pass through untouched.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace gcs::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on @p delimiter. Empty fields are kept; an empty input yields
     * a single empty field.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines, accepting both "\n" and "\r\n". A trailing
     * newline does not produce an extra empty line.
     */
    inline std::vector<std::string_view> lines(std::string_view s) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        while (start < s.size()) {
            std::size_t end = s.find('\n', start);
            if (end == std::string_view::npos) {
                end = s.size();
            }
            std::string_view line = s.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            result.push_back(line);
            start = end + 1;
        }
        return result;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline char ascii_lower(const char c) noexcept {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    /**
     * Case-insensitive (ASCII) prefix test.
     */
    inline bool istarts_with(const std::string_view s, const std::string_view prefix) noexcept {
        if (s.size() < prefix.size()) {
            return false;
        }
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            if (ascii_lower(s[i]) != ascii_lower(prefix[i])) {
                return false;
            }
        }
        return true;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), ascii_lower);
        return result;
    }

    /**
     * Case-insensitive (ASCII) substring test.
     */
    inline bool icontains(const std::string_view s, const std::string_view needle) {
        return to_lower(s).find(to_lower(needle)) != std::string::npos;
    }

    /**
     * Human-readable duration: "1.50s", "250.00ms", "42.00us".
     */
    inline std::string format_duration(const long long nanoseconds) {
        constexpr long long ns_per_s = 1000000000LL;
        constexpr long long ns_per_ms = 1000000LL;
        constexpr long long ns_per_us = 1000LL;

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed;

        if (nanoseconds >= 60 * ns_per_s) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(60 * ns_per_s) << "min";
        } else if (nanoseconds >= ns_per_s) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_s) << "s";
        } else if (nanoseconds >= ns_per_ms) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_ms) << "ms";
        } else if (nanoseconds >= ns_per_us) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_us) << "us";
        } else {
            oss << nanoseconds << "ns";
        }

        return oss.str();
    }

}  // namespace gcs::string_utils

#endif //GCS_STRING_UTILS_HPP
