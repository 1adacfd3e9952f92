//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef GCS_IDENTITY_HPP
#define GCS_IDENTITY_HPP

/**
 * @file identity.hpp
 * @brief Canonical author keys and co-author trailer parsing.
 *
 * Key rules:
 * - a syntactically valid email, trimmed and lower-cased, is the key;
 * - otherwise the trimmed, lower-cased display name is;
 * - with transliteration on, German umlauts and sharp s are spelled out
 *   first (Ä -> Ae, ß -> ss), so "Jürgen" and "Juergen" share a key.
 */

#include "gcs/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gcs::identity {

    /**
     * Key used when a signature has neither a usable email nor a name.
     */
    inline constexpr std::string_view kUnknownAuthor = "(unknown)";

    struct AuthorIdentity {
        std::string key;            // canonical key, unique per identity
        std::string display_name;   // first name observed in walk order
        std::string email;          // first email observed, may be empty

        bool operator==(const AuthorIdentity&) const = default;
    };

    /**
     * local@domain: exactly one '@', both parts non-empty, no whitespace and
     * no angle brackets.
     */
    [[nodiscard]] bool is_valid_email(std::string_view email) noexcept;

    /**
     * Replaces Ä ä Ö ö Ü ü ß (UTF-8) with Ae ae Oe oe Ue ue ss.
     */
    [[nodiscard]] std::string transliterate(std::string_view text);

    [[nodiscard]] std::string canonical_key(const Signature& signature, bool transliterate_names = false);

    /**
     * Parses one "Co-authored-by: Name <email>" line. The keyword is matched
     * case-insensitively and may be repeated. Lines with a missing '<' or '>'
     * or an empty name yield nullopt.
     */
    [[nodiscard]] std::optional<Signature> parse_co_author_trailer(std::string_view line);

    /**
     * All well-formed co-author trailers of @p message in message order.
     */
    [[nodiscard]] std::vector<Signature> extract_co_authors(std::string_view message);

}  // namespace gcs::identity

#endif //GCS_IDENTITY_HPP
