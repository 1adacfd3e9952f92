//
// Created by gregorian-rayne on 2/13/26.
//

#include "gcs/identity/identity.hpp"
#include "gcs/utils/string_utils.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace gcs::identity
{
    namespace {

        constexpr std::string_view kTrailerKeyword = "co-authored-by:";

        // Second byte of the two-byte UTF-8 sequences starting with 0xC3.
        constexpr std::array<std::pair<unsigned char, std::string_view>, 7> kUmlauts = {{
            {0x84, "Ae"},
            {0xA4, "ae"},
            {0x96, "Oe"},
            {0xB6, "oe"},
            {0x9C, "Ue"},
            {0xBC, "ue"},
            {0x9F, "ss"},
        }};

    }  // namespace

    bool is_valid_email(const std::string_view email) noexcept {
        const auto at = email.find('@');
        if (at == std::string_view::npos || at == 0 || at + 1 >= email.size()) {
            return false;
        }
        if (email.find('@', at + 1) != std::string_view::npos) {
            return false;
        }
        for (const char c : email) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>') {
                return false;
            }
        }
        return true;
    }

    std::string transliterate(const std::string_view text) {
        std::string result;
        result.reserve(text.size());

        for (std::size_t i = 0; i < text.size(); ++i) {
            if (static_cast<unsigned char>(text[i]) == 0xC3 && i + 1 < text.size()) {
                const auto next = static_cast<unsigned char>(text[i + 1]);
                bool replaced = false;
                for (const auto& [byte, replacement] : kUmlauts) {
                    if (byte == next) {
                        result.append(replacement);
                        replaced = true;
                        break;
                    }
                }
                if (replaced) {
                    ++i;
                    continue;
                }
            }
            result.push_back(text[i]);
        }
        return result;
    }

    std::string canonical_key(const Signature& signature, const bool transliterate_names) {
        if (const auto email = string_utils::trim(signature.email); is_valid_email(email)) {
            return string_utils::to_lower(email);
        }

        const auto name = string_utils::trim(signature.name);
        if (name.empty()) {
            return std::string(kUnknownAuthor);
        }
        if (transliterate_names) {
            return string_utils::to_lower(transliterate(name));
        }
        return string_utils::to_lower(name);
    }

    std::optional<Signature> parse_co_author_trailer(const std::string_view line) {
        std::string_view rest = string_utils::trim(line);

        bool matched = false;
        while (string_utils::istarts_with(rest, kTrailerKeyword)) {
            rest = string_utils::trim_left(rest.substr(kTrailerKeyword.size()));
            matched = true;
        }
        if (!matched) {
            return std::nullopt;
        }

        const auto open = rest.find('<');
        if (open == std::string_view::npos) {
            return std::nullopt;
        }
        const auto close = rest.find('>', open + 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }

        const auto name = string_utils::trim(rest.substr(0, open));
        if (name.empty()) {
            return std::nullopt;
        }

        return Signature{
            std::string(name),
            std::string(string_utils::trim(rest.substr(open + 1, close - open - 1)))
        };
    }

    std::vector<Signature> extract_co_authors(const std::string_view message) {
        std::vector<Signature> co_authors;
        for (const auto line : string_utils::lines(message)) {
            if (auto co_author = parse_co_author_trailer(line)) {
                co_authors.push_back(std::move(*co_author));
            }
        }
        return co_authors;
    }

}  // namespace gcs::identity
