//
// Created by gregorian-rayne on 2/13/26.
//

#include "gcs/identity/identity_resolver.hpp"
#include "gcs/utils/string_utils.hpp"

#include <algorithm>

namespace gcs::identity
{
    IdentityResolver::IdentityResolver(ResolverOptions options)
        : options_(std::move(options)) {
        for (const auto& alias : options_.aliases) {
            add_alias(alias);
        }
    }

    void IdentityResolver::add_alias(const Alias& alias) {
        ParsedAlias parsed;
        parsed.from = std::string(string_utils::trim(alias.from));
        if (parsed.from.empty()) {
            return;
        }

        const auto target = string_utils::trim(alias.to);
        const auto open = target.find('<');
        const auto close = target.rfind('>');
        if (open != std::string_view::npos && close != std::string_view::npos && close > open) {
            parsed.name = std::string(string_utils::trim(target.substr(0, open)));
            parsed.email = std::string(string_utils::trim(target.substr(open + 1, close - open - 1)));
            if (parsed.name->empty()) {
                parsed.name.reset();
            }
        } else if (is_valid_email(target)) {
            parsed.email = std::string(target);
        } else if (!target.empty()) {
            parsed.name = std::string(target);
        } else {
            return;
        }

        aliases_.push_back(std::move(parsed));
    }

    Signature IdentityResolver::normalize(const Signature& raw) const {
        Signature result{
            std::string(string_utils::trim(raw.name)),
            std::string(string_utils::trim(raw.email))
        };

        const auto it = std::ranges::find_if(aliases_, [&](const ParsedAlias& alias) {
            return alias.from == result.name ||
                   (!result.email.empty() && string_utils::to_lower(alias.from) == string_utils::to_lower(result.email));
        });
        if (it != aliases_.end()) {
            if (it->name) {
                result.name = *it->name;
            }
            if (it->email) {
                result.email = *it->email;
            }
        }

        if (options_.transliterate) {
            result.name = transliterate(result.name);
        }
        return result;
    }

    std::string IdentityResolver::key_of(const Signature& raw) const {
        return canonical_key(normalize(raw), options_.transliterate);
    }

    const AuthorIdentity& IdentityResolver::resolve(const Signature& raw) {
        const Signature normalized = normalize(raw);
        std::string key = canonical_key(normalized, options_.transliterate);

        if (const auto it = index_.find(key); it != index_.end()) {
            return identities_[it->second];
        }

        AuthorIdentity identity;
        identity.display_name = normalized.name.empty() ? key : normalized.name;
        identity.email = is_valid_email(normalized.email) ? normalized.email : std::string{};
        identity.key = std::move(key);

        index_.emplace(identity.key, identities_.size());
        identities_.push_back(std::move(identity));
        return identities_.back();
    }

    std::vector<AuthorIdentity> IdentityResolver::resolve_commit(
        const Signature& author,
        const std::string_view message
    ) {
        std::vector<AuthorIdentity> result;
        result.push_back(resolve(author));

        for (const auto& co_author : extract_co_authors(message)) {
            const AuthorIdentity& identity = resolve(co_author);
            const bool duplicate = std::ranges::any_of(result, [&](const AuthorIdentity& existing) {
                return existing.key == identity.key;
            });
            if (!duplicate) {
                result.push_back(identity);
            }
        }
        return result;
    }

    const AuthorIdentity* IdentityResolver::find(const std::string& key) const {
        const auto it = index_.find(key);
        return it == index_.end() ? nullptr : &identities_[it->second];
    }

}  // namespace gcs::identity
