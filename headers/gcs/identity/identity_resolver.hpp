//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef GCS_IDENTITY_RESOLVER_HPP
#define GCS_IDENTITY_RESOLVER_HPP

/**
 * @file identity_resolver.hpp
 * @brief Maps raw signatures to AuthorIdentity records.
 *
 * The resolver is a lookup table keyed by canonical key. The first signature
 * seen for a key fixes the display name; later spellings only merge into it.
 * Not thread-safe: the engine resolves commits on the folding thread, in walk
 * order, which is what makes display names deterministic.
 */

#include "gcs/identity/identity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gcs::identity {

    /**
     * Rewrites a raw name or email before keys are computed.
     *
     * `from` matches a raw name exactly or a raw email case-insensitively.
     * `to` is one of "Name <email>" (both replaced), "email@domain" (email
     * replaced) or "Name" (name replaced).
     */
    struct Alias {
        std::string from;
        std::string to;
    };

    struct ResolverOptions {
        bool transliterate = false;
        std::vector<Alias> aliases;
    };

    class IdentityResolver {
    public:
        IdentityResolver() = default;
        explicit IdentityResolver(ResolverOptions options);

        void add_alias(const Alias& alias);

        /**
         * Applies aliases and transliteration to @p raw without registering it.
         */
        [[nodiscard]] Signature normalize(const Signature& raw) const;

        [[nodiscard]] std::string key_of(const Signature& raw) const;

        /**
         * Returns the identity for @p raw, registering it on first sight.
         */
        const AuthorIdentity& resolve(const Signature& raw);

        /**
         * Identities credited for one commit: the author first, then
         * co-authors in message order, each key at most once.
         */
        std::vector<AuthorIdentity> resolve_commit(const Signature& author, std::string_view message);

        [[nodiscard]] const AuthorIdentity* find(const std::string& key) const;

        [[nodiscard]] std::size_t size() const noexcept { return identities_.size(); }

        /**
         * Registered identities in registration order.
         */
        [[nodiscard]] const std::vector<AuthorIdentity>& identities() const noexcept { return identities_; }

    private:
        struct ParsedAlias {
            std::string from;
            std::optional<std::string> name;
            std::optional<std::string> email;
        };

        ResolverOptions options_;
        std::vector<ParsedAlias> aliases_;
        std::vector<AuthorIdentity> identities_;
        std::unordered_map<std::string, std::size_t> index_;
    };

}  // namespace gcs::identity

#endif //GCS_IDENTITY_RESOLVER_HPP
