//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef GCS_CREDIT_HPP
#define GCS_CREDIT_HPP

/**
 * @file credit.hpp
 * @brief Integer split of line counts among a commit's identities.
 *
 * N identities and totals I / D: every identity receives floor(I / N) and
 * floor(D / N); the remainders go to index 0 (the primary author). The shares
 * always sum to exactly I and D.
 */

#include <cstdint>
#include <vector>

namespace gcs::stats {

    struct Share {
        std::uint64_t insertions = 0;
        std::uint64_t deletions = 0;

        bool operator==(const Share&) const = default;
    };

    /**
     * @return @p count shares; empty when @p count is 0.
     */
    [[nodiscard]] inline std::vector<Share> split_credit(
        const std::uint64_t insertions,
        const std::uint64_t deletions,
        const std::size_t count
    ) {
        if (count == 0) {
            return {};
        }

        const auto n = static_cast<std::uint64_t>(count);
        std::vector<Share> shares(count, Share{insertions / n, deletions / n});
        shares.front().insertions += insertions % n;
        shares.front().deletions += deletions % n;
        return shares;
    }

}  // namespace gcs::stats

#endif //GCS_CREDIT_HPP
