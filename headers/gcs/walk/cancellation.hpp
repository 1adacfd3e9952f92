//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef GCS_CANCELLATION_HPP
#define GCS_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace gcs {

    /**
     * Shared cancellation flag. Copies observe the same flag, so the caller
     * keeps one copy and hands another to the build.
     */
    class CancellationToken {
    public:
        CancellationToken()
            : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const noexcept {
            flag_->store(true, std::memory_order_relaxed);
        }

        [[nodiscard]] bool is_cancelled() const noexcept {
            return flag_->load(std::memory_order_relaxed);
        }

        void reset() const noexcept {
            flag_->store(false, std::memory_order_relaxed);
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

}  // namespace gcs

#endif //GCS_CANCELLATION_HPP
