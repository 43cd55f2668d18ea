#pragma once
#include <atomic>
#include <memory>

namespace conductor::core::cancellation {

    // Shared flag flipped by the run manager and polled by long waits.
    using CancelToken = std::shared_ptr<std::atomic_bool>;

    inline CancelToken make_cancel_token() {
        return std::make_shared<std::atomic_bool>(false);
    }

    inline bool is_cancelled(const CancelToken& token) {
        return token && token->load();
    }

} // namespace conductor::core::cancellation
