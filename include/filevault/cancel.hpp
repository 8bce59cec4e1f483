#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include "filevault/error.hpp"

namespace filevault {

// Shared between the caller and running tasks; polled between chunks.
class CancelToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw Error(ErrorCode::Cancelled, "Operation cancelled");
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

// (bytes_done, bytes_total) for a single file.
using ProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

struct StreamHooks {
    ProgressFn progress;
    const CancelToken* cancel = nullptr;
    std::uint64_t total_bytes = 0;
};

}  // namespace filevault
