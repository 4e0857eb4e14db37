#pragma once

#include <atomic>

namespace sliceload::client
{

    // Cooperative cancellation; observed only between slices.
    class CancellationToken
    {
    public:
        void cancel() noexcept { requested_.store(true); }

        // Returns whether cancellation was requested and clears the request,
        // so the next upload() call starts fresh.
        bool consume() noexcept { return requested_.exchange(false); }

    private:
        std::atomic<bool> requested_{false};
    };

} // namespace sliceload::client
