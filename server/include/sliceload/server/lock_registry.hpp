#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sliceload::server
{

    /**
     * Process-wide map from session id to the mutex serializing that session.
     *
     * Entries are created on first acquire and dropped by release() once the
     * session completes. A Guard shares ownership of its mutex, so releasing
     * the entry while writers still hold or wait on the guard is safe; those
     * writers then find the session document gone.
     */
    class SessionLockRegistry
    {
    public:
        class Guard
        {
        public:
            explicit Guard(std::shared_ptr<std::mutex> mutex);

        private:
            std::shared_ptr<std::mutex> mutex_;
            std::unique_lock<std::mutex> lock_;
        };

        // Blocks until the session's mutex is held.
        Guard acquire(const std::string &session_id);

        void release(const std::string &session_id);

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    };

} // namespace sliceload::server
