#include "sliceload/server/lock_registry.hpp"

namespace sliceload::server
{

    SessionLockRegistry::Guard::Guard(std::shared_ptr<std::mutex> mutex)
        : mutex_(std::move(mutex)), lock_(*mutex_) {}

    SessionLockRegistry::Guard SessionLockRegistry::acquire(const std::string &session_id)
    {
        std::shared_ptr<std::mutex> session_mutex;
        {
            std::lock_guard lock(mutex_);
            auto &entry = locks_[session_id];
            if (!entry)
            {
                entry = std::make_shared<std::mutex>();
            }
            session_mutex = entry;
        }
        // The registry mutex is not held while waiting on the session.
        return Guard(std::move(session_mutex));
    }

    void SessionLockRegistry::release(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        locks_.erase(session_id);
    }

    std::size_t SessionLockRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return locks_.size();
    }

} // namespace sliceload::server
