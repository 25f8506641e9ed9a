#pragma once

#include <pthread.h>

namespace concurrency
{

/**
 * @brief Simple wrapper around a pthread mutex
 */
class Lock
{
  public:
    Lock();
    ~Lock();

    Lock(const Lock &) = delete;
    Lock &operator=(const Lock &) = delete;

    /// Locks the lock.
    void lock();

    /// Takes the lock only if nobody else holds it, returns false if it is busy.
    bool tryLock();

    // Unlocks the lock.
    void unlock();

  private:
    pthread_mutex_t handle;
};

} // namespace concurrency
