#pragma once

#include "Lock.h"

namespace concurrency
{

/**
 * @brief RAII lock guard
 */
class LockGuard
{
  public:
    explicit LockGuard(Lock *lock);
    ~LockGuard();

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

  private:
    Lock *lock;
};

/**
 * @brief RAII guard that only takes the lock if it is free
 *
 * Used for single-flight sections: check owns() before doing the work.
 */
class TryLockGuard
{
  public:
    explicit TryLockGuard(Lock *lock);
    ~TryLockGuard();

    TryLockGuard(const TryLockGuard &) = delete;
    TryLockGuard &operator=(const TryLockGuard &) = delete;

    bool owns() const { return locked; }

  private:
    Lock *lock;
    bool locked;
};

} // namespace concurrency
