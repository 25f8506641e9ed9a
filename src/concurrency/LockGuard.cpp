#include "LockGuard.h"

namespace concurrency
{

LockGuard::LockGuard(Lock *lock) : lock(lock)
{
    lock->lock();
}

LockGuard::~LockGuard()
{
    lock->unlock();
}

TryLockGuard::TryLockGuard(Lock *lock) : lock(lock), locked(lock->tryLock()) {}

TryLockGuard::~TryLockGuard()
{
    if (locked)
        lock->unlock();
}

} // namespace concurrency
