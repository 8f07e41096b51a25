#pragma once

// Copyright 2025 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Clang thread safety analysis annotations, limited to the subset used by the
// proxy: per-destination state is GUARDED_BY a Mutex and accessed through a
// scoped MutexLocker.
//
// https://clang.llvm.org/docs/ThreadSafetyAnalysis.html

#ifndef TPUPROXY_THREAD_ANNOTATIONS_H_
#define TPUPROXY_THREAD_ANNOTATIONS_H_

#include <mutex>

#if defined(__clang__) && (!defined(SWIG))
#define THREAD_ANNOTATION_ATTRIBUTE__(x) __attribute__((x))
#else
#define THREAD_ANNOTATION_ATTRIBUTE__(x) // no-op
#endif

#define GUARDED_BY(x) THREAD_ANNOTATION_ATTRIBUTE__(guarded_by(x))

#define REQUIRES(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(requires_capability(__VA_ARGS__))

#define LOCKS_EXCLUDED(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(locks_excluded(__VA_ARGS__))

#define EXCLUSIVE_LOCK_FUNCTION(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(exclusive_lock_function(__VA_ARGS__))

#define UNLOCK_FUNCTION(...) \
    THREAD_ANNOTATION_ATTRIBUTE__(unlock_function(__VA_ARGS__))

#define LOCKABLE THREAD_ANNOTATION_ATTRIBUTE__(lockable)

#define SCOPED_LOCKABLE THREAD_ANNOTATION_ATTRIBUTE__(scoped_lockable)

namespace tpuproxy
{

class LOCKABLE Mutex
{
  private:
    std::mutex mMutex;

  public:
    void
    Lock() EXCLUSIVE_LOCK_FUNCTION()
    {
        mMutex.lock();
    }

    void
    Unlock() UNLOCK_FUNCTION()
    {
        mMutex.unlock();
    }
};

// Acquires the mutex in its constructor and releases it in its destructor.
class SCOPED_LOCKABLE MutexLocker
{
  private:
    Mutex& mut;

  public:
    MutexLocker(Mutex& mu) EXCLUSIVE_LOCK_FUNCTION(mu) : mut(mu)
    {
        mu.Lock();
    }
    ~MutexLocker() UNLOCK_FUNCTION()
    {
        mut.Unlock();
    }
    MutexLocker(MutexLocker const&) = delete;
    MutexLocker& operator=(MutexLocker const&) = delete;
};
}

#endif // TPUPROXY_THREAD_ANNOTATIONS_H_
