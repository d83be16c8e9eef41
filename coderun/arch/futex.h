/* futex.h                                                         -*- C++ -*-
   Jeremy Barnes, 25 January 2012
   Copyright (c) 2012 Datacratic.  All rights reserved.

   Waiting for, and waking up waiters on, a 32 bit value.
*/

#pragma once

#include <limits.h>
#include <linux/futex.h>
#include <sys/syscall.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <cmath>


namespace Coderun {

namespace Futex {

inline long call(void * addr, int op, int val,
                 const struct timespec * timeout = nullptr)
{
    return ::syscall(SYS_futex, addr, op, val, timeout, nullptr, 0);
}

/* Blocks while *addr == oldValue, for at most waitTime seconds.  An
   infinite waitTime waits until woken up. */
inline long wait(void * addr, int oldValue, double waitTime)
{
    if (!std::isfinite(waitTime))
        return call(addr, FUTEX_WAIT, oldValue);

    struct timespec timeout;
    if (waitTime < 0)
        waitTime = 0;
    timeout.tv_sec = waitTime;
    timeout.tv_nsec = (waitTime - timeout.tv_sec) * 1000000000.0;
    return call(addr, FUTEX_WAIT, oldValue, &timeout);
}

} // namespace Futex

inline void futex_wake(int & futex, int nToWake = INT_MAX)
{
    Futex::call(&futex, FUTEX_WAKE, nToWake);
}

template<typename T>
inline void futex_wake(std::atomic<T> & futex, int nToWake = INT_MAX)
{
    static_assert(sizeof(std::atomic<T>) == 4,
                  "futex type must be a 32-bit value");
    Futex::call(&futex, FUTEX_WAKE, nToWake);
}

/** Returns -1 with errno set to EAGAIN when the value was not oldValue, or
    to ETIMEDOUT when the wait timed out. */
inline long futex_wait(const int & futex, int oldValue,
                       double waitTime = INFINITY)
{
    return Futex::wait(&const_cast<int &>(futex), oldValue, waitTime);
}

template<typename T>
inline long futex_wait(std::atomic<T> & futex, int oldValue,
                       double waitTime = INFINITY)
{
    static_assert(sizeof(std::atomic<T>) == 4,
                  "futex type must be a 32-bit value");
    return Futex::wait(&futex, oldValue, waitTime);
}

} // namespace Coderun
