/* timers.h                                                        -*- C++ -*-
   Jeremy Barnes, 1 April 2009
   Copyright (c) 2009 Jeremy Barnes.  All rights reserved.

   Wall-clock timers and sleeping.
*/

#ifndef __coderun__arch__timers_h__
#define __coderun__arch__timers_h__

#include <sys/time.h>
#include <sys/select.h>
#include <cerrno>
#include <string.h>
#include <string>
#include "exception.h"


namespace Coderun {

inline double wall_time()
{
    struct timeval tv;
    int res = gettimeofday(&tv, 0);
    if (res != 0)
        throw Exception("gettimeofday() returned "
                        + std::string(strerror(errno)));

    return tv.tv_sec + (tv.tv_usec / 1000000.0);
}

struct Timer {
    double wall_;

    Timer()
    {
        restart();
    }

    void restart()
    {
        wall_ = wall_time();
    }

    double elapsed_wall() const { return wall_time() - wall_; }
};

inline void sleep(double sleepTime)
{
    long secs = sleepTime;
    long usec = (sleepTime - secs) * 1000000;
    struct timeval timeout = { secs, usec };
    for (;;) {
        if (timeout.tv_sec < 0 || timeout.tv_usec < 0) break;
        int res = select(0, 0, 0, 0, &timeout);
        if (res == -1 && errno == EINTR) continue;
        else if (res == -1)
            throw Exception("error sleeping: %s, secs %ld, usec %ld",
                            strerror(errno), (long)timeout.tv_sec,
                            (long)timeout.tv_usec);
        else break;
    }
}

} // namespace Coderun

#endif /* __coderun__arch__timers_h__ */
