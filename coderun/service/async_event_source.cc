/* async_event_source.cc
   Jeremy Barnes, 9 November 2012
*/

#include "async_event_source.h"
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <sys/timerfd.h>
#include "coderun/arch/exception.h"
#include "coderun/arch/futex.h"
#include <iostream>
#include "message_loop.h"


using namespace std;

namespace Coderun {

/*****************************************************************************/
/* ASYNC EVENT SOURCE                                                        */
/*****************************************************************************/

void
AsyncEventSource::
disconnect()
{
    if (!parent_)
        return;
    parent_->removeSource(this);
}

void
AsyncEventSource::
waitConnectionState(int state)
    const
{
    while (connectionState_ != state) {
        int oldVal = connectionState_;
        futex_wait(connectionState_, oldVal);
    }
}

/*****************************************************************************/
/* PERIODIC EVENT SOURCE                                                     */
/*****************************************************************************/

PeriodicEventSource::
PeriodicEventSource()
    : timerFd(-1),
      timePeriodSeconds(0)
{
}

PeriodicEventSource::
PeriodicEventSource(double timePeriodSeconds,
                    std::function<void (uint64_t)> onTimeout)
    : timerFd(-1),
      timePeriodSeconds(timePeriodSeconds),
      onTimeout(onTimeout)
{
    init(timePeriodSeconds, onTimeout);
}

void
PeriodicEventSource::
init(double timePeriodSeconds,
     std::function<void (uint64_t)> onTimeout)
{
    if (timerFd != -1)
        throw Exception("double initialization of periodic event source");
    if (!(timePeriodSeconds >= 0))
        throw Exception("invalid period for periodic event source: %f",
                        timePeriodSeconds);

    this->timePeriodSeconds = timePeriodSeconds;
    this->onTimeout = onTimeout;

    timerFd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd == -1)
        throw Exception(errno, "timerfd_create");

    itimerspec spec;

    uint64_t seconds, nanoseconds;
    seconds = timePeriodSeconds;
    nanoseconds = (timePeriodSeconds - seconds) * 1000000000;

    // A zero value would disarm the timer
    if (seconds == 0 && nanoseconds == 0)
        nanoseconds = 1;

    spec.it_interval.tv_sec = spec.it_value.tv_sec = seconds;
    spec.it_interval.tv_nsec = spec.it_value.tv_nsec = nanoseconds;

    int res = timerfd_settime(timerFd, 0, &spec, 0);
    if (res == -1)
        throw Exception(errno, "timerfd_settime");
}

PeriodicEventSource::
~PeriodicEventSource()
{
    if (timerFd == -1)
        return;
    int res = close(timerFd);
    if (res == -1)
        cerr << "warning: close on timerfd: " << strerror(errno) << endl;
}

int
PeriodicEventSource::
selectFd() const
{
    return timerFd;
}

bool
PeriodicEventSource::
processOne()
{
    uint64_t numWakeups = 0;
    for (;;) {
        int res = read(timerFd, &numWakeups, 8);
        if (res == -1 && errno == EINTR) continue;
        if (res == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;
        if (res == -1)
            throw Exception(errno, "timerfd read");
        else if (res != 8)
            throw Exception("timerfd read: wrong number of bytes: %d",
                            res);
        onTimeout(numWakeups);
        break;
    }
    return false;
}

} // namespace Coderun
