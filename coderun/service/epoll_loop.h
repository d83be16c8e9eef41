/* epoll_loop.h                                                    -*- C++ -*-
   Wolfgang Sourdeau, 25 February 2015
   Copyright (c) 2015 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   An event loop built on epoll, with callbacks associated to file
   descriptors.
*/

#pragma once

#include <stdint.h>
#include <sys/epoll.h>

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "coderun/service/async_event_source.h"


namespace Coderun {

/****************************************************************************/
/* EPOLL LOOP                                                               */
/****************************************************************************/

/* Watches file descriptors for reading, each with its own callback.  The
 * loop is itself an AsyncEventSource, so that classes owning several file
 * descriptors (a Runner, a MessageLoop) can be nested in a MessageLoop.
 */

struct EpollLoop : public AsyncEventSource
{
    /* Invoked with any exception escaping a callback.  Without one, the
       exception propagates out of "loop". */
    typedef std::function<void(const std::exception_ptr &)> OnException;

    typedef std::function<void (const ::epoll_event &)> EpollCallback;

    EpollLoop(const OnException & onException);
    ~EpollLoop();

    /* AsyncEventSource interface */
    virtual int selectFd() const
    { return epollFd_; }

    virtual bool processOne();

    /* Wait for events for at most "timeout" milliseconds (-1 waits forever,
     * 0 polls) and dispatch up to "maxEvents" of them, -1 meaning every
     * event that is ready.  Returns at once when nothing is watched. */
    void loop(int maxEvents, int timeout);

    /* Watch "fd" for reading.  Throws if it is already watched. */
    void addFd(int fd, const EpollCallback & callback);

    /* Stop watching "fd", which must still be open.  Events already
     * collected for it are dropped; a callback may remove its own fd. */
    void removeFd(int fd);

    virtual void onException(const std::exception_ptr & excPtr);

private:
    struct Watch {
        uint32_t generation;
        std::shared_ptr<EpollCallback> callback;
    };

    std::shared_ptr<EpollCallback> findCallback(uint64_t key);

    int epollFd_;
    uint32_t lastGeneration_;

    std::mutex watchesLock_;
    std::map<int, Watch> watches_;

    OnException onException_;
};

} // namespace Coderun
