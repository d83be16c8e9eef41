/* async_event_source.h                                            -*- C++ -*-
   Jeremy Barnes, 9 November 2012
   Copyright (c) 2012 Datacratic Inc.  All rights reserved.

   Source of asynchronous events; a bit like a reactor.
*/

#pragma once

#include <stdint.h>
#include <functional>
#include "coderun/arch/exception.h"

namespace Coderun {

struct MessageLoop;

/*****************************************************************************/
/* ASYNC EVENT SOURCE                                                        */
/*****************************************************************************/

struct AsyncEventSource {
    constexpr static int DISCONNECTED = 0;
    constexpr static int CONNECTED = 1;

    AsyncEventSource()
        : parent_(0), connectionState_(DISCONNECTED)
    {
    }

    AsyncEventSource(const AsyncEventSource & other) = delete;
    AsyncEventSource & operator = (const AsyncEventSource & other) = delete;

    virtual ~AsyncEventSource()
    {
    }

    /** Return the file descriptor on which one should select() for messages
        from this source.  The source should organize itself such that if
        the fd indicates ready for a read, there is something to do.

        Should never block.
    */
    virtual int selectFd() const = 0;

    /** Process pending events and return true if there are more to be
        processed.  Should never block.
    */
    virtual bool processOne() = 0;

    /** Notify that the given message loop is responsible. */
    virtual void connected(MessageLoop * parent)
    {
        if (parent_)
            throw Coderun::Exception("attempt to connect AsyncEventSource "
                                     "to two parents");
        parent_ = parent;
    }

    /** Disconnect from the parent message loop. */
    void disconnect();

    /** Blocks until the connection state changes to the specified value. */
    void waitConnectionState(int state) const;

    /** The parent message loop. */
    MessageLoop * parent_;

    /** The connection state to the message loop. */
    int connectionState_;
};


/*****************************************************************************/
/* PERIODIC EVENT SOURCE                                                     */
/*****************************************************************************/

/** Calls the given function every timePeriodSeconds, from a timerfd.  The
    argument passed is the number of periods that elapsed since the last
    call; it is normally 1.
*/

struct PeriodicEventSource : public AsyncEventSource {
    PeriodicEventSource();

    PeriodicEventSource(double timePeriodSeconds,
                        std::function<void (uint64_t)> onTimeout);

    ~PeriodicEventSource();

    void init(double timePeriodSeconds,
              std::function<void (uint64_t)> onTimeout);

    virtual int selectFd() const;

    virtual bool processOne();

    double timePeriod() const { return timePeriodSeconds; }

private:
    int timerFd;
    double timePeriodSeconds;
    std::function<void (uint64_t)> onTimeout;
};

} // namespace Coderun
