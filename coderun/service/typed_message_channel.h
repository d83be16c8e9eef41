/* typed_message_channel.h                                         -*- C++ -*-
   Jeremy Barnes, 31 May 2012
   Copyright (c) 2012 Datacratic.  All rights reserved.

   Queue feeding typed objects from any thread to a message loop.
*/

#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "coderun/arch/wakeup_fd.h"
#include "coderun/service/async_event_source.h"


namespace Coderun {

/*****************************************************************************/
/* TYPED MESSAGE QUEUE                                                       */
/*****************************************************************************/

/** Messages pushed from any thread are handed to "onNotify", on the thread
    of the loop the queue belongs to, which consumes them with "drain".
    Several pushes may result in a single notification.
*/

template<typename Message>
struct TypedMessageQueue: public AsyncEventSource
{
    typedef std::function<void ()> OnNotify;

    TypedMessageQueue(const OnNotify & onNotify = nullptr)
        : closed_(false), wakeup_(EFD_NONBLOCK | EFD_CLOEXEC),
          pending_(false), onNotify_(onNotify)
    {
    }

    virtual int selectFd() const
    {
        return wakeup_.fd();
    }

    virtual bool processOne()
    {
        while (wakeup_.tryRead());
        onNotify();

        return false;
    }

    virtual void onNotify()
    {
        if (onNotify_) {
            onNotify_();
        }
    }

    /** Returns false if the queue does not accept messages anymore. */
    bool push_back(Message message)
    {
        Guard guard(queueLock_);
        if (closed_) {
            return false;
        }

        queue_.emplace_back(std::move(message));
        if (!pending_) {
            pending_ = true;
            wakeup_.signal();
        }

        return true;
    }

    /** Remove every message from the queue, in the order they were
        pushed. */
    std::vector<Message> drain()
    {
        std::vector<Message> messages;

        Guard guard(queueLock_);
        messages.swap(queue_);
        pending_ = false;

        return messages;
    }

    /** Refuse any further message. */
    void close()
    {
        Guard guard(queueLock_);
        closed_ = true;
    }

private:
    typedef std::mutex Mutex;
    typedef std::unique_lock<Mutex> Guard;

    Mutex queueLock_;
    std::vector<Message> queue_;
    bool closed_;

    Wakeup_Fd wakeup_;
    bool pending_;

    OnNotify onNotify_;
};

} // namespace Coderun
