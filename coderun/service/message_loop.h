/* message_loop.h                                                  -*- C++ -*-
   Jeremy Barnes, 31 May 2012
   Copyright (c) 2012 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Loop that listens for various types of messages on a single thread.
*/

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <functional>
#include <vector>

#include "epoll_loop.h"
#include "async_event_source.h"
#include "typed_message_channel.h"
#include "logs.h"

namespace Coderun {

/******************************************************************************/
/* LOGS                                                                       */
/******************************************************************************/

struct MessageLoopLogs
{
    static Logging::Category print;
    static Logging::Category warning;
    static Logging::Category error;
    static Logging::Category trace;
};

/*****************************************************************************/
/* MESSAGE LOOP                                                              */
/*****************************************************************************/

/** Runs a set of AsyncEventSources from a single thread.  Every source
    callback, and every function passed to runInMessageLoopThread, runs on
    that thread, so they never need to synchronize with each other.

    Additions and removals are queued and carried out by the loop thread in
    the order they were requested.
*/

struct MessageLoop : public EpollLoop {
    typedef std::function<void ()> OnStop;

    /** "epollTimeout" is the maximum time in milliseconds that the loop
        sleeps before rechecking its shutdown flag. */
    MessageLoop(int epollTimeout = 1000);
    ~MessageLoop();

    void start(const OnStop & onStop = OnStop());

    void shutdown();

    /** Add the given source of asynchronous wakeups with the given
        callback to be run when they trigger.  The caller keeps ownership
        and must keep the source alive until it has been removed.

        Note that this function call will not take effect immediately. All work
        is deferred to the main message loop thread.

        Returns true if the request was successfully enqueued, false otherwise.
    */
    bool addSource(const std::string & name,
                   AsyncEventSource & source);

    /** Same as above, but the loop shares ownership of the source until it is
        removed.
    */
    bool addSource(const std::string & name,
                   const std::shared_ptr<AsyncEventSource> & source);

    /** Add a periodic job to be performed by the loop.  The number passed
        to the toRun function is the number of timeouts that have elapsed
        since the last call; this is useful to know if something has
        got behind.  It will normally be 1.

        Returns the source, which can be passed to removeSource to cancel
        the job.
    */
    std::shared_ptr<PeriodicEventSource>
    addPeriodic(const std::string & name,
                double timePeriodSeconds,
                std::function<void (uint64_t)> toRun);

    /** Remove the given source from the list of active sources.  Once the
        removal has been processed the source will not be called again,
        even for events that were already pending.

        Note that this function call will not take effect immediately. All work
        is deferred to the main message loop thread.
     */
    bool removeSource(AsyncEventSource * source);

    /** Remove the given source from the list of active sources and waits for
        the operation to complete. Useful in the cases where you need to destroy
        the resources associated with the source.

        Calling this function from the message loop thread throws, as it
        would never return.
    */
    bool removeSourceSync(AsyncEventSource * source);

    /** Run the given function in the message loop thread, after every
        action already queued.
    */
    bool runInMessageLoopThread(std::function<void ()> toRun);

    /** Is the calling thread the thread running this loop? */
    bool inMessageLoopThread() const;

    /** Number of sources currently attached. */
    size_t numSources() const { return numSources_; }

private:
    void runWorkerThread();

    struct SourceEntry
    {
        SourceEntry() = default;
        SourceEntry(const std::string& name,
                    std::shared_ptr<AsyncEventSource> source)
            : name(name), source(source)
        {}

        std::string name;
        std::shared_ptr<AsyncEventSource> source;

        /* Cleared on removal; callbacks for events that were already pending
           check it before touching the source. */
        std::shared_ptr<bool> attached;
    };

    std::vector<SourceEntry> sources;

    /* Addition/removal action to perform on an event source */
    struct SourceAction {
        static constexpr int ADD = 0;
        static constexpr int REMOVE = 1;
        static constexpr int RUN = 2;

        SourceAction() = default;

        SourceAction(int action, SourceEntry && entry)
            : action_(action), entry_(std::move(entry))
        {
        }

        SourceAction(std::function<void ()> && toRun)
            : action_(RUN), run_(std::move(toRun))
        {
        }

        int action_;
        SourceEntry entry_;
        std::function<void ()> run_;
    };

    /* Queue of source actions to perform */
    TypedMessageQueue<SourceAction> sourceActions_;

    std::vector<std::thread> threads;

    /** Global flag to shutdown. */
    std::atomic<int> shutdown_;

    /** Id of the thread running the loop. */
    std::atomic<std::thread::id> loopThread_;

    std::atomic<size_t> numSources_;

    int epollTimeout_;

    void handleSourceActions();
    void processAddSource(const SourceEntry & entry);
    void processRemoveSource(const SourceEntry & entry);
    void processRunAction(const SourceAction & action);
};

} // namespace Coderun
