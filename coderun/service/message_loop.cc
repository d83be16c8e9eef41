/** message_loop.cc
    Jeremy Barnes, 1 June 2012
    Copyright (c) 2012 Datacratic.  All rights reserved.
    Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <thread>
#include <time.h>
#include <limits.h>
#include <sys/epoll.h>

#include "coderun/arch/exception.h"
#include "coderun/arch/futex.h"
#include "coderun/utils/smart_ptr_utils.h"
#include "coderun/utils/exc_assert.h"
#include "coderun/service/logs.h"

#include "message_loop.h"

using namespace std;


namespace Coderun {

Logging::Category MessageLoopLogs::print("Message Loop");
Logging::Category MessageLoopLogs::warning("Message Loop Warning", print);
Logging::Category MessageLoopLogs::error("Message Loop Error", print);
Logging::Category MessageLoopLogs::trace("Message Loop Trace", print, false);

typedef MessageLoopLogs Logs;

/*****************************************************************************/
/* MESSAGE LOOP                                                              */
/*****************************************************************************/

MessageLoop::
MessageLoop(int epollTimeout)
    : EpollLoop([&] (const std::exception_ptr & excPtr) {
          LOG(Logs::error)
              << "exception in message loop source: "
              << describeException(excPtr) << endl;
      }),
      sourceActions_([&] () { handleSourceActions(); }),
      shutdown_(true),
      loopThread_(std::thread::id()),
      numSources_(0),
      epollTimeout_(epollTimeout)
{
    /* Our source action queue is a source in itself, which enables us to
       handle source operations from the same epoll mechanism as the rest.

       Adding a special source named "_shutdown" wakes up the loop so that
       it notices the shutdown flag. */
    auto onAction = [&] (const epoll_event & event) {
        sourceActions_.processOne();
    };
    addFd(sourceActions_.selectFd(), onAction);
}

MessageLoop::
~MessageLoop()
{
    shutdown();
    sourceActions_.close();

    for (auto & entry: sources) {
        *entry.attached = false;
        entry.source->parent_ = nullptr;
    }
    sources.clear();
}

void
MessageLoop::
start(const OnStop & onStop)
{
    if (!threads.empty())
        throw Coderun::Exception("already have started message loop");

    shutdown_ = false;

    auto runfn = [&, onStop] () {
        this->runWorkerThread();
        if (onStop) onStop();
    };

    threads.emplace_back(runfn);
}

void
MessageLoop::
shutdown()
{
    if (shutdown_)
        return;

    shutdown_ = true;

    // We are either blocked in epoll (in which case the queued action wakes
    // us up) or handling events and will see the flag afterwards.
    addSource("_shutdown", nullptr);

    for (auto & t: threads)
        t.join();
    threads.clear();
}

bool
MessageLoop::
addSource(const std::string & name,
          AsyncEventSource & source)
{
    return addSource(name, make_unowned_std_sp(source));
}

bool
MessageLoop::
addSource(const std::string & name,
          const std::shared_ptr<AsyncEventSource> & source)
{
    if (name != "_shutdown") {
        ExcCheck(source, "null source: " + name);
        ExcCheck(!source->parent_, "source already has a parent: " + name);
        source->connected(this);
    }

    SourceEntry entry(name, source);
    SourceAction newAction(SourceAction::ADD, move(entry));

    return sourceActions_.push_back(move(newAction));
}

std::shared_ptr<PeriodicEventSource>
MessageLoop::
addPeriodic(const std::string & name,
            double timePeriodSeconds,
            std::function<void (uint64_t)> toRun)
{
    auto newPeriodic
        = make_shared<PeriodicEventSource>(timePeriodSeconds, toRun);
    if (!addSource(name, newPeriodic))
        throw Coderun::Exception("couldn't add periodic source " + name);
    return newPeriodic;
}

bool
MessageLoop::
removeSource(AsyncEventSource * source)
{
    SourceEntry entry("", make_unowned_std_sp(*source));
    SourceAction newAction(SourceAction::REMOVE, move(entry));
    return sourceActions_.push_back(move(newAction));
}

bool
MessageLoop::
removeSourceSync(AsyncEventSource * source)
{
    ExcCheck(!inMessageLoopThread(),
             "removeSourceSync called from the message loop thread");

    bool r = removeSource(source);
    if (!r) return false;

    source->waitConnectionState(AsyncEventSource::DISCONNECTED);

    return true;
}

bool
MessageLoop::
runInMessageLoopThread(std::function<void ()> toRun)
{
    SourceAction newAction(move(toRun));
    return sourceActions_.push_back(move(newAction));
}

bool
MessageLoop::
inMessageLoopThread() const
{
    return loopThread_.load() == std::this_thread::get_id();
}

void
MessageLoop::
runWorkerThread()
{
    loopThread_ = std::this_thread::get_id();

    while (!shutdown_) {
        LOG(Logs::trace)
            << "handling events from " << numSources_.load() << " sources"
            << endl;

        loop(-1, epollTimeout_);
    }

    loopThread_ = std::thread::id();
}

void
MessageLoop::
handleSourceActions()
{
    vector<SourceAction> actions = sourceActions_.drain();
    for (auto & action: actions) {
        try {
            if (action.action_ == SourceAction::ADD) {
                processAddSource(action.entry_);
            }
            else if (action.action_ == SourceAction::REMOVE) {
                processRemoveSource(action.entry_);
            }
            else if (action.action_ == SourceAction::RUN) {
                processRunAction(action);
            }
        }
        catch (const std::exception & exc) {
            LOG(Logs::error)
                << "exception processing message loop action "
                << action.action_ << ": " << exc.what() << endl;
        }
    }
}

void
MessageLoop::
processAddSource(const SourceEntry & newEntry)
{
    if (newEntry.name == "_shutdown")
        return;

    SourceEntry entry = newEntry;
    entry.attached = make_shared<bool>(true);

    int fd = entry.source->selectFd();
    ExcCheck(fd != -1, "source has no fd to select on: " + entry.name);

    auto source = entry.source;
    auto attached = entry.attached;
    auto onEvent = [source, attached] (const epoll_event & event) {
        if (*attached) {
            source->processOne();
        }
    };
    addFd(fd, onEvent);

    sources.push_back(entry);
    numSources_ = sources.size();

    LOG(Logs::trace) << "added source " << entry.name << endl;

    entry.source->connectionState_ = AsyncEventSource::CONNECTED;
    futex_wake(entry.source->connectionState_);
}

void
MessageLoop::
processRemoveSource(const SourceEntry & rmEntry)
{
    auto pred = [&] (const SourceEntry & entry) {
        return entry.source.get() == rmEntry.source.get();
    };
    auto it = find_if(sources.begin(), sources.end(), pred);

    if (it == sources.end()) {
        /* Removed twice, or removed before it was ever added */
        LOG(Logs::warning) << "couldn't remove unknown source" << endl;
        return;
    }

    SourceEntry entry = *it;
    sources.erase(it);
    numSources_ = sources.size();

    *entry.attached = false;
    entry.source->parent_ = nullptr;
    removeFd(entry.source->selectFd());

    LOG(Logs::trace) << "removed source " << entry.name << endl;

    entry.source->connectionState_ = AsyncEventSource::DISCONNECTED;
    futex_wake(entry.source->connectionState_);
}

void
MessageLoop::
processRunAction(const SourceAction & action)
{
    action.run_();
}

} // namespace Coderun
