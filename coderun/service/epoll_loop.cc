/* epoll_loop.cc
   Wolfgang Sourdeau, 25 February 2015
   Copyright (c) 2015 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   An event loop built on epoll.
*/

#include <errno.h>
#include <unistd.h>

#include <string>

#include "coderun/arch/exception.h"
#include "epoll_loop.h"

using namespace std;
using namespace Coderun;


namespace {

/* Events dispatched per epoll_wait call. */
const int eventBatch = 64;

/* The epoll data of a watch: its generation in the high half, the fd in the
   low one. */
uint64_t watchKey(int fd, uint32_t generation)
{
    return (uint64_t(generation) << 32) | uint32_t(fd);
}

} // file scope


EpollLoop::
EpollLoop(const OnException & onException)
    : AsyncEventSource(),
      epollFd_(-1),
      lastGeneration_(0),
      onException_(onException)
{
    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ == -1)
        throw Coderun::Exception(errno, "epoll_create");
}

EpollLoop::
~EpollLoop()
{
    ::close(epollFd_);
}

bool
EpollLoop::
processOne()
{
    loop(-1, 0);

    return false;
}

void
EpollLoop::
loop(int maxEvents, int timeout)
{
    {
        std::lock_guard<mutex> guard(watchesLock_);
        if (watches_.empty())
            return;
    }

    if (maxEvents < 0 || maxEvents > eventBatch) {
        maxEvents = eventBatch;
    }
    struct epoll_event events[eventBatch];

    int res;
    while ((res = ::epoll_wait(epollFd_, events, maxEvents, timeout)) == -1
           && errno == EINTR) {
    }
    if (res == -1) {
        throw Coderun::Exception(errno, "epoll_wait");
    }

    for (int i = 0; i < res; i++) {
        /* null when the fd was removed since the events were collected */
        auto callback = findCallback(events[i].data.u64);
        if (!callback)
            continue;
        try {
            (*callback)(events[i]);
        }
        catch (const std::exception & exc) {
            onException(current_exception());
        }
    }
}

std::shared_ptr<EpollLoop::EpollCallback>
EpollLoop::
findCallback(uint64_t key)
{
    int fd = int(uint32_t(key));
    uint32_t generation = key >> 32;

    std::lock_guard<mutex> guard(watchesLock_);
    auto it = watches_.find(fd);
    if (it == watches_.end() || it->second.generation != generation)
        return nullptr;
    return it->second.callback;
}

void
EpollLoop::
addFd(int fd, const EpollCallback & callback)
{
    if (fd < 0 || !callback) {
        throw Coderun::Exception("EpollLoop::addFd: invalid watch for fd "
                                 + to_string(fd));
    }

    std::lock_guard<mutex> guard(watchesLock_);
    if (watches_.count(fd)) {
        throw Coderun::Exception("fd " + to_string(fd) + " is already watched");
    }

    Watch watch;
    watch.generation = ++lastGeneration_;
    watch.callback = std::make_shared<EpollCallback>(callback);

    struct epoll_event event;
    event.events = EPOLLIN;
    event.data.u64 = watchKey(fd, watch.generation);
    if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &event) == -1) {
        throw Coderun::Exception(errno, "epoll_ctl ADD " + to_string(fd));
    }

    watches_[fd] = watch;
}

void
EpollLoop::
removeFd(int fd)
{
    std::lock_guard<mutex> guard(watchesLock_);
    auto it = watches_.find(fd);
    if (it == watches_.end()) {
        throw Coderun::Exception("fd " + to_string(fd) + " is not watched");
    }
    watches_.erase(it);

    if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        throw Coderun::Exception(errno, "epoll_ctl DEL " + to_string(fd));
    }
}

void
EpollLoop::
onException(const exception_ptr & excPtr)
{
    if (onException_) {
        onException_(excPtr);
    }
    else {
        rethrow_exception(excPtr);
    }
}
