/* wakeup_fd.h                                                     -*- C++ -*-
   Jeremy Barnes, 23 January 2012
   Copyright (c) 2012 Datacratic.  All rights reserved.

   An eventfd used to wake up a thread blocked in epoll.
*/

#pragma once

#include <errno.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "exception.h"


namespace Coderun {

struct Wakeup_Fd {
    /* Construct with EFD_NONBLOCK for tryRead to be usable. */
    Wakeup_Fd(int flags = 0)
        : fd_(::eventfd(0, flags))
    {
        if (fd_ == -1)
            throw Coderun::Exception(errno, "eventfd");
    }

    Wakeup_Fd(const Wakeup_Fd & other) = delete;
    Wakeup_Fd & operator = (const Wakeup_Fd & other) = delete;

    ~Wakeup_Fd()
    {
        ::close(fd_);
    }

    int fd() const { return fd_; }

    void signal()
    {
        if (eventfd_write(fd_, 1) == -1)
            throw Coderun::Exception(errno, "eventfd_write");
    }

    /* Consumes the pending wakeups, returning false if there were none. */
    bool tryRead()
    {
        eventfd_t value;
        if (eventfd_read(fd_, &value) == 0)
            return true;
        if (errno == EAGAIN)
            return false;
        throw Coderun::Exception(errno, "eventfd_read");
    }

private:
    int fd_;
};

} // namespace Coderun
