/** watchdog.h                                                     -*- C++ -*-
    Jeremy Barnes, 16 May 2011
    Copyright (c) 2011 Datacratic.  All rights reserved.

    Watchdog timer that kills a test which hangs.
*/

#ifndef __coderun__utils__testing__watchdog_h__
#define __coderun__utils__testing__watchdog_h__

#include <signal.h>
#include <stdlib.h>
#include <time.h>

#include <atomic>
#include <iostream>

#include <boost/bind.hpp>
#include <boost/function.hpp>
#include <boost/thread/thread.hpp>

namespace Coderun {

struct Watchdog {
    std::atomic<bool> finished;
    double seconds;
    boost::thread_group tg;
    boost::function<void ()> timeoutFunction;

    static void abortProcess()
    {
        using namespace std;

        cerr << "**** WATCHDOG TIMEOUT; KILLING HUNG TEST ****"
             << endl;
        kill(0, SIGKILL);
        abort();
    }

    void runThread()
    {
        struct timespec ts = { 0, 10000000 };
        struct timespec rem;
        for (unsigned i = 0;  i != unsigned(seconds * 100) && !finished;
             ++i) {
            nanosleep(&ts, &rem);
        }

        if (!finished)
            timeoutFunction();
    }

    /** Create a watchdog timer that will time out after the given number
        of seconds.
    */
    Watchdog(double seconds = 2.0,
             boost::function<void ()> timeoutFunction = abortProcess)
        : finished(false), seconds(seconds), timeoutFunction(timeoutFunction)
    {
        tg.create_thread(boost::bind(&Watchdog::runThread, this));
    }

    ~Watchdog()
    {
        finished = true;
        tg.join_all();
    }
};

} // namespace Coderun

#endif /* __coderun__utils__testing__watchdog_h__ */
