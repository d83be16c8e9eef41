/* in_process_unit.h                                               -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Execution unit evaluating the code in a forked image of the current
   process.
*/

#pragma once

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>

#include "coderun/service/epoll_loop.h"

#include "execution_unit.h"


namespace Coderun {

/*****************************************************************************/
/* IN PROCESS UNIT                                                           */
/*****************************************************************************/

/** Runs an Evaluator on the code in a child obtained by fork() without
    exec(), with its standard output and error redirected to pipes.  The
    value returned by the evaluator is the exit code of the child; an
    exception escaping it is written to standard error and gives exit code
    1.

    This is the cheapest unit, but the evaluator runs in a copy of a
    multithreaded process: it must not rely on locks held by other threads
    at the time of the fork.

    The unit is its own event source: the output pipes and a pidfd
    reporting the exit of the child are watched from the MessageLoop.
*/

struct InProcessUnit
    : public ExecutionUnit,
      public EpollLoop,
      public std::enable_shared_from_this<InProcessUnit> {

    typedef std::function<int (const std::string & code)> Evaluator;

    InProcessUnit(MessageLoop & loop, const Evaluator & evaluator);
    ~InProcessUnit();

    virtual void start(const std::string & code,
                       const std::shared_ptr<InputSink> & stdOutSink,
                       const std::shared_ptr<InputSink> & stdErrSink,
                       const OnFinished & onFinished);

    virtual bool terminate(bool graceful);

    virtual bool alive() const;

    /** Process ID of the child, -1 before "start" and after it has been
        reaped. */
    pid_t childPid() const { return childPid_; }

private:
    void handleOutput(const ::epoll_event & event, int & fd,
                      std::shared_ptr<InputSink> & sink);
    void handleExit(const ::epoll_event & event);
    void handleFault(const std::exception_ptr & excPtr);
    void attemptFinish();
    void closeFd(int & fd);

    static void runChild(const Evaluator & evaluator, const std::string & code,
                         int stdOutFd, int stdErrFd);

    MessageLoop & loop_;
    Evaluator evaluator_;

    bool started_;
    bool finished_;

    pid_t childPid_;
    pid_t processGroup_;
    int status_;
    bool exited_;

    int stdOutFd_;
    int stdErrFd_;
    int pidFd_;

    std::shared_ptr<InputSink> stdOutSink_;
    std::shared_ptr<InputSink> stdErrSink_;
    OnFinished onFinished_;
};


/*****************************************************************************/
/* IN PROCESS UNIT FACTORY                                                   */
/*****************************************************************************/

struct InProcessUnitFactory : public ExecutionUnitFactory {
    InProcessUnitFactory(const InProcessUnit::Evaluator & evaluator);

    virtual std::shared_ptr<ExecutionUnit> create(MessageLoop & loop);

private:
    InProcessUnit::Evaluator evaluator_;
};

} // namespace Coderun
