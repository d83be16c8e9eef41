/* in_process_unit.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <initializer_list>
#include <iostream>

#include "coderun/arch/exception.h"
#include "coderun/service/logs.h"
#include "coderun/service/message_loop.h"
#include "coderun/utils/exc_check.h"
#include "coderun/utils/file_functions.h"
#include "coderun/utils/guard.h"

#include "in_process_unit.h"

#ifndef SYS_pidfd_open
#define SYS_pidfd_open 434
#endif

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("In Process Unit");
Logging::Category warnings("In Process Unit Warning", logs);
Logging::Category errors("In Process Unit Error", logs);

int pidfdOpen(pid_t pid)
{
    return ::syscall(SYS_pidfd_open, pid, 0);
}

} // file scope


namespace Coderun {

/*****************************************************************************/
/* IN PROCESS UNIT                                                           */
/*****************************************************************************/

InProcessUnit::
InProcessUnit(MessageLoop & loop, const Evaluator & evaluator)
    : EpollLoop([this] (const std::exception_ptr & excPtr) {
          handleFault(excPtr);
      }),
      loop_(loop), evaluator_(evaluator),
      started_(false), finished_(false),
      childPid_(-1), processGroup_(-1), status_(0), exited_(false),
      stdOutFd_(-1), stdErrFd_(-1), pidFd_(-1)
{
    ExcCheck(evaluator_, "no evaluator given");
}

InProcessUnit::
~InProcessUnit()
{
    if (started_ && !finished_) {
        terminate(false);
        if (childPid_ > 0) {
            int status;
            while (::waitpid(childPid_, &status, 0) == -1 && errno == EINTR) {
            }
        }
    }

    auto closeIfOpen = [] (int & fd) {
        if (fd > -1) {
            ::close(fd);
            fd = -1;
        }
    };
    closeIfOpen(stdOutFd_);
    closeIfOpen(stdErrFd_);
    closeIfOpen(pidFd_);
}

void
InProcessUnit::
start(const std::string & code,
      const std::shared_ptr<InputSink> & stdOutSink,
      const std::shared_ptr<InputSink> & stdErrSink,
      const OnFinished & onFinished)
{
    ExcCheck(!started_, "unit already started");
    ExcCheck(onFinished, "onFinished is mandatory");

    int outPipe[2] = { -1, -1 };
    int errPipe[2] = { -1, -1 };
    Call_Guard closePipes([&] () {
        for (int fd: { outPipe[0], outPipe[1], errPipe[0], errPipe[1] }) {
            if (fd != -1) {
                ::close(fd);
            }
        }
    });

    if (::pipe2(outPipe, O_CLOEXEC) == -1
        || ::pipe2(errPipe, O_CLOEXEC) == -1) {
        throw Coderun::Exception(errno, "InProcessUnit::start pipe2");
    }

    ::flockfile(stdout);
    ::flockfile(stderr);
    ::fflush_unlocked(NULL);
    cout.flush();
    cerr.flush();
    pid_t pid = ::fork();
    int savedErrno = errno;
    ::funlockfile(stderr);
    ::funlockfile(stdout);

    if (pid == -1) {
        throw Coderun::Exception(savedErrno, "InProcessUnit::start fork");
    }
    else if (pid == 0) {
        runChild(evaluator_, code, outPipe[1], errPipe[1]);
    }

    started_ = true;
    childPid_ = pid;
    processGroup_ = pid;

    /* Also done by the child, so that signals to the group reach it no
       matter which of the two runs first. */
    if (::setpgid(pid, pid) == -1 && errno != EACCES) {
        LOG(warnings) << "setpgid for child " << pid << ": "
                      << strerror(errno) << endl;
    }

    ::close(outPipe[1]);
    outPipe[1] = -1;
    ::close(errPipe[1]);
    errPipe[1] = -1;

    pidFd_ = pidfdOpen(pid);
    if (pidFd_ == -1) {
        int err = errno;
        terminate(false);
        int status;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        childPid_ = -1;
        finished_ = true;
        throw Coderun::Exception(err, "InProcessUnit::start pidfd_open");
    }

    stdOutFd_ = outPipe[0];
    outPipe[0] = -1;
    stdErrFd_ = errPipe[0];
    errPipe[0] = -1;

    stdOutSink_ = stdOutSink ? stdOutSink : make_shared<NullInputSink>();
    stdErrSink_ = stdErrSink ? stdErrSink : make_shared<NullInputSink>();
    onFinished_ = onFinished;

    set_file_flag(stdOutFd_, O_NONBLOCK);
    addFd(stdOutFd_, [this] (const ::epoll_event & event) {
        handleOutput(event, stdOutFd_, stdOutSink_);
    });
    set_file_flag(stdErrFd_, O_NONBLOCK);
    addFd(stdErrFd_, [this] (const ::epoll_event & event) {
        handleOutput(event, stdErrFd_, stdErrSink_);
    });
    addFd(pidFd_, [this] (const ::epoll_event & event) {
        handleExit(event);
    });

    if (!loop_.addSource("in-process unit " + std::to_string(pid),
                         shared_from_this())) {
        throw Coderun::Exception("could not add the unit to the loop");
    }
}

void
InProcessUnit::
runChild(const Evaluator & evaluator, const std::string & code,
         int stdOutFd, int stdErrFd)
{
    if (::dup2(stdOutFd, STDOUT_FILENO) == -1
        || ::dup2(stdErrFd, STDERR_FILENO) == -1) {
        ::_exit(127);
    }
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull == -1 || ::dup2(devNull, STDIN_FILENO) == -1) {
        ::_exit(127);
    }

    struct rlimit limits;
    ::getrlimit(RLIMIT_NOFILE, &limits);
    for (int fd = STDERR_FILENO + 1; fd < (int)limits.rlim_cur; fd++) {
        ::close(fd);
    }

    ::setpgid(0, 0);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGCHLD, SIG_DFL);
    sigset_t noSignals;
    ::sigemptyset(&noSignals);
    ::sigprocmask(SIG_SETMASK, &noSignals, nullptr);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);

    int returnCode = 1;
    try {
        returnCode = evaluator(code);
    }
    catch (const std::exception & exc) {
        cerr << exc.what() << endl;
    }

    cout.flush();
    cerr.flush();
    ::fflush(stdout);
    ::fflush(stderr);
    ::_exit(returnCode & 0xff);
}

void
InProcessUnit::
handleOutput(const ::epoll_event & event, int & fd,
             std::shared_ptr<InputSink> & sink)
{
    char buffer[4096];
    bool closedFd(false);
    string data;
    string error;

    if ((event.events & EPOLLIN) != 0) {
        while (true) {
            ssize_t len = ::read(fd, buffer, sizeof(buffer));
            if (len < 0) {
                if (errno == EWOULDBLOCK) {
                    break;
                }
                else if (errno == EINTR) {
                    continue;
                }
                error = strerror(errno);
                closedFd = true;
                break;
            }
            else if (len == 0) {
                closedFd = true;
                break;
            }
            data.append(buffer, len);
        }

        if (!data.empty()) {
            sink->notifyReceived(move(data));
        }
        if (!error.empty()) {
            LOG(warnings) << "error reading the output of the evaluator: "
                          << error << endl;
            sink->notifyError(error);
        }
    }

    if (closedFd || (event.events & EPOLLHUP) != 0) {
        sink->notifyClosed();
        sink.reset();
        closeFd(fd);
        attemptFinish();
    }
}

void
InProcessUnit::
handleExit(const ::epoll_event & event)
{
    int status;
    int res;
    while ((res = ::waitpid(childPid_, &status, WNOHANG)) == -1
           && errno == EINTR) {
    }
    if (res == -1) {
        throw Coderun::Exception(errno, "InProcessUnit waitpid");
    }
    if (res == 0) {
        return;
    }

    status_ = status;
    exited_ = true;
    childPid_ = -1;
    closeFd(pidFd_);
    attemptFinish();
}

void
InProcessUnit::
closeFd(int & fd)
{
    if (fd > -1) {
        removeFd(fd);
        ::close(fd);
        fd = -1;
    }
}

/* The unit has finished once the child has been reaped and both of its
   output streams have been drained. */
void
InProcessUnit::
attemptFinish()
{
    if (finished_ || !exited_ || stdOutSink_ || stdErrSink_)
        return;

    finished_ = true;
    processGroup_ = -1;
    loop_.removeSource(this);

    UnitOutcome outcome;
    if (WIFEXITED(status_)) {
        outcome = UnitOutcome::returned(WEXITSTATUS(status_));
    }
    else if (WIFSIGNALED(status_)) {
        outcome = UnitOutcome::signaled(WTERMSIG(status_));
    }
    else {
        outcome = UnitOutcome::fault("unexpected child status "
                                     + std::to_string(status_));
    }

    auto onFinished = move(onFinished_);
    onFinished_ = nullptr;
    onFinished(outcome);
}

void
InProcessUnit::
handleFault(const std::exception_ptr & excPtr)
{
    string detail = describeException(excPtr);
    LOG(errors) << "in-process unit failed: " << detail << endl;

    if (finished_)
        return;

    /* Nothing more can be expected from the pipes: kill the child, reap it
       and report the failure. */
    terminate(false);
    if (childPid_ > 0) {
        int status;
        while (::waitpid(childPid_, &status, 0) == -1 && errno == EINTR) {
        }
        childPid_ = -1;
    }

    finished_ = true;
    processGroup_ = -1;
    closeFd(stdOutFd_);
    closeFd(stdErrFd_);
    closeFd(pidFd_);
    for (auto * sink: { &stdOutSink_, &stdErrSink_ }) {
        if (*sink) {
            (*sink)->notifyClosed();
            sink->reset();
        }
    }
    loop_.removeSource(this);

    auto onFinished = move(onFinished_);
    onFinished_ = nullptr;
    if (onFinished) {
        onFinished(UnitOutcome::fault(detail));
    }
}

bool
InProcessUnit::
terminate(bool graceful)
{
    if (!started_ || finished_)
        return false;

    int signum = graceful ? SIGINT : SIGKILL;
    int res = -1;
    if (processGroup_ > 0) {
        res = ::kill(-processGroup_, signum);
    }
    if (res == -1 && childPid_ > 0) {
        res = ::kill(childPid_, signum);
    }

    return res == 0;
}

bool
InProcessUnit::
alive() const
{
    return started_ && !finished_;
}


/*****************************************************************************/
/* IN PROCESS UNIT FACTORY                                                   */
/*****************************************************************************/

InProcessUnitFactory::
InProcessUnitFactory(const InProcessUnit::Evaluator & evaluator)
    : evaluator_(evaluator)
{
}

std::shared_ptr<ExecutionUnit>
InProcessUnitFactory::
create(MessageLoop & loop)
{
    return make_shared<InProcessUnit>(loop, evaluator_);
}

} // namespace Coderun
