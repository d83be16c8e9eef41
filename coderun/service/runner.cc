/* runner.cc                                                       -*- C++ -*-
   Wolfgang Sourdeau, September 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   A command runner class that hides the specifics of the underlying unix
   system calls and can intercept output.
*/

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include <iostream>
#include <limits>
#include <tuple>
#include <utility>

#include "coderun/arch/futex.h"
#include "coderun/arch/format.h"
#include "coderun/utils/exc_assert.h"
#include "coderun/utils/exc_check.h"
#include "coderun/utils/file_functions.h"
#include "coderun/utils/guard.h"

#include "logs.h"
#include "message_loop.h"
#include "sink.h"

#include "runner.h"

using namespace std;
using namespace Coderun;


namespace {

Logging::Category warnings("Runner::warning");

tuple<int, int>
CreateStdPipe()
{
    int fds[2];
    int rc = pipe(fds);
    if (rc == -1) {
        throw Coderun::Exception(errno, "CreateStdPipe pipe");
    }

    return tuple<int, int>(fds[0], fds[1]);
}

} // namespace


namespace Coderun {

/****************************************************************************/
/* RUNNER                                                                   */
/****************************************************************************/

std::string Runner::runnerHelper;

Runner::
Runner()
    : EpollLoop(nullptr),
      runRequests_(0), activeRequest_(0), running_(false),
      startDate_(Date::negativeInfinity()), endDate_(startDate_),
      childPid_(-1), processGroup_(-1),
      statusRemaining_(sizeof(ProcessStatus))
{
}

Runner::
~Runner()
{
    /* The runner is going away with its subprocess still alive.  Its
       process group is killed and the helper is reaped here, as the events
       that would normally do so will never be processed. */
    if (task_.wrapperPid > 0) {
        if (childPid_ > 0 || processGroup_ > 0) {
            signal(SIGKILL, false);
        }
        ::kill(task_.wrapperPid, SIGKILL);

        int status;
        while (::waitpid(task_.wrapperPid, &status, 0) == -1
               && errno == EINTR) {
        }
        task_.wrapperPid = -1;
    }

    auto closeFd = [] (int & fd) {
        if (fd > -1) {
            ::close(fd);
            fd = -1;
        }
    };
    closeFd(task_.statusFd);
    closeFd(task_.stdOutFd);
    closeFd(task_.stdErrFd);
}

void
Runner::
handleChildStatus(const struct epoll_event & event)
{
    ProcessStatus status;

    if ((event.events & EPOLLIN) != 0) {
        while (1) {
            char * current = (statusBuffer_ + sizeof(ProcessStatus)
                              - statusRemaining_);
            ssize_t s = ::read(task_.statusFd, current, statusRemaining_);
            if (s == -1) {
                if (errno == EWOULDBLOCK) {
                    break;
                }
                else if (errno == EBADF || errno == EINVAL) {
                    /* This happens when the pipe or socket was closed by the
                       remote process before "read" was called (race
                       condition). */
                    break;
                }
                else if (errno == EINTR) {
                    continue;
                }
                throw Coderun::Exception(errno,
                                         "Runner::handleChildStatus read");
            }
            else if (s == 0) {
                break;
            }

            statusRemaining_ -= s;

            if (statusRemaining_ > 0) {
                continue;
            }

            memcpy(&status, statusBuffer_, sizeof(status));

            // Set up for next message
            statusRemaining_ = sizeof(statusBuffer_);

            task_.statusState = status.state;
            task_.runResult.usage = status.usage;

            if (status.failed()) {
                task_.runResult.updateFromLaunchError
                    (status.launchErrno,
                     strLaunchError(status.launchErrorCode));
                task_.statusState = ProcessState::STOPPED;
            }

            switch (status.state) {
            case ProcessState::LAUNCHING:
                /* The pid is only published once the command has been
                   exec'ed, so that waitStart and signal never act on the
                   forked helper image. */
                break;
            case ProcessState::RUNNING:
                processGroup_ = status.pid;
                childPid_ = status.pid;
                futex_wake(childPid_);
                break;
            case ProcessState::STOPPED:
                if (task_.runResult.state == RunResult::LAUNCH_ERROR) {
                    childPid_ = -2;
                }
                else {
                    task_.runResult.updateFromStatus(status.childStatus);
                    childPid_ = -3;
                }
                futex_wake(childPid_);
                task_.statusState = ProcessState::DONE;
                attemptTaskTermination();
                break;
            case ProcessState::DONE:
                throw Coderun::Exception("unexpected status DONE");
            case ProcessState::UNKNOWN:
                throw Coderun::Exception("unexpected status UNKNOWN");
            }

            if (status.failed())
                break;
        }
    }

    if ((event.events & EPOLLHUP) != 0 && task_.statusFd > -1) {
        removeFd(task_.statusFd);
        ::close(task_.statusFd);
        task_.statusFd = -1;

        if (task_.statusState == ProcessState::RUNNING
            || task_.statusState == ProcessState::LAUNCHING) {
            // The helper went away without reporting the end of the child.
            LOG(warnings)
                << "hangup on status fd before the child was reported as"
                << " stopped: state = " << task_.runResult.state
                << ", statusState = "
                << statusStateAsString(task_.statusState)
                << ", childPid_ = " << childPid_ << endl;

            // We will never get another event, so we need to clean up
            // everything here.
            childPid_ = -3;
            futex_wake(childPid_);

            task_.runResult.state = RunResult::PARENT_EXITED;
            task_.runResult.signum = SIGHUP;
            task_.statusState = ProcessState::DONE;
            attemptTaskTermination();
        }
    }
}

void
Runner::
handleOutputStatus(const struct epoll_event & event,
                   int & outputFd, shared_ptr<InputSink> & sink)
{
    char buffer[4096];
    bool closedFd(false);
    string data;
    string error;

    if ((event.events & EPOLLIN) != 0) {
        while (1) {
            ssize_t len = ::read(outputFd, buffer, sizeof(buffer));
            if (len < 0) {
                if (errno == EWOULDBLOCK) {
                    break;
                }
                else if (errno == EBADF || errno == EINVAL) {
                    /* This happens when the pipe or socket was closed by the
                       remote process before "read" was called (race
                       condition). */
                    closedFd = true;
                    break;
                }
                else if (errno == EINTR) {
                    continue;
                }
                else {
                    /* The stream is given up on: the sink is told why,
                       then closed like on a hangup. */
                    error = strerror(errno);
                    closedFd = true;
                    break;
                }
            }
            else if (len == 0) {
                closedFd = true;
                break;
            }
            else if (len > 0) {
                data.append(buffer, len);
            }
        }

        if (data.size() > 0) {
            sink->notifyReceived(move(data));
        }
        if (!error.empty()) {
            LOG(warnings) << "error reading the output of "
                          << childPid_ << ": " << error << endl;
            sink->notifyError(error);
        }
    }

    if (closedFd || (event.events & EPOLLHUP) != 0) {
        ExcAssert(sink != nullptr);
        sink->notifyClosed();
        sink.reset();
        if (outputFd > -1) {
            removeFd(outputFd);
            ::close(outputFd);
            outputFd = -1;
        }
        attemptTaskTermination();
    }
}

void
Runner::
attemptTaskTermination()
{
    /* The output channels of a subprocess are always closed when the
       process exits, and the helper always reports the final status, but
       those events are caught by the epoll queue in no particular order.

       For a task to be considered done:
       - stdout and stderr must have been closed, provided we redirected them
       - the closing child status must have been returned
       This holds whether the launch succeeded or not, so the same check is
       performed after each of those events.
    */
    if (!stdOutSink_ && !stdErrSink_ && childPid_ < 0
        && (task_.statusState == ProcessState::STOPPED
            || task_.statusState == ProcessState::DONE)) {
        auto runResult = move(task_.runResult);
        auto onTerminate = move(task_.onTerminate);
        task_.postTerminate(*this);

        processGroup_ = -1;
        endDate_ = Date::now();

        ExcAssert(onTerminate);
        onTerminate(runResult);

        /* Setting running_ to false must be done after "onTerminate" is
           invoked, since "waitTermination" guarantees that "onTerminate" has
           been called. */
        running_ = false;
        futex_wake(running_);
    }
}

void
Runner::
run(const vector<string> & command,
    const OnTerminate & onTerminate,
    const shared_ptr<InputSink> & stdOutSink,
    const shared_ptr<InputSink> & stdErrSink)
{
    if (parent_ == nullptr) {
        throw Coderun::Exception("Runner %p is not connected to any"
                                 " MessageLoop", this);
    }
    if (!onTerminate) {
        throw Coderun::Exception("'onTerminate' parameter is mandatory");
    }
    ExcAssert(runRequests_ < std::numeric_limits<int>::max());
    runRequests_++;

    /* We run this in the message loop thread, which becomes the parent of the
       helper process.  The helper has PR_SET_PDEATHSIG set, so it must not
       be the child of a thread that may exit before it does. */
    auto toRun = [=] () {
        try {
            this->doRunImpl(command, onTerminate, stdOutSink, stdErrSink);
        }
        catch (const std::exception & exc) {
            /* Only reached when a run is already in progress.  Launch
               failures are reported by doRunImpl itself. */
            RunResult result;
            result.updateFromLaunchException(std::current_exception());
            onTerminate(result);
        }
    };
    if (!parent_->runInMessageLoopThread(toRun)) {
        runRequests_--;
        throw Coderun::Exception("the message loop refused the run request");
    }
}

RunResult
Runner::
runSync(const vector<string> & command,
        const shared_ptr<InputSink> & stdOutSink,
        const shared_ptr<InputSink> & stdErrSink)
{
    ExcAssert(runRequests_ < std::numeric_limits<int>::max());
    runRequests_++;

    RunResult result;
    bool terminated(false);
    auto onTerminate = [&] (const RunResult & newResult) {
        result = newResult;
        terminated = true;
    };

    doRunImpl(command, onTerminate, stdOutSink, stdErrSink);

    while (!terminated) {
        loop(-1, -1);
    }

    if (result.state == RunResult::LAUNCH_EXCEPTION) {
        std::rethrow_exception(result.launchExc);
    }

    return result;
}

void
Runner::
doRunImpl(const vector<string> & command,
          const OnTerminate & onTerminate,
          const shared_ptr<InputSink> & stdOutSink,
          const shared_ptr<InputSink> & stdErrSink)
{
    /* "activeRequest_" must be increased after "running_" is set and the
       child state reset, so that a waiter released by "waitRunning" sees the
       state of this request rather than the one of the previous run. */
    bool oldRunning(running_);
    if (!oldRunning) {
        startDate_ = Date::now();
        endDate_ = Date::negativeInfinity();
        childPid_ = -1;
    }
    running_ = true;
    futex_wake(running_);
    activeRequest_++;
    futex_wake(activeRequest_);
    if (oldRunning) {
        throw Coderun::Exception("already running");
    }

    task_.onTerminate = onTerminate;

    try {
        launch(command, stdOutSink, stdErrSink);
    }
    catch (const std::exception & exc) {
        RunResult result;
        result.updateFromLaunchException(std::current_exception());
        task_.onTerminate = nullptr;
        childPid_ = -2;
        futex_wake(childPid_);
        endDate_ = Date::now();

        onTerminate(result);

        /* As in attemptTaskTermination, "running_" is only reset once
           "onTerminate" has returned. */
        running_ = false;
        futex_wake(running_);
    }
}

void
Runner::
launch(const vector<string> & command,
       const shared_ptr<InputSink> & stdOutSink,
       const shared_ptr<InputSink> & stdErrSink)
{
    if (command.empty()) {
        throw Coderun::Exception("no command to run");
    }

    /* Undo everything when the launch fails part way. */
    Call_Guard failureGuard([&] () {
        if (task_.wrapperPid > 0) {
            ::kill(task_.wrapperPid, SIGKILL);
            int status;
            while (::waitpid(task_.wrapperPid, &status, 0) == -1
                   && errno == EINTR) {
            }
        }
        task_.wrapperPid = -1;
        for (int * fd: { &task_.statusFd, &task_.stdOutFd, &task_.stdErrFd }) {
            if (*fd > -1) {
                ::close(*fd);
                *fd = -1;
            }
        }
        task_.statusState = ProcessState::UNKNOWN;
        stdOutSink_.reset();
        stdErrSink_.reset();
    });

    /* Set up the arguments before we fork, as we don't want to call malloc()
       from the forked child. */
    vector<string> args;
    args.reserve(command.size() + 1 + HelperChannels::numArgs);
    args.push_back(findRunnerHelper());

    HelperChannels childFds;
    Call_Guard closeChildFds([&] () { childFds.close(); });
    tie(task_.statusFd, childFds.status) = CreateStdPipe();

    stdOutSink_ = stdOutSink ? stdOutSink : make_shared<NullInputSink>();
    tie(task_.stdOutFd, childFds.stdOut) = CreateStdPipe();
    stdErrSink_ = stdErrSink ? stdErrSink : make_shared<NullInputSink>();
    tie(task_.stdErrFd, childFds.stdErr) = CreateStdPipe();

    vector<string> channels = childFds.toArgs();
    args.insert(args.end(), channels.begin(), channels.end());
    args.insert(args.end(), command.begin(), command.end());

    vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const string & arg: args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::flockfile(stdout);
    ::flockfile(stderr);
    ::fflush_unlocked(NULL);
    task_.wrapperPid = fork();
    int savedErrno = errno;
    ::funlockfile(stderr);
    ::funlockfile(stdout);
    if (task_.wrapperPid == -1) {
        throw Coderun::Exception(savedErrno, "Runner::run fork");
    }
    else if (task_.wrapperPid == 0) {
        ::execv(argv[0], argv.data());

        ProcessStatus status;
        status.state = ProcessState::STOPPED;
        status.fail(errno, LaunchError::EXEC);
        ssize_t written = ::write(childFds.status, &status, sizeof(status));
        ::_exit(written == sizeof(status) ? 127 : 126);
    }
    else {
        task_.statusState = ProcessState::LAUNCHING;

        set_file_flag(task_.statusFd, O_NONBLOCK);
        auto statusCb = [this] (const epoll_event & event) {
            handleChildStatus(event);
        };
        addFd(task_.statusFd, statusCb);

        set_file_flag(task_.stdOutFd, O_NONBLOCK);
        auto outputCb = [this] (const epoll_event & event) {
            handleOutputStatus(event, task_.stdOutFd, stdOutSink_);
        };
        addFd(task_.stdOutFd, outputCb);

        set_file_flag(task_.stdErrFd, O_NONBLOCK);
        auto errorCb = [this] (const epoll_event & event) {
            handleOutputStatus(event, task_.stdErrFd, stdErrSink_);
        };
        addFd(task_.stdErrFd, errorCb);

        failureGuard.clear();
    }
}

bool
Runner::
kill(int signum, bool mustSucceed) const
{
    if (parent_ && parent_->inMessageLoopThread()) {
        throw Coderun::Exception("Runner::kill would wait forever when called"
                                 " from its message loop thread");
    }
    if (!signal(signum, mustSucceed)) {
        return false;
    }
    waitTermination();
    return true;
}

bool
Runner::
signal(int signum, bool mustSucceed) const
{
    pid_t pid = childPid_;
    pid_t group = processGroup_;
    if (pid <= 0 && group <= 0) {
        if (mustSucceed)
            throw Coderun::Exception("subprocess not available");
        else return false;
    }

    /* The child leads its own process group, which includes every process it
       spawned that did not leave it. */
    int res = -1;
    errno = ESRCH;
    if (group > 0) {
        res = ::kill(-group, signum);
    }
    if (res == -1 && errno == ESRCH && pid > 0) {
        res = ::kill(pid, signum);
    }
    if (res == -1) {
        if (mustSucceed)
            throw Coderun::Exception(errno, "Runner::signal kill");
        return false;
    }

    return true;
}

bool
Runner::
waitRunning(double secondsToWait) const
{
    Date deadline = Date::now().plusSeconds(secondsToWait);

    while (true) {
        int currentActive(activeRequest_);
        if (currentActive >= runRequests_) {
            return true;
        }
        double timeToWait = Date::now().secondsUntil(deadline);
        if (timeToWait < 0) {
            return false;
        }
        futex_wait(activeRequest_, currentActive, timeToWait);
    }
}

bool
Runner::
waitStart(double secondsToWait) const
{
    Date deadline = Date::now().plusSeconds(secondsToWait);

    if (!waitRunning(secondsToWait)) {
        return false;
    }

    while (childPid_ == -1) {
        double timeToWait = Date::now().secondsUntil(deadline);
        if (timeToWait < 0)
            break;
        futex_wait(childPid_, -1, timeToWait);
    }

    return childPid_ > 0;
}

void
Runner::
waitTermination() const
{
    waitRunning();
    while (running_) {
        futex_wait(running_, true);
    }
}

double
Runner::
duration()
    const
{
    Date end = Date::now();
    if (!running_) {
        end = endDate_;
    }

    return (end - startDate_);
}

string
Runner::
findRunnerHelper()
{
    string helper = Runner::runnerHelper;

    if (helper.empty()) {
        const char * cBin = ::getenv("BIN");
        if (cBin && cBin[0] != '\0') {
            helper = string(cBin) + "/runner_helper";
        }
    }
#ifdef CODERUN_RUNNER_HELPER
    if (helper.empty()) {
        helper = CODERUN_RUNNER_HELPER;
    }
#endif
    if (helper.empty()) {
        throw Coderun::Exception("location of runner_helper is unknown:"
                                 " set Runner::runnerHelper or $BIN");
    }

    // Make sure the deduced path is right
    struct stat sb;
    int res = ::stat(helper.c_str(), &sb);
    if (res != 0) {
        throw Coderun::Exception(errno, "checking runner helper " + helper);
    }

    return helper;
}

/* RUNNER::TASK */

Runner::Task::
Task()
    : wrapperPid(-1),
      stdOutFd(-1),
      stdErrFd(-1),
      statusFd(-1),
      statusState(ProcessState::UNKNOWN)
{}

/* This method *must* be called from attemptTaskTermination, in order to
 * respect the natural order of things. */
void
Runner::Task::
postTerminate(Runner & runner)
{
    if (wrapperPid <= 0) {
        throw Coderun::Exception("wrapperPid <= 0, has postTerminate been"
                                 " executed before?");
    }

    int wrapperPidStatus;
    while (true) {
        int res = ::waitpid(wrapperPid, &wrapperPidStatus, 0);
        if (res == wrapperPid) {
            break;
        }
        else if (res == -1) {
            if (errno != EINTR) {
                throw Coderun::Exception(errno, "waitpid");
            }
        }
        else {
            throw Coderun::Exception("waitpid has not returned the wrappedPid");
        }
    }
    wrapperPid = -1;

    if (statusFd > -1) {
        runner.removeFd(statusFd);
        ::close(statusFd);
        statusFd = -1;
    }

    runResult = RunResult();
    onTerminate = nullptr;
    statusState = ProcessState::UNKNOWN;
}


/* RUNRESULT */

RunResult::
RunResult()
    : state(UNKNOWN), signum(-1), returnCode(-1), launchErrno(0)
{
    ::memset(&usage, 0, sizeof(usage));
}

void
RunResult::
updateFromStatus(int status)
{
    if (WIFEXITED(status)) {
        state = RETURNED;
        returnCode = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status)) {
        state = SIGNALED;
        signum = WTERMSIG(status);
    }
}

int
RunResult::
processStatus()
    const
{
    int status;

    if (state == RETURNED)
        status = returnCode;
    else if (state == SIGNALED || state == PARENT_EXITED)
        status = 128 + signum;
    else if (state == LAUNCH_ERROR) {
        if (launchErrno == EPERM || launchErrno == EACCES) {
            status = 126;
        }
        else if (launchErrno == ENOENT) {
            status = 127;
        }
        else {
            status = 1;
        }
    }
    else
        throw Coderun::Exception("unhandled state " + to_string(state));

    return status;
}

void
RunResult::
updateFromLaunchException(const std::exception_ptr & excPtr)
{
    state = LAUNCH_EXCEPTION;
    launchExc = excPtr;
}

void
RunResult::
updateFromLaunchError(int launchErrno,
                      const std::string & launchError)
{
    this->state = LAUNCH_ERROR;
    this->launchErrno = launchErrno;
    if (!launchError.empty()) {
        this->launchError = launchError;
        if (launchErrno)
            this->launchError += std::string(": ")
                + strerror(launchErrno);
    }
    else {
        this->launchError = strerror(launchErrno);
    }
}

std::string
to_string(const RunResult::State & state)
{
    switch (state) {
    case RunResult::UNKNOWN: return "UNKNOWN";
    case RunResult::LAUNCH_EXCEPTION: return "LAUNCH_EXCEPTION";
    case RunResult::LAUNCH_ERROR: return "LAUNCH_ERROR";
    case RunResult::RETURNED: return "RETURNED";
    case RunResult::SIGNALED: return "SIGNALED";
    case RunResult::PARENT_EXITED: return "PARENT_EXITED";
    }

    return format("RunResult::State(%d)", state);
}

std::ostream &
operator << (std::ostream & stream, const RunResult::State & state)
{
    return stream << to_string(state);
}


/* EXECUTE */

RunResult
execute(const vector<string> & command,
        const shared_ptr<InputSink> & stdOutSink,
        const shared_ptr<InputSink> & stdErrSink)
{
    Runner runner;

    return runner.runSync(command, stdOutSink, stdErrSink);
}

} // namespace Coderun
