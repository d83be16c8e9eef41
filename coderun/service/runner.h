/* runner.h                                                        -*- C++ -*-
   Wolfgang Sourdeau, September 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   A command runner class that hides the specifics of the underlying unix
   system calls and can intercept output.
*/

#pragma once

#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>

#include <cmath>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "coderun/types/date.h"

#include "epoll_loop.h"
#include "runner_common.h"
#include "sink.h"


namespace Coderun {

/*****************************************************************************/
/* RUN RESULT                                                                */
/*****************************************************************************/

/** This is the result that is returned that encapsulates the state of a
    command that ran.

    There are 3 broad outcomes possible:
    1.  There was an error launching;
    2.  The command exited due to a signal;
    3.  The command exited normally and gave us a return code.

    Note that recording good messages for launch errors is really important,
    as it can be very difficult to debug this kind of error.
*/

struct RunResult {
    RunResult();

    /** Update the state in response to the command returning.
        The status parameter is as returned by waidpid.
    */
    void updateFromStatus(int status);

    /** Extract the process return code as would be returned by a shell. */
    int processStatus() const;

    /** Update the state in response to a launch error. */
    void updateFromLaunchError(int launchErrno,
                               const std::string & launchError);

    /** Update the state in response to an exception thrown while setting
        up the launch. */
    void updateFromLaunchException(const std::exception_ptr & excPtr);

    /// Enumeration of the final state of the command
    enum State {
        UNKNOWN,          ///< State is not known
        LAUNCH_EXCEPTION, ///< Exception thrown when launching the command
        LAUNCH_ERROR,     ///< Command was unable to be launched
        RETURNED,         ///< Command returned
        SIGNALED,         ///< Command exited with a signal
        PARENT_EXITED     ///< The helper exited before reporting a status
    };

    State state;
    int signum;         ///< Signal number it returned with
    int returnCode;     ///< Return code if command exited

    int launchErrno;    ///< Errno (if appropriate) of launch error
    std::string launchError;  ///< Error string describing launch error
    std::exception_ptr launchExc; ///< Exception thrown when launching

    rusage usage;       ///< Process statistics
};

std::string to_string(const RunResult::State & state);

std::ostream &
operator << (std::ostream & stream, const RunResult::State & state);


/*****************************************************************************/
/* RUNNER                                                                    */
/*****************************************************************************/

/** This class encapsulates running a sub-command, including launching it and
    capturing the output and error streams of the subprocess.

    The command is started through the "runner_helper" executable, which
    places it in a process group of its own, and reports its status back.
    The child's standard input is /dev/null.

    For asynchronous operation the runner must be added to a MessageLoop
    before "run" is called; every callback is then invoked from the loop
    thread.  "runSync" drives the runner from the calling thread instead.
*/

struct Runner: public EpollLoop {
    typedef std::function<void (const RunResult & result)> OnTerminate;

    Runner();
    ~Runner();

    /** Path of the runner_helper executable.  When empty, the helper is
        looked up in the $BIN directory, then at the location it was built
        at. */
    static std::string runnerHelper;

    /** Run the subprocess asynchronously.  "onTerminate" is invoked once the
        process has exited and both output sinks have been closed.  Errors
        happening while launching are reported through "onTerminate" as
        well. */
    void run(const std::vector<std::string> & command,
             const OnTerminate & onTerminate,
             const std::shared_ptr<InputSink> & stdOutSink = nullptr,
             const std::shared_ptr<InputSink> & stdErrSink = nullptr);

    /** Run the subprocess synchronously, from the calling thread.  Launch
        exceptions are rethrown. */
    RunResult runSync(const std::vector<std::string> & command,
                      const std::shared_ptr<InputSink> & stdOutSink = nullptr,
                      const std::shared_ptr<InputSink> & stdErrSink = nullptr);

    /** Kill the subprocess with the given signal, then wait for it to
        terminate.  Must not be called from the thread that processes the
        runner's events.

        If mustSucceed = true, then an exception will be thrown if there
        is no process.

        Returns whether or not the call succeeded.
    */
    bool kill(int signal = SIGTERM, bool mustSucceed = true) const;

    /** Send the given signal to the process group of the subprocess, but
        don't wait for it to terminate.  May be called from any thread.

        If mustSucceed = true, then an exception will be thrown if there
        is no process.

        Returns whether or not the call succeeded.
    */
    bool signal(int signum, bool mustSucceed = true) const;

    /** Synchronous wait for every "run" request issued so far to have been
        picked up by the message loop.  Returns false on timeout. */
    bool waitRunning(double secondsToWait = INFINITY) const;

    /** Synchronous wait for the subprocess to start.  Returns true if the
        process started, or false if it wasn't able to start.

        Will wait for a maximum of secondsToWait seconds.
    */
    bool waitStart(double secondsToWait = INFINITY) const;

    /** Synchronous wait for termination of the subprocess and the closing of
     * all related resources. */
    void waitTermination() const;

    /** Is the subprocess running? */
    bool running() const { return running_; }

    /** Process ID of the child process. Returns -1 if not running, -2 in case
        of a launch error, -3 when terminated. */
    pid_t childPid() const { return childPid_; }

    Date startDate() const { return startDate_; }
    Date endDate() const { return endDate_; }

    /** The number of seconds since the actual start time of the subprocess.
        If terminated, the actual interval between the start and the
        termination times thereof. */
    double duration() const;

private:
    struct Task {
        Task();

        void postTerminate(Runner & runner);

        OnTerminate onTerminate;
        RunResult runResult;

        pid_t wrapperPid;

        int stdOutFd;
        int stdErrFd;
        int statusFd;

        ProcessState statusState;
    };

    static std::string findRunnerHelper();

    void doRunImpl(const std::vector<std::string> & command,
                   const OnTerminate & onTerminate,
                   const std::shared_ptr<InputSink> & stdOutSink,
                   const std::shared_ptr<InputSink> & stdErrSink);
    void launch(const std::vector<std::string> & command,
                const std::shared_ptr<InputSink> & stdOutSink,
                const std::shared_ptr<InputSink> & stdErrSink);

    void handleChildStatus(const struct epoll_event & event);
    void handleOutputStatus(const struct epoll_event & event,
                            int & fd, std::shared_ptr<InputSink> & sink);

    void attemptTaskTermination();

    /* Number of "run" and "runSync" calls, and number of those that the
       loop thread has started processing. */
    int runRequests_;
    int activeRequest_;

    int running_;
    Date startDate_;
    Date endDate_;

    /** Holds the child PID if > 0.  If not:
        -1 means the child has not launched yet
        -2 means there was a launch error
        -3 means the child has exited
    */
    int childPid_;

    /** Process group led by the child, kept until the task has terminated
        so that processes it spawned can be signaled once it has exited. */
    pid_t processGroup_;

    std::shared_ptr<InputSink> stdOutSink_;
    std::shared_ptr<InputSink> stdErrSink_;

    Task task_;
    char statusBuffer_[sizeof(ProcessStatus)];
    size_t statusRemaining_;
};


/*****************************************************************************/
/* EXECUTE                                                                   */
/*****************************************************************************/

/** Execute a command synchronously using its own Runner. */
RunResult execute(const std::vector<std::string> & command,
                  const std::shared_ptr<InputSink> & stdOutSink = nullptr,
                  const std::shared_ptr<InputSink> & stdErrSink = nullptr);

} // namespace Coderun
