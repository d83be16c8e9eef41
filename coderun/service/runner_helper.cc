/* runner_helper.cc
   Wolfgang Sourdeau, September 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   A helper program that performs various process accounting tasks and reports
   the process status to the Runner.

   Usage: runner_helper <stdout fd> <stderr fd> <status fd> <command> [args...]
*/

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <iostream>
#include <vector>

#include "coderun/arch/exception.h"
#include "coderun/utils/guard.h"

#include "runner_common.h"

using namespace std;
using namespace Coderun;


namespace {

/* Install the output channels as the standard output and error streams. */
void
dupToStdStreams(HelperChannels & channels)
{
    auto dupTo = [&] (int & oldFd, int newFd) {
        if (oldFd != newFd) {
            if (::dup2(oldFd, newFd) == -1) {
                throw Coderun::Exception(errno, "dup2");
            }
            ::close(oldFd);
            oldFd = newFd;
        }
    };
    dupTo(channels.stdOut, STDOUT_FILENO);
    dupTo(channels.stdErr, STDERR_FILENO);
}

/* Close every descriptor inherited from the Runner other than the standard
   streams and the status channel. */
void
closeRemainingFds(const HelperChannels & channels)
{
    DIR * dir = ::opendir("/proc/self/fd");
    if (!dir) {
        throw Coderun::Exception(errno, "opendir /proc/self/fd");
    }
    Call_Guard closeDir([&] () { ::closedir(dir); });

    vector<int> toClose;
    int dirFd = ::dirfd(dir);
    while (struct dirent * entry = ::readdir(dir)) {
        if (entry->d_name[0] == '.') {
            continue;
        }
        int fd = atoi(entry->d_name);
        if (fd > STDERR_FILENO && fd != channels.status && fd != dirFd) {
            toClose.push_back(fd);
        }
    }
    for (int fd: toClose) {
        ::close(fd);
    }
}

} // file scope


/* Runs in the forked child: becomes the command, or reports the errno of
   the failed exec on "execErrorFd" and exits. */
void
execCommand(char * execArgs[], int execErrorFd, const HelperChannels & fds)
{
    /* a session of its own, so that the Runner can signal the command along
       with everything it spawns */
    ::setsid();

    for (int signum: { SIGINT, SIGQUIT, SIGTERM }) {
        ::signal(signum, SIG_DFL);
    }
    sigset_t noSignals;
    ::sigemptyset(&noSignals);
    ::sigprocmask(SIG_SETMASK, &noSignals, nullptr);

    ::prctl(PR_SET_PDEATHSIG, SIGHUP);
    if (::getppid() == 1) {
        ::fprintf(stderr, "runner_helper: orphaned before exec\n");
        ::kill(::getpid(), SIGHUP);
    }
    ::close(fds.status);

    ::execvp(execArgs[0], execArgs);

    int execErrno = errno;
    ssize_t written = ::write(execErrorFd, &execErrno, sizeof(execErrno));
    ::_exit(written == sizeof(execErrno) ? 125 : 124);
}

/* Outcome of the exec, as seen through the close-on-exec pipe: NONE when the
   pipe was closed without a word. */
LaunchError
awaitExec(int execErrorFd, int & launchErrno)
{
    int received = 0;
    ssize_t bytes;
    while ((bytes = ::read(execErrorFd, &received, sizeof(received))) == -1
           && errno == EINTR) {
    }

    if (bytes == 0) {
        launchErrno = 0;
        return LaunchError::NONE;
    }
    if (bytes == -1) {
        launchErrno = errno;
        return LaunchError::STATUS_PIPE;
    }
    if (bytes != sizeof(received)) {
        launchErrno = EPROTO;
        return LaunchError::STATUS_PIPE;
    }
    launchErrno = received;
    return LaunchError::EXEC;
}

/* Runs in the helper: reports each state of the command to the Runner and
   returns the exit code of the helper. */
int
followCommand(pid_t commandPid, int execErrorFd, HelperChannels & fds)
{
    ::prctl(PR_SET_PDEATHSIG, SIGHUP);

    ProcessStatus status;
    status.pid = commandPid;
    status.state = ProcessState::LAUNCHING;
    fds.sendStatus(status);

    int launchErrno;
    LaunchError error = awaitExec(execErrorFd, launchErrno);
    if (error == LaunchError::NONE) {
        status.state = ProcessState::RUNNING;
        fds.sendStatus(status);
    }

    int waitStatus;
    pid_t waited;
    while ((waited = ::waitpid(commandPid, &waitStatus, 0)) == -1
           && errno == EINTR) {
    }
    int waitErrno = errno;

    int exitCode = 0;
    if (error != LaunchError::NONE) {
        /* the command never ran: the status of the forked child is moot */
        status.fail(launchErrno, error);
        exitCode = error == LaunchError::EXEC ? 126 : 127;
    }
    else if (waited != commandPid) {
        status.fail(waited == -1 ? waitErrno : ECHILD, LaunchError::WAITPID);
        exitCode = 127;
    }
    else {
        status.childStatus = waitStatus;
        ::getrusage(RUSAGE_CHILDREN, &status.usage);
    }

    status.state = ProcessState::STOPPED;
    fds.sendStatus(status);
    fds.close();

    return exitCode;
}

int main(int argc, char * argv[])
{
    const int commandArg = 1 + HelperChannels::numArgs;
    if (argc <= commandArg) {
        ::fprintf(stderr,
                  "usage: %s <stdout fd> <stderr fd> <status fd>"
                  " <command> [args...]\n", argv[0]);
        return 2;
    }

    /* dispositions inherited from the Runner */
    ::signal(SIGCHLD, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);

    try {
        HelperChannels fds = HelperChannels::fromArgs(argv + 1);
        dupToStdStreams(fds);
        closeRemainingFds(fds);

        vector<char *> execArgs;
        for (int i = commandArg; i < argc; i++) {
            execArgs.push_back(argv[i]);
        }
        execArgs.push_back(nullptr);

        /* Closed on exec: end of file on the read side means the command
           is running. */
        int execPipe[2] = { -1, -1 };
        Call_Guard closeExecPipe([&] () {
            for (int fd: execPipe) {
                if (fd != -1) {
                    ::close(fd);
                }
            }
        });
        if (::pipe2(execPipe, O_CLOEXEC) == -1) {
            throw Coderun::Exception(errno, "exec status pipe");
        }

        pid_t commandPid = ::fork();
        if (commandPid == -1) {
            throw Coderun::Exception(errno, "fork");
        }
        if (commandPid == 0) {
            ::close(execPipe[0]);
            execCommand(execArgs.data(), execPipe[1], fds);
        }

        ::close(execPipe[1]);
        execPipe[1] = -1;

        return followCommand(commandPid, execPipe[0], fds);
    }
    catch (const std::exception & exc) {
        cerr << "runner_helper: " << exc.what() << endl;
        return 127;
    }
}
