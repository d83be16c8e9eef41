/* runner_common.h                                                   -*-C++-*-
   Wolfgang Sourdeau, 10 December 2014
   Copyright (c) 2014 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Definitions shared between the Runner and its helper executable.
*/

#pragma once

#include <sys/types.h>
#include <sys/time.h>
#include <sys/resource.h>

#include <string>
#include <vector>


namespace Coderun {

/* The Runner starts "runner_helper <stdout> <stderr> <status> command...",
   where the first three arguments are the descriptors the helper inherits.
   The helper runs the command with the first two as its output streams and
   writes a ProcessStatus record on the third at each change of state:
   LAUNCHING, then RUNNING once exec has succeeded, then STOPPED. */

enum struct ProcessState {
    UNKNOWN,
    LAUNCHING,
    RUNNING,
    STOPPED,
    DONE        ///< STOPPED, and seen by the Runner
};

std::string statusStateAsString(ProcessState statusState);

/** What failed when a command could not be run or followed.  Passed as an
    int so that the record has a fixed size. */
enum struct LaunchError {
    NONE,
    EXEC,           ///< exec of the helper or of the command
    WAITPID,        ///< waiting for the command
    STATUS_PIPE     ///< reading the exec status of the command
};

std::string strLaunchError(LaunchError error);


/****************************************************************************/
/* PROCESS STATUS                                                           */
/****************************************************************************/

struct ProcessStatus {
    ProcessStatus();

    void fail(int errnum, LaunchError error)
    {
        launchErrno = errnum;
        launchErrorCode = error;
    }

    bool failed() const
    {
        return launchErrno != 0 || launchErrorCode != LaunchError::NONE;
    }

    ProcessState state;
    pid_t pid;
    int childStatus;        ///< as returned by waitpid
    int launchErrno;
    LaunchError launchErrorCode;
    rusage usage;
};


/****************************************************************************/
/* HELPER CHANNELS                                                          */
/****************************************************************************/

/** The descriptors handed from the Runner to its helper. */

struct HelperChannels {
    HelperChannels()
        : stdOut(-1), stdErr(-1), status(-1)
    {}

    static constexpr int numArgs = 3;

    std::vector<std::string> toArgs() const;

    /** Read the "numArgs" arguments starting at "args".  Throws when they
        are not descriptors. */
    static HelperChannels fromArgs(char * const args[]);

    /** Write a status record, in full or not at all. */
    void sendStatus(const ProcessStatus & status) const;

    /** Close every descriptor still open. */
    void close();

    int stdOut;
    int stdErr;
    int status;
};

} // namespace Coderun
