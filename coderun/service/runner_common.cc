/* runner_common.cc
   Wolfgang Sourdeau, 10 December 2014
   Copyright (c) 2014 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.
*/

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <boost/lexical_cast.hpp>

#include "coderun/arch/exception.h"

#include "runner_common.h"


using namespace std;


namespace Coderun {

std::string
statusStateAsString(ProcessState statusState)
{
    switch (statusState) {
    case ProcessState::UNKNOWN: return "UNKNOWN";
    case ProcessState::LAUNCHING: return "LAUNCHING";
    case ProcessState::RUNNING: return "RUNNING";
    case ProcessState::STOPPED: return "STOPPED";
    case ProcessState::DONE: return "DONE";
    }
    throw Coderun::Exception("unknown process state %d", (int)statusState);
}

std::string
strLaunchError(LaunchError error)
{
    switch (error) {
    case LaunchError::NONE: return "";
    case LaunchError::EXEC: return "launching the command";
    case LaunchError::WAITPID: return "waiting for the command";
    case LaunchError::STATUS_PIPE: return "reading the launch status";
    }
    throw Coderun::Exception("unknown launch error %d", (int)error);
}


/****************************************************************************/
/* PROCESS STATUS                                                           */
/****************************************************************************/

ProcessStatus::
ProcessStatus()
{
    /* the record is written as raw bytes: padding is zeroed too */
    ::memset(this, 0, sizeof(*this));

    state = ProcessState::UNKNOWN;
    pid = -1;
    childStatus = -1;
    launchErrorCode = LaunchError::NONE;
}


/****************************************************************************/
/* HELPER CHANNELS                                                          */
/****************************************************************************/

constexpr int HelperChannels::numArgs;

std::vector<std::string>
HelperChannels::
toArgs() const
{
    return { to_string(stdOut), to_string(stdErr), to_string(status) };
}

HelperChannels
HelperChannels::
fromArgs(char * const args[])
{
    HelperChannels result;
    int * fields[numArgs] = { &result.stdOut, &result.stdErr, &result.status };
    for (int i = 0; i < numArgs; i++) {
        try {
            *fields[i] = boost::lexical_cast<int>(args[i]);
        }
        catch (const boost::bad_lexical_cast &) {
            throw Coderun::Exception("invalid descriptor '%s'", args[i]);
        }
        if (*fields[i] < 0) {
            throw Coderun::Exception("invalid descriptor '%s'", args[i]);
        }
    }
    return result;
}

void
HelperChannels::
sendStatus(const ProcessStatus & status)
    const
{
    ssize_t res;
    while ((res = ::write(this->status, &status, sizeof(status))) == -1
           && errno == EINTR) {
    }
    if (res == -1)
        throw Coderun::Exception(errno, "writing the process status");
    if (res != sizeof(status))
        throw Coderun::Exception("process status written partially");
}

void
HelperChannels::
close()
{
    for (int * fd: { &stdOut, &stdErr, &status }) {
        if (*fd > -1) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace Coderun
