/* execution_unit.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <string.h>

#include "coderun/arch/exception.h"
#include "coderun/service/runner.h"

#include "execution_unit.h"

using namespace std;


namespace Coderun {

/*****************************************************************************/
/* UNIT OUTCOME                                                              */
/*****************************************************************************/

UnitOutcome::
UnitOutcome()
    : state(FAULT), returnCode(-1), signum(-1)
{
}

UnitOutcome
UnitOutcome::
returned(int returnCode)
{
    UnitOutcome result;
    result.state = RETURNED;
    result.returnCode = returnCode;
    return result;
}

UnitOutcome
UnitOutcome::
signaled(int signum)
{
    UnitOutcome result;
    result.state = SIGNALED;
    result.signum = signum;
    return result;
}

UnitOutcome
UnitOutcome::
submissionFault(const std::string & detail)
{
    UnitOutcome result;
    result.state = SUBMISSION_FAULT;
    result.detail = detail;
    return result;
}

UnitOutcome
UnitOutcome::
fault(const std::string & detail)
{
    UnitOutcome result;
    result.state = FAULT;
    result.detail = detail;
    return result;
}

UnitOutcome
UnitOutcome::
fromRunResult(const RunResult & result, const std::string & what)
{
    switch (result.state) {
    case RunResult::RETURNED:
        return returned(result.returnCode);
    case RunResult::SIGNALED:
    case RunResult::PARENT_EXITED:
        return signaled(result.signum);
    case RunResult::LAUNCH_ERROR:
        return fault("could not launch " + what + ": " + result.launchError);
    case RunResult::LAUNCH_EXCEPTION:
        return fault("could not launch " + what + ": "
                     + describeException(result.launchExc));
    case RunResult::UNKNOWN:
        break;
    }

    return fault(what + " finished in an unknown state");
}

int
UnitOutcome::
exitCode() const
{
    if (state == RETURNED)
        return returnCode;
    if (state == SIGNALED)
        return -signum;
    return -1;
}

std::string
to_string(UnitOutcome::State state)
{
    switch (state) {
    case UnitOutcome::RETURNED: return "RETURNED";
    case UnitOutcome::SIGNALED: return "SIGNALED";
    case UnitOutcome::SUBMISSION_FAULT: return "SUBMISSION_FAULT";
    case UnitOutcome::FAULT: return "FAULT";
    }
    throw Coderun::Exception("unknown unit outcome state %d", (int)state);
}

std::ostream &
operator << (std::ostream & stream, const UnitOutcome & outcome)
{
    stream << to_string(outcome.state);
    switch (outcome.state) {
    case UnitOutcome::RETURNED:
        return stream << " (" << outcome.returnCode << ")";
    case UnitOutcome::SIGNALED:
        return stream << " (" << strsignal(outcome.signum) << ")";
    default:
        return stream << ": " << outcome.detail;
    }
}

} // namespace Coderun
