/* execution_unit.h                                                -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Abstract runtime that runs one code submission.
*/

#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "coderun/service/sink.h"


namespace Coderun {

struct MessageLoop;
struct RunResult;


/*****************************************************************************/
/* UNIT OUTCOME                                                              */
/*****************************************************************************/

/** How an execution unit finished. */

struct UnitOutcome {
    enum State {
        RETURNED,         ///< The code ran and exited with a return code
        SIGNALED,         ///< The code was terminated by a signal
        SUBMISSION_FAULT, ///< The code was rejected before it could run
        FAULT             ///< The unit itself failed
    };

    UnitOutcome();

    static UnitOutcome returned(int returnCode);
    static UnitOutcome signaled(int signum);
    static UnitOutcome submissionFault(const std::string & detail);
    static UnitOutcome fault(const std::string & detail);

    /** Convert the result of a Runner into an outcome.  "what" names the
        program that was run, for launch errors. */
    static UnitOutcome fromRunResult(const RunResult & result,
                                     const std::string & what);

    bool success() const
    {
        return state == RETURNED && returnCode == 0;
    }

    /** Exit indicator as a shell would see it, negated for signals. */
    int exitCode() const;

    State state;
    int returnCode;
    int signum;
    std::string detail;
};

std::string to_string(UnitOutcome::State state);

std::ostream &
operator << (std::ostream & stream, const UnitOutcome & outcome);


/*****************************************************************************/
/* EXECUTION UNIT                                                            */
/*****************************************************************************/

/** One isolated runtime for one submission.  Every method is called from
    the thread of the MessageLoop the unit was created for, and every
    callback is invoked from that thread.
*/

struct ExecutionUnit {
    typedef std::function<void (const UnitOutcome & outcome)> OnFinished;

    virtual ~ExecutionUnit()
    {
    }

    /** Start running the code.  Output is delivered incrementally to the
        given sinks, which are closed before "onFinished" is invoked.
        "onFinished" is invoked exactly once and never from within "start".
        Throws when the unit could not be set up, in which case "onFinished"
        is never invoked.
    */
    virtual void start(const std::string & code,
                       const std::shared_ptr<InputSink> & stdOutSink,
                       const std::shared_ptr<InputSink> & stdErrSink,
                       const OnFinished & onFinished) = 0;

    /** Ask the unit to stop: cooperatively when "graceful" is true,
        unconditionally otherwise.  Never blocks; completion is reported
        through "onFinished".  Returns whether the request was delivered.
    */
    virtual bool terminate(bool graceful) = 0;

    /** Has the unit been started and not finished yet? */
    virtual bool alive() const = 0;
};


/*****************************************************************************/
/* EXECUTION UNIT FACTORY                                                    */
/*****************************************************************************/

/** Strategy used by the engine to create one unit per submission. */

struct ExecutionUnitFactory {
    virtual ~ExecutionUnitFactory()
    {
    }

    virtual std::shared_ptr<ExecutionUnit> create(MessageLoop & loop) = 0;
};

} // namespace Coderun
