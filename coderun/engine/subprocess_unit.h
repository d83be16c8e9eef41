/* subprocess_unit.h                                               -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Execution unit running the code in a new process through an interpreter.
*/

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "coderun/service/logs.h"
#include "coderun/utils/file_functions.h"

#include "execution_unit.h"


namespace Coderun {

struct Runner;
struct RunResult;


/*****************************************************************************/
/* SUBPROCESS CONFIG                                                         */
/*****************************************************************************/

struct SubprocessConfig {
    SubprocessConfig();

    /** Command line prefix; the path of the code file is appended. */
    std::vector<std::string> interpreter;

    /** Command line prefix of the program checking the code file before it
        is run.  Empty disables the check. */
    std::vector<std::string> syntaxCheck;

    /** Suffix of the temporary code file. */
    std::string fileSuffix;
};

/** Outcome of running the syntax check: returned(0) when the code passed,
    a submission fault carrying what the checker wrote on its standard
    error when it was rejected, and a fault when the checker itself could
    not run to completion. */
UnitOutcome syntaxCheckOutcome(const RunResult & result,
                               const std::string & errors);


/*****************************************************************************/
/* SUBPROCESS UNIT                                                           */
/*****************************************************************************/

/** Writes the code to a temporary file and runs the interpreter on it with
    a Runner.  When a syntax check is configured, it is run first and a
    failure is reported as a submission fault carrying what the checker
    wrote on its standard error.

    Graceful termination sends SIGINT to the process group of the program
    being run, forced termination sends SIGKILL.  The code file is removed
    once the unit has finished, whatever the outcome.
*/

struct SubprocessUnit
    : public ExecutionUnit,
      public std::enable_shared_from_this<SubprocessUnit> {

    SubprocessUnit(MessageLoop & loop, const SubprocessConfig & config);
    ~SubprocessUnit();

    virtual void start(const std::string & code,
                       const std::shared_ptr<InputSink> & stdOutSink,
                       const std::shared_ptr<InputSink> & stdErrSink,
                       const OnFinished & onFinished);

    virtual bool terminate(bool graceful);

    virtual bool alive() const;

    /** Path of the code file, empty before "start". */
    std::string codePath() const;

private:
    enum Phase {
        IDLE,
        CHECKING,
        RUNNING,
        FINISHED
    };

    void runCheck();
    void runCode();
    void onCheckTerminated(const RunResult & result);
    void onCodeTerminated(const RunResult & result);
    void finish(const UnitOutcome & outcome);

    MessageLoop & loop_;
    SubprocessConfig config_;

    Phase phase_;
    bool stopRequested_;
    bool codeStarted_;
    bool runnerAttached_;

    std::unique_ptr<TempFile> codeFile_;
    std::shared_ptr<Runner> runner_;
    std::shared_ptr<StringInputSink> checkErrors_;

    std::shared_ptr<InputSink> stdOutSink_;
    std::shared_ptr<InputSink> stdErrSink_;
    OnFinished onFinished_;
};


/*****************************************************************************/
/* SUBPROCESS UNIT FACTORY                                                   */
/*****************************************************************************/

struct SubprocessUnitFactory : public ExecutionUnitFactory {
    SubprocessUnitFactory(const SubprocessConfig & config);

    virtual std::shared_ptr<ExecutionUnit> create(MessageLoop & loop);

private:
    SubprocessConfig config_;
};

} // namespace Coderun
