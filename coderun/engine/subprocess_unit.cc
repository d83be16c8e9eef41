/* subprocess_unit.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <signal.h>

#include "coderun/arch/exception.h"
#include "coderun/service/message_loop.h"
#include "coderun/service/runner.h"
#include "coderun/utils/exc_check.h"

#include "output_relay.h"
#include "subprocess_unit.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("Subprocess Unit");
Logging::Category errors("Subprocess Unit Error", logs);
Logging::Category trace("Subprocess Unit Trace", logs, false);

/* Trim the whitespace around what the syntax checker reported. */
string trimReport(const string & report)
{
    size_t start = report.find_first_not_of(" \t\r\n");
    if (start == string::npos) {
        return "";
    }
    string result = report.substr(start);
    OutputRelay::rstrip(result);
    return OutputRelay::decodeUtf8(result);
}

} // file scope


namespace Coderun {

/*****************************************************************************/
/* SUBPROCESS CONFIG                                                         */
/*****************************************************************************/

SubprocessConfig::
SubprocessConfig()
    : interpreter({"python3", "-u"}),
      syntaxCheck({"python3", "-c",
                   "import ast, sys; "
                   "ast.parse(open(sys.argv[1], 'rb').read(), sys.argv[1])"}),
      fileSuffix(".py")
{
}


UnitOutcome
syntaxCheckOutcome(const RunResult & result, const std::string & errors)
{
    if (result.state == RunResult::RETURNED) {
        if (result.returnCode == 0) {
            return UnitOutcome::returned(0);
        }
        string report = trimReport(errors);
        if (report.empty()) {
            report = "syntax check failed with exit code "
                + std::to_string(result.returnCode);
        }
        return UnitOutcome::submissionFault(report);
    }

    UnitOutcome outcome = UnitOutcome::fromRunResult(result, "syntax checker");
    if (outcome.state == UnitOutcome::SIGNALED) {
        outcome = UnitOutcome::fault("syntax checker terminated by signal "
                                     + std::to_string(result.signum));
    }
    return outcome;
}


/*****************************************************************************/
/* SUBPROCESS UNIT                                                           */
/*****************************************************************************/

SubprocessUnit::
SubprocessUnit(MessageLoop & loop, const SubprocessConfig & config)
    : loop_(loop), config_(config),
      phase_(IDLE), stopRequested_(false), codeStarted_(false),
      runnerAttached_(false)
{
    ExcCheck(!config_.interpreter.empty(), "no interpreter configured");
}

SubprocessUnit::
~SubprocessUnit()
{
    if (runner_) {
        if (phase_ == CHECKING || phase_ == RUNNING) {
            runner_->signal(SIGKILL, false);
        }
        if (runnerAttached_) {
            loop_.removeSource(runner_.get());
        }
    }
}

void
SubprocessUnit::
start(const std::string & code,
      const std::shared_ptr<InputSink> & stdOutSink,
      const std::shared_ptr<InputSink> & stdErrSink,
      const OnFinished & onFinished)
{
    ExcCheck(phase_ == IDLE, "unit already started");
    ExcCheck(onFinished, "onFinished is mandatory");

    stdOutSink_ = stdOutSink ? stdOutSink : make_shared<NullInputSink>();
    stdErrSink_ = stdErrSink ? stdErrSink : make_shared<NullInputSink>();
    onFinished_ = onFinished;

    codeFile_.reset(new TempFile(code, config_.fileSuffix));

    runner_ = make_shared<Runner>();
    if (!loop_.addSource("runner " + codeFile_->path(), runner_)) {
        throw Coderun::Exception("could not add the runner to the loop");
    }
    runnerAttached_ = true;

    LOG(trace) << "starting unit for " << codeFile_->path() << endl;

    if (config_.syntaxCheck.empty()) {
        runCode();
    }
    else {
        runCheck();
    }
}

void
SubprocessUnit::
runCheck()
{
    phase_ = CHECKING;

    vector<string> command = config_.syntaxCheck;
    command.push_back(codeFile_->path());

    checkErrors_ = make_shared<StringInputSink>(65536);

    weak_ptr<SubprocessUnit> weakSelf = shared_from_this();
    auto onTerminate = [weakSelf] (const RunResult & result) {
        auto self = weakSelf.lock();
        if (self) {
            self->onCheckTerminated(result);
        }
    };

    runner_->run(command, onTerminate, nullptr, checkErrors_);
}

void
SubprocessUnit::
runCode()
{
    phase_ = RUNNING;
    codeStarted_ = true;

    vector<string> command = config_.interpreter;
    command.push_back(codeFile_->path());

    weak_ptr<SubprocessUnit> weakSelf = shared_from_this();
    auto onTerminate = [weakSelf] (const RunResult & result) {
        auto self = weakSelf.lock();
        if (self) {
            self->onCodeTerminated(result);
        }
    };

    runner_->run(command, onTerminate, stdOutSink_, stdErrSink_);
}

void
SubprocessUnit::
onCheckTerminated(const RunResult & result)
{
    if (phase_ != CHECKING)
        return;

    if (stopRequested_) {
        if (result.state == RunResult::SIGNALED) {
            finish(UnitOutcome::signaled(result.signum));
        }
        else {
            finish(UnitOutcome::signaled(SIGINT));
        }
        return;
    }

    if (result.state == RunResult::RETURNED && result.returnCode == 0) {
        try {
            runCode();
        }
        catch (const std::exception & exc) {
            finish(UnitOutcome::fault(exc.what()));
        }
        return;
    }

    finish(syntaxCheckOutcome(result, checkErrors_->data()));
}

void
SubprocessUnit::
onCodeTerminated(const RunResult & result)
{
    if (phase_ != RUNNING)
        return;

    finish(UnitOutcome::fromRunResult(result, config_.interpreter[0]));
}

void
SubprocessUnit::
finish(const UnitOutcome & outcome)
{
    phase_ = FINISHED;

    LOG(trace) << "unit for " << codeFile_->path() << " finished: "
               << outcome << endl;

    try {
        codeFile_->remove();
    }
    catch (const std::exception & exc) {
        LOG(errors) << "could not remove code file: " << exc.what() << endl;
    }

    if (runnerAttached_) {
        loop_.removeSource(runner_.get());
        runnerAttached_ = false;
    }

    /* The sinks were closed by the runner if the code ran. */
    if (!codeStarted_) {
        stdOutSink_->notifyClosed();
        stdErrSink_->notifyClosed();
    }

    auto onFinished = move(onFinished_);
    onFinished_ = nullptr;
    onFinished(outcome);
}

bool
SubprocessUnit::
terminate(bool graceful)
{
    if (phase_ != CHECKING && phase_ != RUNNING)
        return false;

    stopRequested_ = true;

    return runner_->signal(graceful ? SIGINT : SIGKILL, false);
}

bool
SubprocessUnit::
alive() const
{
    return phase_ == CHECKING || phase_ == RUNNING;
}

std::string
SubprocessUnit::
codePath() const
{
    return codeFile_ ? codeFile_->path() : string();
}


/*****************************************************************************/
/* SUBPROCESS UNIT FACTORY                                                   */
/*****************************************************************************/

SubprocessUnitFactory::
SubprocessUnitFactory(const SubprocessConfig & config)
    : config_(config)
{
}

std::shared_ptr<ExecutionUnit>
SubprocessUnitFactory::
create(MessageLoop & loop)
{
    return make_shared<SubprocessUnit>(loop, config_);
}

} // namespace Coderun
