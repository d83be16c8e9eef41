/* delegated_unit.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <signal.h>

#include "coderun/arch/exception.h"
#include "coderun/service/logs.h"
#include "coderun/service/message_loop.h"
#include "coderun/utils/exc_check.h"

#include "delegated_unit.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("Delegated Unit");
Logging::Category errors("Delegated Unit Error", logs);
Logging::Category trace("Delegated Unit Trace", logs, false);

} // file scope


namespace Coderun {

/*****************************************************************************/
/* BACKEND RESULT                                                            */
/*****************************************************************************/

std::string
to_string(BackendResult::Status status)
{
    switch (status) {
    case BackendResult::SUCCESS: return "SUCCESS";
    case BackendResult::FAILED: return "FAILED";
    case BackendResult::ERROR: return "ERROR";
    case BackendResult::REVOKED: return "REVOKED";
    default:
        throw Coderun::Exception("unknown backend status %d", int(status));
    }
}

std::ostream &
operator << (std::ostream & stream, BackendResult::Status status)
{
    return stream << to_string(status);
}


/*****************************************************************************/
/* DELEGATED UNIT                                                            */
/*****************************************************************************/

DelegatedUnit::
DelegatedUnit(MessageLoop & loop,
              const std::shared_ptr<ExecutionBackend> & backend,
              double pollInterval)
    : loop_(loop), backend_(backend), pollInterval_(pollInterval),
      started_(false), finished_(false), revokeRequested_(false)
{
    ExcCheck(backend_, "no backend given");
    ExcCheckGreater(pollInterval_, 0.0, "invalid poll interval");
}

DelegatedUnit::
~DelegatedUnit()
{
    if (started_ && !finished_) {
        try {
            backend_->revoke(taskId_, true);
        }
        catch (const std::exception & exc) {
            LOG(errors) << "revoking task " << taskId_ << ": "
                        << exc.what() << endl;
        }
    }
    if (poller_) {
        loop_.removeSource(poller_.get());
    }
}

void
DelegatedUnit::
start(const std::string & code,
      const std::shared_ptr<InputSink> & stdOutSink,
      const std::shared_ptr<InputSink> & stdErrSink,
      const OnFinished & onFinished)
{
    ExcCheck(!started_, "unit already started");
    ExcCheck(onFinished, "onFinished is mandatory");

    taskId_ = backend_->submit(code);
    started_ = true;

    stdOutSink_ = stdOutSink ? stdOutSink : make_shared<NullInputSink>();
    stdErrSink_ = stdErrSink ? stdErrSink : make_shared<NullInputSink>();
    onFinished_ = onFinished;

    LOG(trace) << "submitted task " << taskId_ << endl;

    std::weak_ptr<DelegatedUnit> weakSelf(shared_from_this());

    /* The notification may come from any thread. */
    auto onReady = [weakSelf] () {
        if (auto self = weakSelf.lock()) {
            self->scheduleCheck();
        }
    };
    if (backend_->notifyWhenReady(taskId_, onReady)) {
        return;
    }

    auto onTick = [weakSelf] (uint64_t) {
        if (auto self = weakSelf.lock()) {
            self->check();
        }
    };
    poller_ = loop_.addPeriodic("poll " + taskId_, pollInterval_, onTick);
}

void
DelegatedUnit::
scheduleCheck()
{
    std::weak_ptr<DelegatedUnit> weakSelf(shared_from_this());
    loop_.runInMessageLoopThread([weakSelf] () {
        if (auto self = weakSelf.lock()) {
            self->check();
        }
    });
}

void
DelegatedUnit::
check()
{
    if (finished_)
        return;

    BackendResult result;
    bool ready;
    try {
        ready = backend_->poll(taskId_, result);
    }
    catch (const std::exception & exc) {
        LOG(errors) << "polling task " << taskId_ << ": " << exc.what()
                    << endl;
        finish(UnitOutcome::fault(exc.what()));
        return;
    }
    if (!ready)
        return;

    LOG(trace) << "task " << taskId_ << " completed: " << result.status
               << endl;

    if (!result.stdOut.empty()) {
        stdOutSink_->notifyReceived(move(result.stdOut));
    }
    if (!result.stdErr.empty()) {
        stdErrSink_->notifyReceived(move(result.stdErr));
    }
    finish(outcomeOf(result));
}

UnitOutcome
DelegatedUnit::
outcomeOf(const BackendResult & result) const
{
    switch (result.status) {
    case BackendResult::SUCCESS:
        return UnitOutcome::returned(result.exitCode);
    case BackendResult::FAILED:
        if (result.signum > 0) {
            return UnitOutcome::signaled(result.signum);
        }
        return UnitOutcome::returned(result.exitCode);
    case BackendResult::ERROR:
        return UnitOutcome::submissionFault(result.error);
    case BackendResult::REVOKED:
        if (revokeRequested_) {
            return UnitOutcome::signaled(result.signum > 0
                                         ? result.signum : SIGKILL);
        }
        return UnitOutcome::fault("task " + taskId_
                                  + " was revoked by the backend");
    default:
        return UnitOutcome::fault("unknown task status "
                                  + std::to_string(int(result.status)));
    }
}

void
DelegatedUnit::
finish(const UnitOutcome & outcome)
{
    finished_ = true;
    if (poller_) {
        loop_.removeSource(poller_.get());
        poller_.reset();
    }

    stdOutSink_->notifyClosed();
    stdErrSink_->notifyClosed();

    auto onFinished = move(onFinished_);
    onFinished_ = nullptr;
    onFinished(outcome);
}

bool
DelegatedUnit::
terminate(bool graceful)
{
    if (!started_ || finished_)
        return false;

    revokeRequested_ = true;
    try {
        backend_->revoke(taskId_, !graceful);
    }
    catch (const std::exception & exc) {
        LOG(errors) << "revoking task " << taskId_ << ": " << exc.what()
                    << endl;
        return false;
    }
    scheduleCheck();

    return true;
}

bool
DelegatedUnit::
alive() const
{
    return started_ && !finished_;
}


/*****************************************************************************/
/* DELEGATED UNIT FACTORY                                                    */
/*****************************************************************************/

DelegatedUnitFactory::
DelegatedUnitFactory(const std::shared_ptr<ExecutionBackend> & backend,
                     double pollInterval)
    : backend_(backend), pollInterval_(pollInterval)
{
    ExcCheck(backend_, "no backend given");
}

std::shared_ptr<ExecutionUnit>
DelegatedUnitFactory::
create(MessageLoop & loop)
{
    return make_shared<DelegatedUnit>(loop, backend_, pollInterval_);
}

} // namespace Coderun
