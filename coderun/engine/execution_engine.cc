/* execution_engine.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <future>

#include "coderun/arch/exception.h"
#include "coderun/arch/format.h"
#include "coderun/service/logs.h"
#include "coderun/utils/exc_check.h"

#include "delegated_unit.h"
#include "execution_engine.h"
#include "local_task_queue.h"
#include "output_relay.h"
#include "subprocess_unit.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("Execution Engine");
Logging::Category warnings("Execution Engine Warning", logs);
Logging::Category errors("Execution Engine Error", logs);
Logging::Category trace("Execution Engine Trace", logs, false);

std::atomic<unsigned long long> executionCounter(0);

} // file scope


namespace Coderun {

/*****************************************************************************/
/* EXECUTION                                                                 */
/*****************************************************************************/

ExecutionEngine::Execution::
Execution(ExecutionEngine * engine, const std::string & id,
          const std::string & code, const OnEvent & onEvent)
    : engine(engine), id(id), code(code), onEvent(onEvent),
      startDate(Date::now()), state(PENDING), cause(NONE)
{
}

void
ExecutionEngine::Execution::
cancel()
{
    auto self = shared_from_this();
    ExecutionEngine * owner = engine;
    owner->loop_.runInMessageLoopThread([owner, self] () {
        owner->beginTermination(self, STOP_REQUEST);
    });
}


/*****************************************************************************/
/* EXECUTION ENGINE                                                          */
/*****************************************************************************/

ExecutionEngine::
ExecutionEngine(const EngineConfig & config)
    : ExecutionEngine(makeFactory(config), config)
{
}

ExecutionEngine::
ExecutionEngine(const std::shared_ptr<ExecutionUnitFactory> & factory,
                const EngineConfig & config)
    : config_(config), factory_(factory), shutdown_(false)
{
    config_.validate();
    ExcCheck(factory_, "no execution unit factory");

    loop_.start();
}

ExecutionEngine::
~ExecutionEngine()
{
    shutdown();
}

std::shared_ptr<ExecutionUnitFactory>
ExecutionEngine::
makeFactory(const EngineConfig & config)
{
    config.validate();

    if (config.strategy == "subprocess") {
        return make_shared<SubprocessUnitFactory>(config.subprocessConfig());
    }
    else if (config.strategy == "delegated") {
        auto backend = make_shared<LocalTaskQueue>(config.subprocessConfig(),
                                                   config.workers);
        return make_shared<DelegatedUnitFactory>(backend,
                                                 config.pollInterval);
    }

    throw Coderun::Exception("unknown execution strategy '%s'",
                             config.strategy.c_str());
}

std::string
ExecutionEngine::
newExecutionId()
{
    unsigned long long micros = Date::now().secondsSinceEpoch() * 1000000;
    return format("%016llx-%08llx", micros, ++executionCounter);
}

std::string
ExecutionEngine::
submit(const std::string & code, const OnEvent & onEvent)
{
    ExcCheck(onEvent, "an event callback is required");
    if (shutdown_) {
        throw Coderun::Exception("the execution engine is shut down");
    }

    auto exec = make_shared<Execution>(this, newExecutionId(), code, onEvent);

    /* Registered at admission, so that a stop racing the start of the unit
       always finds the execution. */
    if (!registry_.add(exec->id, exec, exec->startDate)) {
        throw Coderun::Exception("duplicate execution id " + exec->id);
    }

    auto toRun = [this, exec] () { startExecution(exec); };
    if (!loop_.runInMessageLoopThread(toRun)) {
        registry_.remove(exec->id);
        throw Coderun::Exception("could not schedule execution " + exec->id);
    }

    LOG(trace) << "admitted execution " << exec->id << endl;

    return exec->id;
}

void
ExecutionEngine::
startExecution(const std::shared_ptr<Execution> & exec)
{
    executions_[exec->id] = exec;

    deliver(*exec, ExecutionEvent(ExecutionEvent::START, exec->id,
                                  "Starting " + config_.language
                                  + " execution..."));

    weak_ptr<Execution> weakExec(exec);

    auto onLine = [weakExec] (ExecutionEvent::Kind kind, string && line) {
        if (auto exec = weakExec.lock()) {
            exec->onEvent(ExecutionEvent(kind, exec->id, line));
        }
    };
    auto onFault = [this, weakExec] (const string & stream,
                                     const string & detail) {
        if (auto exec = weakExec.lock()) {
            relayFault(exec, stream, detail);
        }
    };

    exec->stdOut = make_shared<OutputRelay>(
        [onLine] (string && line) {
            onLine(ExecutionEvent::STDOUT, move(line));
        },
        [onFault] (const string & detail) { onFault("stdout", detail); });
    exec->stdErr = make_shared<OutputRelay>(
        [onLine] (string && line) {
            onLine(ExecutionEvent::STDERR, move(line));
        },
        [onFault] (const string & detail) { onFault("stderr", detail); });

    auto onDeadline = [this, weakExec] (uint64_t) {
        if (auto exec = weakExec.lock()) {
            beginTermination(exec, DEADLINE);
        }
    };
    auto onFinished = [this, weakExec] (const UnitOutcome & outcome) {
        if (auto exec = weakExec.lock()) {
            finish(exec, outcome);
        }
    };

    try {
        exec->unit = factory_->create(loop_);
        exec->state = Execution::RUNNING;
        exec->deadline = loop_.addPeriodic("deadline " + exec->id,
                                           config_.executionTimeout,
                                           onDeadline);
        exec->unit->start(exec->code, exec->stdOut, exec->stdErr,
                          onFinished);
    }
    catch (const std::exception & exc) {
        LOG(errors) << "could not start execution " << exec->id << ": "
                    << exc.what() << endl;
        finish(exec, UnitOutcome::fault(exc.what()));
    }
}

void
ExecutionEngine::
beginTermination(const std::shared_ptr<Execution> & exec, Cause cause)
{
    if (exec->state != Execution::RUNNING)
        return;

    exec->state = Execution::TERMINATING;
    exec->cause = cause;

    if (cause == DEADLINE) {
        LOG(logs) << "execution " << exec->id << " timed out after "
                  << config_.executionTimeout << "s" << endl;
    }
    else {
        LOG(trace) << "terminating execution " << exec->id << endl;
    }

    /* No output is relayed once termination has begun. */
    exec->stdOut->seal();
    exec->stdErr->seal();
    removeTimer(exec->deadline);

    if (!exec->unit->terminate(true)) {
        LOG(trace) << "graceful termination of " << exec->id
                   << " not delivered" << endl;
    }

    weak_ptr<Execution> weakExec(exec);
    auto onGraceExpired = [this, weakExec] (uint64_t) {
        if (auto exec = weakExec.lock()) {
            forceTermination(exec);
        }
    };
    exec->grace = loop_.addPeriodic("grace " + exec->id,
                                    config_.terminationGrace,
                                    onGraceExpired);
}

void
ExecutionEngine::
forceTermination(const std::shared_ptr<Execution> & exec)
{
    if (exec->state != Execution::TERMINATING || !exec->unit->alive())
        return;

    LOG(trace) << "killing execution " << exec->id << endl;
    exec->unit->terminate(false);
}

void
ExecutionEngine::
relayFault(const std::shared_ptr<Execution> & exec,
           const std::string & stream, const std::string & detail)
{
    LOG(errors) << "error relaying " << stream << " of " << exec->id
                << ": " << detail << endl;

    if (exec->state != Execution::RUNNING)
        return;

    exec->faultStream = stream;
    exec->faultDetail = detail;
    beginTermination(exec, RELAY_FAULT);
}

void
ExecutionEngine::
finish(const std::shared_ptr<Execution> & exec, const UnitOutcome & outcome)
{
    if (exec->state == Execution::DONE)
        return;
    exec->state = Execution::DONE;

    removeTimer(exec->deadline);
    removeTimer(exec->grace);
    if (exec->stdOut) {
        exec->stdOut->seal();
    }
    if (exec->stdErr) {
        exec->stdErr->seal();
    }

    bool stopClaimed(false);
    registry_.remove(exec->id, &stopClaimed);

    ExecutionEvent event = terminalEvent(*exec, outcome, stopClaimed);
    if (outcome.state == UnitOutcome::FAULT && exec->cause == NONE) {
        LOG(errors) << "execution " << exec->id << " failed: "
                    << outcome.detail << endl;
    }
    LOG(trace) << "execution " << exec->id << " finished with "
               << event.kind << ": " << outcome << endl;

    deliver(*exec, event);

    executions_.erase(exec->id);

    /* The unit may be the caller of this function: it is released once the
       current callback has returned. */
    auto unit = move(exec->unit);
    if (unit) {
        loop_.runInMessageLoopThread([unit] () {});
    }
}

ExecutionEvent
ExecutionEngine::
terminalEvent(const Execution & exec, const UnitOutcome & outcome,
              bool stopClaimed) const
{
    if (exec.cause == DEADLINE) {
        return ExecutionEvent(
            ExecutionEvent::TIMEOUT, exec.id,
            format("Execution timed out after %g seconds."
                   " Did you check for infinite loops?",
                   config_.executionTimeout));
    }
    if (exec.cause == STOP_REQUEST || stopClaimed) {
        double elapsed = Date::now().secondsSince(exec.startDate);
        return ExecutionEvent(
            ExecutionEvent::TIMEOUT, exec.id,
            format("Execution stopped by request after %.1f seconds.",
                   elapsed));
    }
    if (exec.cause == RELAY_FAULT) {
        return ExecutionEvent(
            ExecutionEvent::ERROR, exec.id,
            "Error occurred while streaming " + exec.faultStream
            + " output: " + exec.faultDetail + ". Please try again.");
    }

    if (outcome.state == UnitOutcome::SUBMISSION_FAULT
        || outcome.state == UnitOutcome::FAULT) {
        return ExecutionEvent(
            ExecutionEvent::ERROR, exec.id,
            "Execution error occurred: " + outcome.detail
            + ". Please check your code syntax and try again.");
    }

    string message
        = "Execution completed with exit code: "
        + std::to_string(outcome.exitCode());
    if (outcome.state == UnitOutcome::SIGNALED) {
        message += " (terminated by signal "
            + std::to_string(outcome.signum) + ")";
    }
    message += outcome.success()
        ? ". Success!"
        : ". Code completed but may have encountered errors.";

    ExecutionEvent result(ExecutionEvent::COMPLETE, exec.id, message);
    result.exitCode = outcome.exitCode();
    result.success = outcome.success();
    return result;
}

void
ExecutionEngine::
deliver(Execution & exec, const ExecutionEvent & event)
{
    try {
        exec.onEvent(event);
    }
    catch (const std::exception & exc) {
        LOG(errors) << "delivering " << event.kind << " of " << exec.id
                    << ": " << exc.what() << endl;
    }
}

void
ExecutionEngine::
removeTimer(std::shared_ptr<AsyncEventSource> & timer)
{
    if (timer) {
        loop_.removeSource(timer.get());
        timer.reset();
    }
}

bool
ExecutionEngine::
stop(const std::string & executionId)
{
    auto exec = registry_.claimStop(executionId);
    if (!exec) {
        return false;
    }

    LOG(trace) << "stop requested for " << executionId << endl;
    exec->cancel();

    return true;
}

std::set<std::string>
ExecutionEngine::
listActive() const
{
    return registry_.ids();
}

bool
ExecutionEngine::
isActive(const std::string & executionId) const
{
    return registry_.contains(executionId);
}

bool
ExecutionEngine::
waitUntilIdle(double secondsToWait) const
{
    return registry_.waitEmpty(secondsToWait);
}

void
ExecutionEngine::
shutdown()
{
    ExcCheck(!loop_.inMessageLoopThread(),
             "the engine can't be shut down from its own thread");

    if (shutdown_.exchange(true))
        return;

    for (const auto & id: registry_.ids()) {
        stop(id);
    }

    /* Every execution ends within a few grace periods once killed. */
    double limit = config_.terminationGrace * 10 + 5;
    if (!registry_.waitEmpty(limit)) {
        LOG(errors) << registry_.size() << " executions still active after "
                    << limit << "s, dropping them" << endl;
    }

    /* Release the units from the loop thread, after the actions already
       queued. */
    std::promise<void> drained;
    auto drain = [&] () {
        executions_.clear();
        drained.set_value();
    };
    if (loop_.runInMessageLoopThread(drain)) {
        drained.get_future().wait();
    }

    loop_.shutdown();
}

} // namespace Coderun
