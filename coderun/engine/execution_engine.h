/* execution_engine.h                                              -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Runs code submissions with a deadline, streaming their output as events.
*/

#pragma once

#include <math.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "coderun/service/message_loop.h"
#include "coderun/types/date.h"

#include "engine_config.h"
#include "execution_event.h"
#include "execution_registry.h"
#include "execution_unit.h"


namespace Coderun {

struct OutputRelay;


/*****************************************************************************/
/* EXECUTION ENGINE                                                          */
/*****************************************************************************/

/** Runs each submission in its own ExecutionUnit, relays its output line by
    line and races it against the configured timeout.

    The events of an execution are delivered in order from the engine's
    MessageLoop thread: START first, then the lines of output, then exactly
    one terminal event (COMPLETE, TIMEOUT or ERROR).  The execution is
    listed as active from the return of "submit" until just before its
    terminal event is delivered.

    Termination, whether caused by the deadline, by "stop" or by a relay
    fault, first asks the unit to stop gracefully, then kills it at every
    "terminationGrace" interval until it has finished.
*/

struct ExecutionEngine {
    typedef std::function<void (const ExecutionEvent & event)> OnEvent;

    /** Engine using the strategy named by the configuration. */
    ExecutionEngine(const EngineConfig & config = EngineConfig());

    /** Engine creating its units with the given factory. */
    ExecutionEngine(const std::shared_ptr<ExecutionUnitFactory> & factory,
                    const EngineConfig & config = EngineConfig());

    ~ExecutionEngine();

    /** Admit the code for execution and return the identifier of the new
        execution.  Every event of the execution is passed to "onEvent";
        an exception thrown by "onEvent" for a line of output is reported
        as a streaming error of the execution. */
    std::string submit(const std::string & code, const OnEvent & onEvent);

    /** Stop the given execution, which ends with a TIMEOUT event.  Returns
        false, and does nothing, for unknown, finished or already stopping
        executions.  May be called from any thread. */
    bool stop(const std::string & executionId);

    /** Snapshot of the identifiers of the active executions. */
    std::set<std::string> listActive() const;

    bool isActive(const std::string & executionId) const;

    double timeout() const { return config_.executionTimeout; }

    const EngineConfig & config() const { return config_; }

    /** Wait until no execution is active, for at most "secondsToWait".
        Returns whether the engine is idle. */
    bool waitUntilIdle(double secondsToWait = INFINITY) const;

    /** Stop every execution, wait for them to finish and stop the loop.
        New submissions are rejected afterwards.  Must not be called from
        an event callback. */
    void shutdown();

    static std::shared_ptr<ExecutionUnitFactory>
    makeFactory(const EngineConfig & config);

private:
    enum Cause {
        NONE,
        DEADLINE,
        STOP_REQUEST,
        RELAY_FAULT
    };

    struct Execution : public RegisteredExecution,
                       public std::enable_shared_from_this<Execution> {
        enum State {
            PENDING,
            RUNNING,
            TERMINATING,
            DONE
        };

        Execution(ExecutionEngine * engine, const std::string & id,
                  const std::string & code, const OnEvent & onEvent);

        virtual void cancel();

        ExecutionEngine * engine;
        std::string id;
        std::string code;
        OnEvent onEvent;
        Date startDate;

        State state;
        Cause cause;
        std::string faultStream;
        std::string faultDetail;

        std::shared_ptr<ExecutionUnit> unit;
        std::shared_ptr<OutputRelay> stdOut;
        std::shared_ptr<OutputRelay> stdErr;
        std::shared_ptr<AsyncEventSource> deadline;
        std::shared_ptr<AsyncEventSource> grace;
    };

    void startExecution(const std::shared_ptr<Execution> & exec);
    void beginTermination(const std::shared_ptr<Execution> & exec,
                          Cause cause);
    void forceTermination(const std::shared_ptr<Execution> & exec);
    void relayFault(const std::shared_ptr<Execution> & exec,
                    const std::string & stream, const std::string & detail);
    void finish(const std::shared_ptr<Execution> & exec,
                const UnitOutcome & outcome);
    ExecutionEvent terminalEvent(const Execution & exec,
                                 const UnitOutcome & outcome,
                                 bool stopClaimed) const;
    void deliver(Execution & exec, const ExecutionEvent & event);
    void removeTimer(std::shared_ptr<AsyncEventSource> & timer);

    static std::string newExecutionId();

    /* Declared first so that it is destroyed last. */
    MessageLoop loop_;

    EngineConfig config_;
    std::shared_ptr<ExecutionUnitFactory> factory_;
    ExecutionRegistry registry_;
    std::atomic<bool> shutdown_;

    /* Only accessed from the loop thread. */
    std::map<std::string, std::shared_ptr<Execution> > executions_;
};

} // namespace Coderun
