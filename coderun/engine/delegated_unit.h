/* delegated_unit.h                                                -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Execution unit handing the code over to an ExecutionBackend.
*/

#pragma once

#include <memory>
#include <string>

#include "coderun/service/async_event_source.h"

#include "execution_backend.h"
#include "execution_unit.h"


namespace Coderun {

/*****************************************************************************/
/* DELEGATED UNIT                                                            */
/*****************************************************************************/

/** Submits the code to a backend and waits for the task to complete, being
    notified by the backend when it can, polling it at "pollInterval"
    otherwise.  The output of the task is only known when it completes and
    is then delivered to the sinks in one go.

    Termination revokes the task and checks it right away, without waiting
    for the next poll.
*/

struct DelegatedUnit
    : public ExecutionUnit,
      public std::enable_shared_from_this<DelegatedUnit> {

    DelegatedUnit(MessageLoop & loop,
                  const std::shared_ptr<ExecutionBackend> & backend,
                  double pollInterval = 0.1);
    ~DelegatedUnit();

    virtual void start(const std::string & code,
                       const std::shared_ptr<InputSink> & stdOutSink,
                       const std::shared_ptr<InputSink> & stdErrSink,
                       const OnFinished & onFinished);

    virtual bool terminate(bool graceful);

    virtual bool alive() const;

    /** Identifier of the backend task, empty before "start". */
    const std::string & taskId() const { return taskId_; }

private:
    void scheduleCheck();
    void check();
    void finish(const UnitOutcome & outcome);
    UnitOutcome outcomeOf(const BackendResult & result) const;

    MessageLoop & loop_;
    std::shared_ptr<ExecutionBackend> backend_;
    double pollInterval_;

    bool started_;
    bool finished_;
    bool revokeRequested_;

    std::string taskId_;
    std::shared_ptr<PeriodicEventSource> poller_;

    std::shared_ptr<InputSink> stdOutSink_;
    std::shared_ptr<InputSink> stdErrSink_;
    OnFinished onFinished_;
};


/*****************************************************************************/
/* DELEGATED UNIT FACTORY                                                    */
/*****************************************************************************/

struct DelegatedUnitFactory : public ExecutionUnitFactory {
    DelegatedUnitFactory(const std::shared_ptr<ExecutionBackend> & backend,
                         double pollInterval = 0.1);

    virtual std::shared_ptr<ExecutionUnit> create(MessageLoop & loop);

private:
    std::shared_ptr<ExecutionBackend> backend_;
    double pollInterval_;
};

} // namespace Coderun
