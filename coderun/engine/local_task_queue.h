/* local_task_queue.h                                              -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Execution backend running the submitted code on a pool of local worker
   threads.
*/

#pragma once

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/thread/thread.hpp>

#include "execution_backend.h"
#include "subprocess_unit.h"


namespace Coderun {

struct MessageLoop;
struct Runner;
struct RunResult;


/*****************************************************************************/
/* LOCAL TASK QUEUE                                                          */
/*****************************************************************************/

/** Task queue with "numWorkers" threads, each running one submission at a
    time through the configured interpreter, after the syntax check when
    one is configured.  The output of a task is buffered, up to 1 MiB per
    stream, and returned with its result.

    Revoking a queued task completes it immediately.  Revoking a running
    task sends SIGINT, or SIGKILL when forced, to the process group of the
    program being run.
*/

struct LocalTaskQueue : public ExecutionBackend {

    LocalTaskQueue(const SubprocessConfig & config, int numWorkers = 2);
    ~LocalTaskQueue();

    virtual std::string submit(const std::string & code);
    virtual bool poll(const std::string & taskId, BackendResult & result);
    virtual void revoke(const std::string & taskId, bool force);
    virtual bool notifyWhenReady(const std::string & taskId,
                                 const OnReady & onReady);

    /** Revoke every task and wait for the workers to exit.  Tasks submitted
        afterwards are rejected. */
    void shutdown();

    /** Number of tasks waiting for a worker. */
    size_t numQueued() const;

private:
    struct Task {
        Task(const std::string & id, const std::string & code)
            : id(id), code(code), running(false), done(false),
              revoked(false), revokeSignal(0)
        {
        }

        std::string id;
        std::string code;

        bool running;
        bool done;
        bool revoked;
        int revokeSignal;

        std::shared_ptr<Runner> runner;
        BackendResult result;
        OnReady onReady;
    };

    typedef std::mutex Mutex;
    typedef std::unique_lock<Mutex> Guard;

    void runWorkerThread();
    std::shared_ptr<Task> nextTask();
    void runTask(Task & task, MessageLoop & loop);
    RunResult runPhase(Task & task, MessageLoop & loop,
                       const std::vector<std::string> & command,
                       std::string & stdOut, std::string & stdErr);
    void complete(Task & task, BackendResult && result);

    SubprocessConfig config_;

    mutable Mutex lock_;
    std::condition_variable queueChanged_;
    std::deque<std::shared_ptr<Task> > queue_;
    std::map<std::string, std::shared_ptr<Task> > tasks_;
    uint64_t lastTaskNum_;
    bool shutdown_;

    boost::thread_group workers_;
};

} // namespace Coderun
