/* local_task_queue.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <signal.h>

#include <future>

#include "coderun/arch/exception.h"
#include "coderun/service/logs.h"
#include "coderun/service/message_loop.h"
#include "coderun/service/runner.h"
#include "coderun/utils/exc_check.h"
#include "coderun/utils/file_functions.h"

#include "local_task_queue.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("Local Task Queue");
Logging::Category errors("Local Task Queue Error", logs);
Logging::Category trace("Local Task Queue Trace", logs, false);

/* Per stream and per task. */
const size_t maxBufferedOutput = 1024 * 1024;

} // file scope


namespace Coderun {

/*****************************************************************************/
/* LOCAL TASK QUEUE                                                          */
/*****************************************************************************/

LocalTaskQueue::
LocalTaskQueue(const SubprocessConfig & config, int numWorkers)
    : config_(config), lastTaskNum_(0), shutdown_(false)
{
    ExcCheck(!config_.interpreter.empty(), "no interpreter configured");
    ExcCheckGreater(numWorkers, 0, "invalid number of workers");

    for (int i = 0;  i < numWorkers;  ++i) {
        workers_.create_thread([this] () { runWorkerThread(); });
    }
}

LocalTaskQueue::
~LocalTaskQueue()
{
    shutdown();
}

void
LocalTaskQueue::
shutdown()
{
    vector<shared_ptr<Task> > revoked;
    {
        Guard guard(lock_);
        shutdown_ = true;

        for (auto & task: queue_) {
            task->revoked = true;
            revoked.push_back(task);
        }
        queue_.clear();

        for (auto & entry: tasks_) {
            Task & task = *entry.second;
            if (task.running) {
                task.revoked = true;
                task.revokeSignal = SIGKILL;
                if (task.runner) {
                    task.runner->signal(SIGKILL, false);
                }
            }
        }
    }
    queueChanged_.notify_all();

    for (auto & task: revoked) {
        BackendResult result;
        result.status = BackendResult::REVOKED;
        complete(*task, move(result));
    }

    workers_.join_all();
}

std::string
LocalTaskQueue::
submit(const std::string & code)
{
    Guard guard(lock_);
    if (shutdown_) {
        throw Coderun::Exception("task queue is shut down");
    }

    string taskId = "task-" + std::to_string(++lastTaskNum_);
    auto task = make_shared<Task>(taskId, code);
    tasks_[taskId] = task;
    queue_.push_back(task);
    guard.unlock();

    queueChanged_.notify_one();

    LOG(trace) << "queued " << taskId << endl;

    return taskId;
}

bool
LocalTaskQueue::
poll(const std::string & taskId, BackendResult & result)
{
    Guard guard(lock_);

    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        throw Coderun::Exception("unknown task " + taskId);
    }
    if (!it->second->done) {
        return false;
    }

    result = move(it->second->result);
    tasks_.erase(it);

    return true;
}

void
LocalTaskQueue::
revoke(const std::string & taskId, bool force)
{
    shared_ptr<Task> task;
    {
        Guard guard(lock_);

        auto it = tasks_.find(taskId);
        if (it == tasks_.end() || it->second->done
            || (it->second->revoked && !force)) {
            return;
        }
        task = it->second;
        task->revoked = true;
        task->revokeSignal = force ? SIGKILL : SIGINT;

        if (task->running) {
            if (task->runner) {
                task->runner->signal(task->revokeSignal, false);
            }
            return;
        }

        for (auto qit = queue_.begin();  qit != queue_.end();  ++qit) {
            if (*qit == task) {
                queue_.erase(qit);
                break;
            }
        }
    }

    LOG(trace) << "revoked queued " << taskId << endl;

    BackendResult result;
    result.status = BackendResult::REVOKED;
    complete(*task, move(result));
}

bool
LocalTaskQueue::
notifyWhenReady(const std::string & taskId, const OnReady & onReady)
{
    Guard guard(lock_);

    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        throw Coderun::Exception("unknown task " + taskId);
    }
    if (it->second->done) {
        guard.unlock();
        onReady();
    }
    else {
        it->second->onReady = onReady;
    }

    return true;
}

size_t
LocalTaskQueue::
numQueued() const
{
    Guard guard(lock_);
    return queue_.size();
}

std::shared_ptr<LocalTaskQueue::Task>
LocalTaskQueue::
nextTask()
{
    Guard guard(lock_);
    while (queue_.empty() && !shutdown_) {
        queueChanged_.wait(guard);
    }
    if (queue_.empty()) {
        return nullptr;
    }

    auto task = queue_.front();
    queue_.pop_front();
    task->running = true;

    return task;
}

void
LocalTaskQueue::
runWorkerThread()
{
    /* Each worker drives its runners from a loop of its own, so that a
       revocation can reach a program while the worker waits for it. */
    MessageLoop loop;
    loop.start();

    while (auto task = nextTask()) {
        runTask(*task, loop);
    }

    loop.shutdown();
}

void
LocalTaskQueue::
runTask(Task & task, MessageLoop & loop)
{
    LOG(trace) << "running " << task.id << endl;

    BackendResult result;
    int signum(0);

    try {
        TempFile codeFile(task.code, config_.fileSuffix);

        bool checked(true);
        if (!config_.syntaxCheck.empty()) {
            vector<string> command = config_.syntaxCheck;
            command.push_back(codeFile.path());

            string checkOut, checkErr;
            RunResult checkResult = runPhase(task, loop, command,
                                             checkOut, checkErr);
            if (checkResult.state == RunResult::SIGNALED) {
                signum = checkResult.signum;
            }
            UnitOutcome outcome = syntaxCheckOutcome(checkResult, checkErr);
            if (!outcome.success()) {
                checked = false;
                result.status = BackendResult::ERROR;
                result.error = outcome.detail;
            }
        }

        if (checked) {
            vector<string> command = config_.interpreter;
            command.push_back(codeFile.path());

            RunResult runResult = runPhase(task, loop, command,
                                           result.stdOut, result.stdErr);
            UnitOutcome outcome = UnitOutcome::fromRunResult(
                runResult, config_.interpreter[0]);
            switch (outcome.state) {
            case UnitOutcome::RETURNED:
                result.status = (outcome.returnCode == 0
                                 ? BackendResult::SUCCESS
                                 : BackendResult::FAILED);
                result.exitCode = outcome.returnCode;
                break;
            case UnitOutcome::SIGNALED:
                result.status = BackendResult::FAILED;
                result.signum = signum = outcome.signum;
                break;
            default:
                result.status = BackendResult::ERROR;
                result.error = outcome.detail;
            }
        }
    }
    catch (const std::exception & exc) {
        LOG(errors) << "task " << task.id << " failed: " << exc.what()
                    << endl;
        result.status = BackendResult::ERROR;
        result.error = exc.what();
    }

    {
        Guard guard(lock_);
        if (task.revoked) {
            result.status = BackendResult::REVOKED;
            result.signum = signum ? signum : task.revokeSignal;
        }
    }

    complete(task, move(result));
}

RunResult
LocalTaskQueue::
runPhase(Task & task, MessageLoop & loop,
         const std::vector<std::string> & command,
         std::string & stdOut, std::string & stdErr)
{
    auto runner = make_shared<Runner>();
    if (!loop.addSource("task " + task.id, runner)) {
        throw Coderun::Exception("could not add the runner to the loop");
    }

    {
        Guard guard(lock_);
        if (task.revoked) {
            guard.unlock();
            loop.removeSourceSync(runner.get());
            RunResult result;
            result.state = RunResult::SIGNALED;
            result.signum = task.revokeSignal;
            return result;
        }
        task.runner = runner;
    }

    auto outSink = make_shared<StringInputSink>(maxBufferedOutput);
    auto errSink = make_shared<StringInputSink>(maxBufferedOutput);

    std::promise<RunResult> terminated;
    auto onTerminate = [&] (const RunResult & result) {
        terminated.set_value(result);
    };
    runner->run(command, onTerminate, outSink, errSink);

    /* A revocation arriving before the program was started could not be
       delivered. */
    if (runner->waitStart()) {
        Guard guard(lock_);
        if (task.revoked) {
            runner->signal(task.revokeSignal, false);
        }
    }

    RunResult result = terminated.get_future().get();

    /* the sinks are closed before onTerminate is invoked */
    if (outSink->truncated() || errSink->truncated()) {
        LOG(logs) << "output of " << task.id << " truncated to "
                  << maxBufferedOutput << " bytes per stream" << endl;
    }
    stdOut = outSink->release();
    stdErr = errSink->release();

    {
        Guard guard(lock_);
        task.runner.reset();
    }
    loop.removeSourceSync(runner.get());

    return result;
}

void
LocalTaskQueue::
complete(Task & task, BackendResult && result)
{
    OnReady onReady;
    {
        Guard guard(lock_);
        LOG(trace) << "completed " << task.id << ": " << result.status
                   << endl;
        task.result = move(result);
        task.running = false;
        task.done = true;
        onReady = move(task.onReady);
        task.onReady = nullptr;
    }

    if (onReady) {
        onReady();
    }
}

} // namespace Coderun
