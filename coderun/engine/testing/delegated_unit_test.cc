#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <signal.h>

#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <string>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/exception.h"
#include "coderun/arch/timers.h"
#include "coderun/engine/delegated_unit.h"
#include "coderun/engine/local_task_queue.h"
#include "coderun/service/message_loop.h"
#include "coderun/service/sink.h"
#include "coderun/utils/testing/watchdog.h"

using namespace std;
using namespace Coderun;


/* Backend whose tasks complete when the test says so. */
struct MockBackend : public ExecutionBackend {
    MockBackend()
        : numTasks(0), failPolls(false), completeOnRevoke(true)
    {
    }

    virtual std::string submit(const std::string & code)
    {
        std::unique_lock<std::mutex> guard(lock);
        string id = "mock-" + std::to_string(++numTasks);
        codes[id] = code;
        return id;
    }

    virtual bool poll(const std::string & taskId, BackendResult & result)
    {
        std::unique_lock<std::mutex> guard(lock);
        polls[taskId]++;
        if (failPolls) {
            throw Coderun::Exception("backend unreachable");
        }
        auto it = results.find(taskId);
        if (it == results.end()) {
            return false;
        }
        result = it->second;
        results.erase(it);
        return true;
    }

    virtual void revoke(const std::string & taskId, bool force)
    {
        std::unique_lock<std::mutex> guard(lock);
        revokes.push_back(make_pair(taskId, force));
        if (completeOnRevoke) {
            BackendResult result;
            result.status = BackendResult::REVOKED;
            result.signum = force ? SIGKILL : SIGINT;
            results[taskId] = result;
        }
    }

    void complete(const std::string & taskId, const BackendResult & result)
    {
        std::unique_lock<std::mutex> guard(lock);
        results[taskId] = result;
    }

    int numPolls(const std::string & taskId)
    {
        std::unique_lock<std::mutex> guard(lock);
        return polls[taskId];
    }

    std::mutex lock;
    int numTasks;
    bool failPolls;
    bool completeOnRevoke;
    map<string, string> codes;
    map<string, BackendResult> results;
    map<string, int> polls;
    vector<pair<string, bool> > revokes;
};

/* Runs a delegated unit on a loop and records how it ends. */
struct UnitFixture {
    UnitFixture(const std::shared_ptr<ExecutionBackend> & backend)
        : outClosed(false), finished(false)
    {
        loop.start();
        unit = make_shared<DelegatedUnit>(loop, backend, 0.02);
    }

    ~UnitFixture()
    {
        inLoop([&] () { unit.reset(); });
        loop.shutdown();
    }

    void inLoop(const std::function<void ()> & fn)
    {
        std::promise<void> done;
        loop.runInMessageLoopThread([&] () { fn(); done.set_value(); });
        done.get_future().wait();
    }

    void start(const std::string & code)
    {
        auto onOut = [&] (string && data) {
            std::unique_lock<std::mutex> guard(lock);
            out += data;
        };
        auto onOutClosed = [&] () {
            std::unique_lock<std::mutex> guard(lock);
            outClosed = true;
        };
        auto onErr = [&] (string && data) {
            std::unique_lock<std::mutex> guard(lock);
            err += data;
        };
        auto onFinished = [&] (const UnitOutcome & result) {
            std::unique_lock<std::mutex> guard(lock);
            outcome = result;
            finished = true;
            changed.notify_all();
        };
        inLoop([&] () {
            unit->start(code,
                        make_shared<CallbackInputSink>(onOut, onOutClosed),
                        make_shared<CallbackInputSink>(onErr),
                        onFinished);
        });
    }

    UnitOutcome waitFinished(double secondsToWait = 5.0)
    {
        std::unique_lock<std::mutex> guard(lock);
        auto duration = std::chrono::duration<double>(secondsToWait);
        if (!changed.wait_for(guard, duration, [&] () { return finished; })) {
            throw Coderun::Exception("unit did not finish");
        }
        return outcome;
    }

    MessageLoop loop;
    shared_ptr<DelegatedUnit> unit;

    std::mutex lock;
    std::condition_variable changed;
    string out;
    string err;
    bool outClosed;
    bool finished;
    UnitOutcome outcome;
};

BOOST_AUTO_TEST_CASE( test_delegated_unit_polls_until_ready )
{
    Watchdog wd(30);
    auto backend = make_shared<MockBackend>();
    UnitFixture fixture(backend);

    fixture.start("some code");
    string taskId = fixture.unit->taskId();
    BOOST_CHECK_EQUAL(taskId, "mock-1");
    BOOST_CHECK_EQUAL(backend->codes[taskId], "some code");

    Coderun::sleep(0.2);
    BOOST_CHECK(backend->numPolls(taskId) >= 2);
    BOOST_CHECK(!fixture.finished);

    BackendResult result;
    result.status = BackendResult::SUCCESS;
    result.exitCode = 0;
    result.stdOut = "a\nb\n";
    result.stdErr = "warning\n";
    backend->complete(taskId, result);

    UnitOutcome outcome = fixture.waitFinished();
    BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::RETURNED);
    BOOST_CHECK(outcome.success());
    BOOST_CHECK_EQUAL(fixture.out, "a\nb\n");
    BOOST_CHECK_EQUAL(fixture.err, "warning\n");
    BOOST_CHECK(fixture.outClosed);

    /* polling stops once the task is done */
    int polls = backend->numPolls(taskId);
    Coderun::sleep(0.1);
    BOOST_CHECK_EQUAL(backend->numPolls(taskId), polls);
}

BOOST_AUTO_TEST_CASE( test_delegated_unit_outcomes )
{
    Watchdog wd(30);
    auto backend = make_shared<MockBackend>();

    {
        UnitFixture fixture(backend);
        fixture.start("fails");
        BackendResult result;
        result.status = BackendResult::FAILED;
        result.signum = SIGSEGV;
        backend->complete(fixture.unit->taskId(), result);
        UnitOutcome outcome = fixture.waitFinished();
        BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::SIGNALED);
        BOOST_CHECK_EQUAL(outcome.signum, SIGSEGV);
    }

    {
        UnitFixture fixture(backend);
        fixture.start("rejected");
        BackendResult result;
        result.status = BackendResult::ERROR;
        result.error = "SyntaxError: invalid syntax";
        backend->complete(fixture.unit->taskId(), result);
        UnitOutcome outcome = fixture.waitFinished();
        BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::SUBMISSION_FAULT);
        BOOST_CHECK_EQUAL(outcome.detail, "SyntaxError: invalid syntax");
    }

    {
        UnitFixture fixture(backend);
        fixture.start("revoked elsewhere");
        BackendResult result;
        result.status = BackendResult::REVOKED;
        backend->complete(fixture.unit->taskId(), result);
        UnitOutcome outcome = fixture.waitFinished();
        BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::FAULT);
    }
}

BOOST_AUTO_TEST_CASE( test_delegated_unit_terminate_revokes )
{
    Watchdog wd(30);
    auto backend = make_shared<MockBackend>();
    UnitFixture fixture(backend);

    fixture.start("while True: pass");
    bool delivered(false);
    fixture.inLoop([&] () { delivered = fixture.unit->terminate(true); });
    BOOST_CHECK(delivered);

    UnitOutcome outcome = fixture.waitFinished();
    BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::SIGNALED);
    BOOST_CHECK_EQUAL(outcome.signum, SIGINT);

    BOOST_REQUIRE_EQUAL(backend->revokes.size(), 1u);
    BOOST_CHECK_EQUAL(backend->revokes[0].first, fixture.unit->taskId());
    BOOST_CHECK_EQUAL(backend->revokes[0].second, false);

    /* nothing left to terminate */
    fixture.inLoop([&] () { delivered = fixture.unit->terminate(false); });
    BOOST_CHECK(!delivered);
}

BOOST_AUTO_TEST_CASE( test_delegated_unit_backend_failure )
{
    Watchdog wd(30);
    auto backend = make_shared<MockBackend>();
    backend->failPolls = true;
    UnitFixture fixture(backend);

    fixture.start("print(1)");
    UnitOutcome outcome = fixture.waitFinished();
    BOOST_CHECK_EQUAL(outcome.state, UnitOutcome::FAULT);
    BOOST_CHECK_EQUAL(outcome.detail, "backend unreachable");
    BOOST_CHECK(fixture.outClosed);
}


/*****************************************************************************/
/* LOCAL TASK QUEUE                                                          */
/*****************************************************************************/

SubprocessConfig shellConfig()
{
    SubprocessConfig config;
    config.interpreter = { "/bin/sh" };
    config.syntaxCheck = { "/bin/sh", "-n" };
    config.fileSuffix = ".sh";
    return config;
}

BackendResult waitResult(ExecutionBackend & backend, const string & taskId)
{
    BackendResult result;
    for (int i = 0;  i < 500;  ++i) {
        if (backend.poll(taskId, result)) {
            return result;
        }
        Coderun::sleep(0.02);
    }
    throw Coderun::Exception("task " + taskId + " did not complete");
}

BOOST_AUTO_TEST_CASE( test_local_task_queue_results )
{
    Watchdog wd(30);
    LocalTaskQueue queue(shellConfig(), 2);

    string ok = queue.submit("echo hello\necho oops >&2\n");
    string failed = queue.submit("exit 2");
    string invalid = queue.submit("if then fi");
    BOOST_CHECK(ok != failed);

    BackendResult result = waitResult(queue, ok);
    BOOST_CHECK_EQUAL(result.status, BackendResult::SUCCESS);
    BOOST_CHECK_EQUAL(result.exitCode, 0);
    BOOST_CHECK_EQUAL(result.stdOut, "hello\n");
    BOOST_CHECK_EQUAL(result.stdErr, "oops\n");

    result = waitResult(queue, failed);
    BOOST_CHECK_EQUAL(result.status, BackendResult::FAILED);
    BOOST_CHECK_EQUAL(result.exitCode, 2);

    result = waitResult(queue, invalid);
    BOOST_CHECK_EQUAL(result.status, BackendResult::ERROR);
    BOOST_CHECK(!result.error.empty());

    /* results are only returned once */
    BOOST_CHECK_THROW(queue.poll(ok, result), Coderun::Exception);
}

BOOST_AUTO_TEST_CASE( test_local_task_queue_revoke )
{
    Watchdog wd(30);
    LocalTaskQueue queue(shellConfig(), 1);

    string running = queue.submit("trap '' INT\nwhile true; do sleep 0.1; done");
    string queued = queue.submit("echo never");

    Coderun::sleep(0.3);
    BOOST_CHECK_EQUAL(queue.numQueued(), 1);

    queue.revoke(queued, false);
    BackendResult result;
    BOOST_REQUIRE(queue.poll(queued, result));
    BOOST_CHECK_EQUAL(result.status, BackendResult::REVOKED);
    BOOST_CHECK(result.stdOut.empty());

    /* SIGINT is ignored by the task, SIGKILL is not */
    queue.revoke(running, false);
    Coderun::sleep(0.3);
    BOOST_CHECK(!queue.poll(running, result));

    Timer timer;
    queue.revoke(running, true);
    result = waitResult(queue, running);
    BOOST_CHECK_EQUAL(result.status, BackendResult::REVOKED);
    BOOST_CHECK_EQUAL(result.signum, SIGKILL);
    BOOST_CHECK(timer.elapsed_wall() < 5.0);

    /* revoking finished or unknown tasks is harmless */
    queue.revoke(running, true);
    queue.revoke("task-unknown", true);
}

BOOST_AUTO_TEST_CASE( test_local_task_queue_notification )
{
    Watchdog wd(30);
    LocalTaskQueue queue(shellConfig(), 1);

    std::promise<void> ready;
    string id = queue.submit("echo notified");
    BOOST_CHECK(queue.notifyWhenReady(id, [&] () { ready.set_value(); }));
    BOOST_CHECK(ready.get_future().wait_for(std::chrono::seconds(10))
                == std::future_status::ready);

    BackendResult result;
    BOOST_REQUIRE(queue.poll(id, result));
    BOOST_CHECK_EQUAL(result.stdOut, "notified\n");

    BOOST_CHECK_THROW(queue.notifyWhenReady("task-unknown", [] () {}),
                      Coderun::Exception);
}

BOOST_AUTO_TEST_CASE( test_local_task_queue_shutdown )
{
    Watchdog wd(30);
    LocalTaskQueue queue(shellConfig(), 1);

    string running = queue.submit("while true; do sleep 0.1; done");
    string queued = queue.submit("echo never");
    Coderun::sleep(0.2);

    Timer timer;
    queue.shutdown();
    BOOST_CHECK(timer.elapsed_wall() < 5.0);

    BackendResult result;
    BOOST_REQUIRE(queue.poll(queued, result));
    BOOST_CHECK_EQUAL(result.status, BackendResult::REVOKED);
    BOOST_REQUIRE(queue.poll(running, result));
    BOOST_CHECK_EQUAL(result.status, BackendResult::REVOKED);

    BOOST_CHECK_THROW(queue.submit("echo late"), Coderun::Exception);
}
