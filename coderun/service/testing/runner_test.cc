#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/exception.h"
#include "coderun/arch/timers.h"
#include "coderun/service/message_loop.h"
#include "coderun/service/runner.h"
#include "coderun/service/runner_common.h"
#include "coderun/service/sink.h"
#include "coderun/utils/testing/watchdog.h"

#include "signals.h"

using namespace std;
using namespace Coderun;


/* Whether the process exists and is not a zombie. */
bool processAlive(pid_t pid)
{
    ifstream stream("/proc/" + to_string(pid) + "/stat");
    string stat;
    if (!getline(stream, stat)) {
        return false;
    }
    size_t pos = stat.rfind(')');
    if (pos == string::npos || pos + 2 >= stat.size()) {
        return false;
    }
    char state = stat[pos + 2];
    return state != 'Z' && state != 'X';
}

struct _Init {
    _Init() {
        signal(SIGPIPE, SIG_IGN);
    }
} myInit;


/* A sink that accumulates everything it receives. */
struct StringSink : public InputSink {
    StringSink()
        : closed(false)
    {}

    virtual void notifyReceived(std::string && data)
    {
        std::unique_lock<std::mutex> guard(lock);
        received += data;
    }

    virtual void notifyClosed()
    {
        std::unique_lock<std::mutex> guard(lock);
        closed = true;
    }

    std::string str()
    {
        std::unique_lock<std::mutex> guard(lock);
        return received;
    }

    std::mutex lock;
    std::string received;
    bool closed;
};

BOOST_AUTO_TEST_CASE( test_runner_launch_error )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    MessageLoop loop;
    Runner runner;
    std::mutex runResultLock;
    RunResult runResult;
    bool isTerminated = false;

    vector<string> command = {
        "shasdasdsadas", "-c", "echo hello"
    };

    auto onTerminate = [&] (const RunResult & result) {
        std::unique_lock<std::mutex> guard(runResultLock);
        runResult = result;
        isTerminated = true;
    };

    loop.addSource("runner", runner);
    loop.start();

    runner.run(command, onTerminate);

    BOOST_REQUIRE_EQUAL(runner.waitStart(5.0), false);
    runner.waitTermination();

    BOOST_CHECK(isTerminated);
    BOOST_CHECK_EQUAL(runResult.state, RunResult::LAUNCH_ERROR);
    BOOST_CHECK_EQUAL(runResult.launchErrno, ENOENT);
    BOOST_CHECK_EQUAL(runResult.processStatus(), 127);

    loop.removeSourceSync(&runner);
}

/* ensures that the output of both streams reaches the sinks before
   onTerminate is invoked */
BOOST_AUTO_TEST_CASE( test_runner_callbacks )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    MessageLoop loop;
    Runner runner;

    auto stdOutSink = make_shared<StringSink>();
    auto stdErrSink = make_shared<StringSink>();

    RunResult runResult;
    string outAtTermination;
    bool closedAtTermination(false);
    auto onTerminate = [&] (const RunResult & result) {
        runResult = result;
        outAtTermination = stdOutSink->str();
        closedAtTermination = stdOutSink->closed && stdErrSink->closed;
    };

    loop.addSource("runner", runner);
    loop.start();

    vector<string> command = {
        "/bin/sh", "-c",
        "echo hello stdout; echo hello stdout2; echo hello stderr 1>&2;"
        " exit 3"
    };
    runner.run(command, onTerminate, stdOutSink, stdErrSink);
    runner.waitTermination();

    BOOST_CHECK_EQUAL(runResult.state, RunResult::RETURNED);
    BOOST_CHECK_EQUAL(runResult.returnCode, 3);
    BOOST_CHECK_EQUAL(runResult.processStatus(), 3);
    BOOST_CHECK_EQUAL(outAtTermination, "hello stdout\nhello stdout2\n");
    BOOST_CHECK(closedAtTermination);
    BOOST_CHECK_EQUAL(stdErrSink->str(), "hello stderr\n");
    BOOST_CHECK(!runner.running());
    BOOST_CHECK_EQUAL(runner.childPid(), -3);
    BOOST_CHECK(runner.duration() >= 0.0);

    loop.removeSourceSync(&runner);
}

/* a runner can be reused once its previous command has terminated */
BOOST_AUTO_TEST_CASE( test_runner_reuse )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    Runner runner;
    for (int i = 0; i < 3; i++) {
        auto stdOutSink = make_shared<StringSink>();
        vector<string> command = {
            "/bin/sh", "-c", "echo run " + to_string(i)
        };
        RunResult result = runner.runSync(command, stdOutSink);
        BOOST_CHECK_EQUAL(result.state, RunResult::RETURNED);
        BOOST_CHECK_EQUAL(result.returnCode, 0);
        BOOST_CHECK_EQUAL(stdOutSink->str(), "run " + to_string(i) + "\n");
    }
}

/* "run" only queues the launch on the loop thread: the waits must not
   return before that request has been processed, even when the runner
   still carries the state of a previous command */
BOOST_AUTO_TEST_CASE( test_runner_wait_for_queued_run )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    MessageLoop loop;
    Runner runner;

    loop.addSource("runner", runner);
    loop.start();

    runner.run({"/bin/sh", "-c", "exit 0"}, [] (const RunResult &) {});
    runner.waitTermination();
    BOOST_CHECK_EQUAL(runner.childPid(), -3);

    /* the loop thread is kept busy so that the next request stays queued */
    std::atomic<bool> release(false);
    auto holdLoop = [&] () {
        while (!release) {
            Coderun::sleep(0.01);
        }
    };
    BOOST_REQUIRE(loop.runInMessageLoopThread(holdLoop));

    int terminations(0);
    RunResult result;
    auto onTerminate = [&] (const RunResult & newResult) {
        result = newResult;
        terminations++;
    };
    runner.run({"/bin/sh", "-c", "exit 4"}, onTerminate);

    BOOST_CHECK(!runner.waitRunning(0.2));
    BOOST_CHECK(!runner.waitStart(0.2));
    BOOST_CHECK_EQUAL(terminations, 0);

    release = true;
    runner.waitTermination();
    BOOST_CHECK_EQUAL(terminations, 1);
    BOOST_CHECK_EQUAL(result.state, RunResult::RETURNED);
    BOOST_CHECK_EQUAL(result.returnCode, 4);

    /* a launch exception is reported before the runner stops running */
    runner.run({}, onTerminate);
    runner.waitTermination();
    BOOST_CHECK_EQUAL(terminations, 2);
    BOOST_CHECK_EQUAL(result.state, RunResult::LAUNCH_EXCEPTION);
    BOOST_CHECK(!runner.running());
    BOOST_CHECK_EQUAL(runner.childPid(), -2);

    loop.removeSourceSync(&runner);
}

BOOST_AUTO_TEST_CASE( test_helper_channels_args )
{
    HelperChannels channels;
    channels.stdOut = 5;
    channels.stdErr = 7;
    channels.status = 12;

    vector<string> args = channels.toArgs();
    BOOST_REQUIRE_EQUAL(args.size(), size_t(HelperChannels::numArgs));
    BOOST_CHECK_EQUAL(args[0], "5");
    BOOST_CHECK_EQUAL(args[2], "12");

    char * argv[] = { (char *) "5", (char *) "7", (char *) "12" };
    HelperChannels parsed = HelperChannels::fromArgs(argv);
    BOOST_CHECK_EQUAL(parsed.stdOut, 5);
    BOOST_CHECK_EQUAL(parsed.stdErr, 7);
    BOOST_CHECK_EQUAL(parsed.status, 12);

    char * badArgv[] = { (char *) "5", (char *) "7/12", (char *) "-1" };
    BOOST_CHECK_THROW(HelperChannels::fromArgs(badArgv), Coderun::Exception);
    char * negativeArgv[] = { (char *) "5", (char *) "7", (char *) "-1" };
    BOOST_CHECK_THROW(HelperChannels::fromArgs(negativeArgv),
                      Coderun::Exception);

    ProcessStatus status;
    BOOST_CHECK(!status.failed());
    status.fail(ENOENT, LaunchError::EXEC);
    BOOST_CHECK(status.failed());
    BOOST_CHECK_EQUAL(strLaunchError(status.launchErrorCode),
                      "launching the command");
}

BOOST_AUTO_TEST_CASE( test_execute )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    auto stdErrSink = make_shared<StringSink>();
    RunResult result = execute({"/bin/sh", "-c", "echo oops 1>&2; kill -9 $$"},
                               nullptr, stdErrSink);
    BOOST_CHECK_EQUAL(result.state, RunResult::SIGNALED);
    BOOST_CHECK_EQUAL(result.signum, SIGKILL);
    BOOST_CHECK_EQUAL(result.processStatus(), 128 + SIGKILL);
    BOOST_CHECK_EQUAL(stdErrSink->str(), "oops\n");
}

/* The signal must reach the whole process group: the background "sleep"
   keeps the output pipe open, so termination is only reported once it has
   died as well. */
BOOST_AUTO_TEST_CASE( test_runner_signal_process_group )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    MessageLoop loop;
    Runner runner;
    RunResult runResult;
    auto onTerminate = [&] (const RunResult & result) {
        runResult = result;
    };

    loop.addSource("runner", runner);
    loop.start();

    vector<string> command = {
        "/bin/sh", "-c", "sleep 60 & sleep 60; wait"
    };
    runner.run(command, onTerminate, make_shared<StringSink>());
    BOOST_REQUIRE(runner.waitStart(5.0));

    Timer timer;
    BOOST_CHECK(runner.kill(SIGKILL));
    BOOST_CHECK(timer.elapsed_wall() < 5.0);

    BOOST_CHECK_EQUAL(runResult.state, RunResult::SIGNALED);
    BOOST_CHECK_EQUAL(runResult.signum, SIGKILL);

    /* nothing left to signal */
    BOOST_CHECK_EQUAL(runner.signal(SIGKILL, false), false);
    BOOST_CHECK_THROW(runner.signal(SIGKILL), Coderun::Exception);

    loop.removeSourceSync(&runner);
}

BOOST_AUTO_TEST_CASE( test_runner_interrupt )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    MessageLoop loop;
    Runner runner;
    RunResult runResult;
    auto onTerminate = [&] (const RunResult & result) {
        runResult = result;
    };

    loop.addSource("runner", runner);
    loop.start();

    runner.run({"/bin/sh", "-c", "exec sleep 60"}, onTerminate);
    BOOST_REQUIRE(runner.waitStart(5.0));
    BOOST_CHECK(runner.signal(SIGINT));
    runner.waitTermination();

    BOOST_CHECK_EQUAL(runResult.state, RunResult::SIGNALED);
    BOOST_CHECK_EQUAL(runResult.signum, SIGINT);

    loop.removeSourceSync(&runner);
}

BOOST_AUTO_TEST_CASE( test_runner_requires_message_loop )
{
    Runner runner;
    auto onTerminate = [] (const RunResult & result) {};
    BOOST_CHECK_THROW(runner.run({"/bin/true"}, onTerminate),
                      Coderun::Exception);
    BOOST_CHECK(!runner.running());
}

/* a runner destroyed while its command is running kills it */
BOOST_AUTO_TEST_CASE( test_runner_destroyed_while_running )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    pid_t childPid;
    {
        MessageLoop loop;
        auto runner = make_shared<Runner>();
        loop.addSource("runner", runner);
        loop.start();

        runner->run({"/bin/sh", "-c", "exec sleep 60"},
                    [] (const RunResult & result) {});
        BOOST_REQUIRE(runner->waitStart(5.0));
        childPid = runner->childPid();

        loop.removeSourceSync(runner.get());
        loop.shutdown();
    }

    bool gone(false);
    for (int i = 0; i < 100 && !gone; i++) {
        gone = !processAlive(childPid);
        if (!gone) {
            Coderun::sleep(0.05);
        }
    }
    BOOST_CHECK(gone);
}

BOOST_AUTO_TEST_CASE( test_execute_bounded_output )
{
    BlockedSignals blockedSigs(SIGCHLD);
    Watchdog wd(10);

    auto outSink = make_shared<StringInputSink>(4);
    auto errSink = make_shared<StringInputSink>();
    RunResult result = execute({"/bin/sh", "-c",
                                "printf 0123456789; printf oops >&2"},
                               outSink, errSink);

    BOOST_CHECK_EQUAL(result.state, RunResult::RETURNED);
    BOOST_CHECK_EQUAL(outSink->data(), "0123");
    BOOST_CHECK(outSink->truncated());
    BOOST_CHECK(outSink->closed());
    BOOST_CHECK_EQUAL(errSink->data(), "oops");
    BOOST_CHECK(!errSink->truncated());
}
