#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/futex.h"
#include "coderun/arch/timers.h"
#include "coderun/utils/testing/watchdog.h"

#include "coderun/service/typed_message_channel.h"
#include "coderun/service/message_loop.h"

using namespace std;
using namespace Coderun;


/* A source that exposes a queue of strings. */
struct StringSource : public TypedMessageQueue<string> {
    virtual void onNotify()
    {
        for (auto & item: drain()) {
            std::unique_lock<std::mutex> guard(lock);
            received.push_back(item);
        }
    }

    std::mutex lock;
    vector<string> received;
};

/* This test ensures that adding sources works correctly independently of
 * whether the loop has been started or not. */
BOOST_AUTO_TEST_CASE( test_addSource_after_before_start )
{
    Watchdog wd(30);
    const int numSources(100);

    typedef shared_ptr<StringSource> TestSource;

    /* before "start" */
    {
        MessageLoop loop;
        vector<TestSource> sources;
        for (int i = 0; i < numSources; i++) {
            sources.emplace_back(new StringSource());
        }

        for (auto & source: sources) {
            loop.addSource("source", source);
        }

        loop.start();

        for (auto & source: sources) {
            source->waitConnectionState(AsyncEventSource::CONNECTED);
        }
        BOOST_CHECK_EQUAL(loop.numSources(), (size_t)numSources);

        /* cleanup */
        for (auto & source: sources) {
            loop.removeSource(source.get());
        }
        for (auto & source: sources) {
            source->waitConnectionState(AsyncEventSource::DISCONNECTED);
        }
        BOOST_CHECK_EQUAL(loop.numSources(), (size_t)0);
    }

    /* after "start" */
    {
        MessageLoop loop;
        vector<TestSource> sources;
        for (int i = 0; i < numSources; i++) {
            sources.emplace_back(new StringSource());
        }

        loop.start();

        for (auto & source: sources) {
            loop.addSource("source", source);
        }

        for (auto & source: sources) {
            source->waitConnectionState(AsyncEventSource::CONNECTED);
        }

        for (auto & source: sources) {
            loop.removeSourceSync(source.get());
        }
    }
}

/* messages pushed to a source are processed by the loop thread, in order */
BOOST_AUTO_TEST_CASE( test_source_messages )
{
    Watchdog wd(10);

    MessageLoop loop;
    StringSource source;
    loop.addSource("strings", source);
    loop.start();
    source.waitConnectionState(AsyncEventSource::CONNECTED);

    for (int i = 0; i < 10; i++) {
        source.push_back(to_string(i));
    }

    while (true) {
        {
            std::unique_lock<std::mutex> guard(source.lock);
            if (source.received.size() == 10) {
                break;
            }
        }
        Coderun::sleep(0.01);
    }

    for (int i = 0; i < 10; i++) {
        BOOST_CHECK_EQUAL(source.received[i], to_string(i));
    }

    loop.removeSourceSync(&source);
}

BOOST_AUTO_TEST_CASE( test_runInMessageLoopThread )
{
    Watchdog wd(10);

    MessageLoop loop;
    loop.start();

    BOOST_CHECK(!loop.inMessageLoopThread());

    std::atomic<int> done(0);
    vector<int> order;
    bool inLoopThread(false);

    for (int i = 0; i < 5; i++) {
        loop.runInMessageLoopThread([&, i] () {
            order.push_back(i);
            inLoopThread = loop.inMessageLoopThread();
            done = i + 1;
            futex_wake(done);
        });
    }

    while (done != 5) {
        int old = done;
        futex_wait(done, old, 0.1);
    }

    BOOST_CHECK(order == vector<int>({0, 1, 2, 3, 4}));
    BOOST_CHECK(inLoopThread);
}

/* an exception thrown by a posted function is logged and does not prevent
   the following ones from running */
BOOST_AUTO_TEST_CASE( test_runInMessageLoopThread_exception )
{
    Watchdog wd(10);

    MessageLoop loop;
    loop.start();

    std::atomic<int> done(0);
    loop.runInMessageLoopThread([] () {
        throw Coderun::Exception("thrown from the loop");
    });
    loop.runInMessageLoopThread([&] () {
        done = 1;
        futex_wake(done);
    });

    while (!done) {
        futex_wait(done, 0, 0.1);
    }
    BOOST_CHECK_EQUAL(done.load(), 1);
}

BOOST_AUTO_TEST_CASE( test_removeSourceSync_from_loop_thread )
{
    Watchdog wd(10);

    MessageLoop loop;
    StringSource source;
    loop.addSource("strings", source);
    loop.start();
    source.waitConnectionState(AsyncEventSource::CONNECTED);

    std::atomic<int> done(0);
    bool thrown(false);
    loop.runInMessageLoopThread([&] () {
        try {
            loop.removeSourceSync(&source);
        }
        catch (const Coderun::Exception & exc) {
            thrown = true;
        }
        done = 1;
        futex_wake(done);
    });

    while (!done) {
        futex_wait(done, 0, 0.1);
    }
    BOOST_CHECK(thrown);

    loop.removeSourceSync(&source);
}

BOOST_AUTO_TEST_CASE( test_addPeriodic )
{
    Watchdog wd(10);

    MessageLoop loop;
    loop.start();

    std::atomic<int> ticks(0);
    auto periodic = loop.addPeriodic("periodic", 0.01,
                                     [&] (uint64_t numTimeouts) {
                                         ticks += numTimeouts;
                                         futex_wake(ticks);
                                     });
    BOOST_CHECK_EQUAL(periodic->timePeriod(), 0.01);

    while (ticks < 5) {
        int old = ticks;
        futex_wait(ticks, old, 0.1);
    }

    /* once removed, the periodic function is not invoked anymore */
    loop.removeSourceSync(periodic.get());
    int ticksAfterRemoval = ticks;
    Coderun::sleep(0.1);
    BOOST_CHECK_EQUAL(ticks.load(), ticksAfterRemoval);
}

BOOST_AUTO_TEST_CASE( test_periodic_rejects_negative_period )
{
    BOOST_CHECK_THROW(PeriodicEventSource(-1.0, [] (uint64_t) {}),
                      Coderun::Exception);
}
