#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/exception.h"
#include "coderun/arch/timers.h"
#include "coderun/engine/execution_session.h"
#include "coderun/types/json.h"
#include "coderun/utils/testing/watchdog.h"

#include "event_collector.h"

using namespace std;
using namespace Coderun;


/* Collects the frames sent by a session. */
struct FrameCollector {
    ExecutionSession::SendFrame sender()
    {
        return [this] (const string & frame) {
            std::unique_lock<std::mutex> guard(lock);
            frames.push_back(parseJson(frame));
            changed.notify_all();
        };
    }

    /* Wait until "count" frames of the given type were received, returning
       every frame received so far. */
    vector<Json::Value> waitFor(const string & type, size_t count = 1,
                                double secondsToWait = 10.0)
    {
        std::unique_lock<std::mutex> guard(lock);
        auto found = [&] () {
            size_t matching = 0;
            for (const auto & frame: frames) {
                if (frame["type"].asString() == type)
                    ++matching;
            }
            return matching >= count;
        };
        auto duration = std::chrono::duration<double>(secondsToWait);
        if (!changed.wait_for(guard, duration, found)) {
            throw Coderun::Exception("no frame of type " + type);
        }
        return frames;
    }

    vector<Json::Value> get()
    {
        std::unique_lock<std::mutex> guard(lock);
        return frames;
    }

    std::mutex lock;
    std::condition_variable changed;
    vector<Json::Value> frames;
};

string executeFrame(const string & code)
{
    Json::Value frame;
    frame["type"] = "execute";
    frame["code"] = code;
    return printJson(frame);
}

string stopFrame(const string & id)
{
    Json::Value frame;
    frame["type"] = "stop";
    frame["execution_id"] = id;
    return printJson(frame);
}

BOOST_AUTO_TEST_CASE( test_character_count )
{
    BOOST_CHECK_EQUAL(ExecutionSession::characterCount(""), 0u);
    BOOST_CHECK_EQUAL(ExecutionSession::characterCount("abc"), 3u);
    BOOST_CHECK_EQUAL(ExecutionSession::characterCount("h\xc3\xa9llo"), 5u);
    BOOST_CHECK_EQUAL(ExecutionSession::characterCount("\xe2\x82\xac"), 1u);
    BOOST_CHECK_EQUAL(ExecutionSession::characterCount("\xf0\x9f\x98\x80!"), 2u);
}

BOOST_AUTO_TEST_CASE( test_invalid_frames )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    FrameCollector collector;
    ExecutionSession session(engine, collector.sender());

    session.handleFrame("{ not json");
    session.handleFrame("[1, 2, 3]");
    session.handleFrame("{\"type\": \"execute\"}");
    session.handleFrame("{\"type\": \"execute\", \"code\": \"\"}");
    session.handleFrame("{\"type\": \"execute\", \"code\": 12}");
    session.handleFrame("{\"type\": \"dance\", \"code\": \"echo\"}");
    session.handleFrame("{\"type\": \"stop\"}");

    auto frames = collector.get();
    BOOST_REQUIRE_EQUAL(frames.size(), 7u);
    for (const auto & frame: frames) {
        BOOST_CHECK_EQUAL(frame["type"].asString(), "error");
    }
    BOOST_CHECK_EQUAL(frames[0]["message"].asString(),
                      "Invalid JSON format. Please send properly formatted"
                      " JSON data.");
    for (int i = 1;  i < 6;  ++i) {
        BOOST_CHECK_EQUAL(frames[i]["message"].asString(),
                          "Message format is invalid. Please send JSON with"
                          " 'type' and 'code' fields.");
    }

    BOOST_CHECK(session.activeExecutions().empty());
    BOOST_CHECK(engine.listActive().empty());
}

BOOST_AUTO_TEST_CASE( test_oversized_code )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    FrameCollector collector;
    ExecutionSession session(engine, collector.sender(), 10);

    session.handleFrame(executeFrame("echo 12345678"));

    /* ten characters, nineteen bytes */
    string accents;
    for (int i = 0;  i < 9;  ++i) {
        accents += "\xc3\xa9";
    }
    session.handleFrame(executeFrame("#" + accents));

    auto frames = collector.get();
    BOOST_REQUIRE_EQUAL(frames.size(), 1u);
    BOOST_CHECK_EQUAL(frames[0]["type"].asString(), "error");
    BOOST_CHECK_EQUAL(frames[0]["message"].asString(),
                      "13 characters is greater than the 10 characters"
                      " allowed. Please submit a shorter string.");

    /* the accepted one runs to completion */
    frames = collector.waitFor("execution_complete");
    BOOST_CHECK_EQUAL(frames[1]["type"].asString(), "execution_start");
}

BOOST_AUTO_TEST_CASE( test_execute_frames )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    FrameCollector collector;
    ExecutionSession session(engine, collector.sender());

    /* "type" defaults to "execute" */
    session.handleFrame("{\"code\": \"echo hello\\necho oops >&2\"}");
    auto frames = collector.waitFor("execution_complete");

    BOOST_REQUIRE(frames.size() >= 4);
    string id = frames[0]["execution_id"].asString();
    BOOST_CHECK(!id.empty());
    BOOST_CHECK_EQUAL(frames[0]["type"].asString(), "execution_start");
    BOOST_CHECK_EQUAL(frames[0]["message"].asString(),
                      "Starting Shell execution...");

    int stdoutLines = 0, stderrLines = 0;
    for (const auto & frame: frames) {
        BOOST_CHECK_EQUAL(frame["execution_id"].asString(), id);
        if (frame["type"].asString() == "stdout") {
            BOOST_CHECK_EQUAL(frame["content"].asString(), "hello");
            ++stdoutLines;
        }
        else if (frame["type"].asString() == "stderr") {
            BOOST_CHECK_EQUAL(frame["content"].asString(), "oops");
            ++stderrLines;
        }
    }
    BOOST_CHECK_EQUAL(stdoutLines, 1);
    BOOST_CHECK_EQUAL(stderrLines, 1);

    const Json::Value & last = frames.back();
    BOOST_CHECK_EQUAL(last["type"].asString(), "execution_complete");
    BOOST_CHECK_EQUAL(last["exit_code"].asInt(), 0);
    BOOST_CHECK_EQUAL(last["success"].asBool(), true);

    BOOST_CHECK(session.activeExecutions().empty());
}

BOOST_AUTO_TEST_CASE( test_stop_frames )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    FrameCollector collector;
    ExecutionSession session(engine, collector.sender());
    FrameCollector otherCollector;
    ExecutionSession other(engine, otherCollector.sender());

    session.handleFrame(executeFrame("echo started\nsleep 30"));
    auto frames = collector.waitFor("stdout");
    string id = frames[0]["execution_id"].asString();
    BOOST_CHECK_EQUAL(session.activeExecutions().count(id), 1u);

    /* another session cannot stop it */
    other.handleFrame(stopFrame(id));
    auto otherFrames = otherCollector.waitFor("stop_result");
    BOOST_CHECK_EQUAL(otherFrames.back()["execution_id"].asString(), id);
    BOOST_CHECK_EQUAL(otherFrames.back()["stopped"].asBool(), false);
    BOOST_CHECK(engine.isActive(id));

    session.handleFrame(stopFrame("no-such-execution"));
    session.handleFrame(stopFrame(id));

    collector.waitFor("timeout");
    frames = collector.waitFor("stop_result", 2);
    vector<Json::Value> results;
    Json::Value timeout;
    for (const auto & frame: frames) {
        if (frame["type"].asString() == "stop_result") {
            results.push_back(frame);
        }
        else if (frame["type"].asString() == "timeout") {
            timeout = frame;
        }
    }
    BOOST_REQUIRE_EQUAL(results.size(), 2u);
    BOOST_CHECK_EQUAL(results[0]["execution_id"].asString(),
                      "no-such-execution");
    BOOST_CHECK_EQUAL(results[0]["stopped"].asBool(), false);
    BOOST_CHECK_EQUAL(results[1]["execution_id"].asString(), id);
    BOOST_CHECK_EQUAL(results[1]["stopped"].asBool(), true);

    BOOST_CHECK_EQUAL(timeout["execution_id"].asString(), id);
    BOOST_CHECK(timeout["message"].asString().find("stopped by request")
                != string::npos);
    BOOST_CHECK(session.activeExecutions().empty());
}

BOOST_AUTO_TEST_CASE( test_close_stops_executions )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    FrameCollector collector;
    ExecutionSession session(engine, collector.sender());

    session.handleFrame(executeFrame("echo started\nsleep 30"));
    auto frames = collector.waitFor("stdout");
    string id = frames[0]["execution_id"].asString();

    session.close();
    size_t numFrames = collector.get().size();

    BOOST_CHECK(engine.waitUntilIdle(10.0));
    BOOST_CHECK(!engine.isActive(id));

    /* nothing is sent once closed, and frames are ignored */
    session.handleFrame(executeFrame("echo late"));
    Coderun::sleep(0.2);
    BOOST_CHECK_EQUAL(collector.get().size(), numFrames);
    BOOST_CHECK(engine.listActive().empty());
}

BOOST_AUTO_TEST_CASE( test_failing_sender_closes_session )
{
    Watchdog wd(30);
    ExecutionEngine engine(shellConfig());
    int sent = 0;
    auto send = [&] (const string &) {
        ++sent;
        throw Coderun::Exception("connection reset");
    };
    ExecutionSession session(engine, send);

    session.handleFrame("{ not json");
    BOOST_CHECK_EQUAL(sent, 1);

    session.handleFrame("{ still not json");
    BOOST_CHECK_EQUAL(sent, 1);
}
