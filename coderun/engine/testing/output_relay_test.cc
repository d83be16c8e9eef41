#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/exception.h"
#include "coderun/engine/output_relay.h"

using namespace std;
using namespace Coderun;


struct LineCollector {
    LineCollector()
        : faults(0)
    {
    }

    OutputRelay::OnLine onLine()
    {
        return [&] (string && line) { lines.push_back(line); };
    }

    OutputRelay::OnFault onFault()
    {
        return [&] (const string & error) {
            faults++;
            lastFault = error;
        };
    }

    vector<string> lines;
    int faults;
    string lastFault;
};

BOOST_AUTO_TEST_CASE( test_relay_splits_lines_across_chunks )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine());

    relay.notifyReceived("hel");
    BOOST_CHECK(collector.lines.empty());
    relay.notifyReceived("lo\nwor");
    relay.notifyReceived("ld\nthird\n");
    relay.notifyClosed();

    vector<string> expected = { "hello", "world", "third" };
    BOOST_CHECK(collector.lines == expected);
    BOOST_CHECK_EQUAL(relay.linesForwarded(), 3);
    BOOST_CHECK(relay.closed());
}

BOOST_AUTO_TEST_CASE( test_relay_drops_blank_lines )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine());

    relay.notifyReceived("a\n\n   \n\t\r\nb  \r\n");
    relay.notifyClosed();

    vector<string> expected = { "a", "b" };
    BOOST_CHECK(collector.lines == expected);
}

BOOST_AUTO_TEST_CASE( test_relay_flushes_partial_line_on_close )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine());

    relay.notifyReceived("first\nno newline");
    BOOST_CHECK_EQUAL(collector.lines.size(), 1);
    relay.notifyClosed();

    BOOST_REQUIRE_EQUAL(collector.lines.size(), 2);
    BOOST_CHECK_EQUAL(collector.lines[1], "no newline");

    /* nothing is accepted once closed */
    relay.notifyReceived("late\n");
    BOOST_CHECK_EQUAL(collector.lines.size(), 2);
}

BOOST_AUTO_TEST_CASE( test_relay_replaces_invalid_utf8 )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine());

    relay.notifyReceived("ok\xff\n" "caf\xc3\xa9\n" "cut\xe2\x82\n");
    relay.notifyClosed();

    BOOST_REQUIRE_EQUAL(collector.lines.size(), 3);
    BOOST_CHECK_EQUAL(collector.lines[0], "ok\xef\xbf\xbd");
    BOOST_CHECK_EQUAL(collector.lines[1], "caf\xc3\xa9");
    BOOST_CHECK_EQUAL(collector.lines[2], "cut\xef\xbf\xbd");
}

BOOST_AUTO_TEST_CASE( test_relay_chunks_long_lines )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine(), nullptr, 4);

    relay.notifyReceived("abcdefghij\nxy\n");
    relay.notifyClosed();

    vector<string> expected = { "abcd", "efgh", "ij", "xy" };
    BOOST_CHECK(collector.lines == expected);
}

/* a multi-byte character straddling the line limit moves to the next
   piece instead of being split into two replacement characters */
BOOST_AUTO_TEST_CASE( test_relay_chunks_keep_utf8_characters_whole )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine(), nullptr, 4);

    /* "abc" + U+00E9 + "d" + U+20AC + "\n" */
    relay.notifyReceived("abc\xc3\xa9" "d\xe2\x82\xac\n");
    /* no newline: the cut also applies to the pending data, and the rest
       of the split character may only arrive with the next read */
    relay.notifyReceived("xyz\xe2");
    relay.notifyReceived("\x82\xac!");
    relay.notifyClosed();

    vector<string> expected = {
        "abc", "\xc3\xa9" "d", "\xe2\x82\xac", "xyz", "\xe2\x82\xac!"
    };
    BOOST_CHECK(collector.lines == expected);

    /* a limit shorter than the character still makes progress */
    LineCollector narrow;
    OutputRelay narrowRelay(narrow.onLine(), nullptr, 1);
    narrowRelay.notifyReceived("\xc3\xa9\n");
    narrowRelay.notifyClosed();
    vector<string> replaced = { "\xef\xbf\xbd", "\xef\xbf\xbd" };
    BOOST_CHECK(narrow.lines == replaced);
}

BOOST_AUTO_TEST_CASE( test_relay_seal_drops_everything )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine());

    relay.notifyReceived("before\npartial");
    relay.seal();
    relay.notifyReceived(" line\nafter\n");
    relay.notifyClosed();

    vector<string> expected = { "before" };
    BOOST_CHECK(collector.lines == expected);
    BOOST_CHECK(relay.sealed());
}

BOOST_AUTO_TEST_CASE( test_relay_reports_a_single_fault )
{
    LineCollector collector;
    int calls = 0;
    auto onLine = [&] (string && line) {
        calls++;
        if (line == "bad") {
            throw Coderun::Exception("channel is gone");
        }
        collector.lines.push_back(line);
    };
    OutputRelay relay(onLine, collector.onFault());

    relay.notifyReceived("good\nbad\nignored\n");
    relay.notifyReceived("ignored too\n");
    relay.notifyClosed();

    BOOST_CHECK_EQUAL(calls, 2);
    BOOST_CHECK_EQUAL(collector.lines.size(), 1);
    BOOST_CHECK_EQUAL(collector.faults, 1);
    BOOST_CHECK_EQUAL(collector.lastFault, "channel is gone");
    BOOST_CHECK(relay.faulted());
}

/* a read error on the stream is a fault of the relay; buffered data is not
   forwarded and the close that follows is harmless */
BOOST_AUTO_TEST_CASE( test_relay_read_error_is_a_fault )
{
    LineCollector collector;
    OutputRelay relay(collector.onLine(), collector.onFault());

    relay.notifyReceived("complete\npartial");
    relay.notifyError("Input/output error");
    relay.notifyClosed();
    relay.notifyError("again");

    vector<string> expected = { "complete" };
    BOOST_CHECK(collector.lines == expected);
    BOOST_CHECK_EQUAL(collector.faults, 1);
    BOOST_CHECK_EQUAL(collector.lastFault, "read error: Input/output error");
    BOOST_CHECK(relay.faulted());
    BOOST_CHECK(relay.closed());

    /* a sealed relay ignores the error */
    LineCollector sealedCollector;
    OutputRelay sealedRelay(sealedCollector.onLine(),
                            sealedCollector.onFault());
    sealedRelay.seal();
    sealedRelay.notifyError("Input/output error");
    BOOST_CHECK_EQUAL(sealedCollector.faults, 0);
}

BOOST_AUTO_TEST_CASE( test_rstrip )
{
    string line = "text \t\r\n\v\f";
    OutputRelay::rstrip(line);
    BOOST_CHECK_EQUAL(line, "text");

    line = "   ";
    OutputRelay::rstrip(line);
    BOOST_CHECK_EQUAL(line, "");

    line = "  leading kept";
    OutputRelay::rstrip(line);
    BOOST_CHECK_EQUAL(line, "  leading kept");
}
