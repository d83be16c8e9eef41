#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "coderun/arch/exception.h"
#include "coderun/service/logs.h"

using namespace std;
using namespace Coderun;


/* Keeps the category and text of every message. */
struct RecordingWriter : public Logging::Writer {
    void write(Date const & timestamp, char const * category,
               char const * function, char const * file, int line,
               std::string const & text)
    {
        records.push_back(string(category) + ": " + text);
    }

    vector<string> records;
};

BOOST_AUTO_TEST_CASE( test_categories_follow_their_parent )
{
    Logging::Category parent("Logs Test");
    Logging::Category child("Logs Test Child", parent);
    Logging::Category quiet("Logs Test Quiet", parent, false);

    auto writer = make_shared<RecordingWriter>();
    parent.writeTo(writer);

    LOG(parent) << "one " << 1 << endl;
    LOG(child) << "two" << endl;
    LOG(quiet) << "never" << endl;

    vector<string> expected = { "Logs Test: one 1", "Logs Test Child: two" };
    BOOST_CHECK(writer->records == expected);

    /* activation reaches the disabled descendant */
    parent.activate();
    LOG(quiet) << "now" << endl;
    BOOST_CHECK_EQUAL(writer->records.back(), "Logs Test Quiet: now");

    /* a category created later inherits the writer of its parent */
    Logging::Category late("Logs Test Late", parent);
    LOG(late) << "late" << endl;
    BOOST_CHECK_EQUAL(writer->records.back(), "Logs Test Late: late");
}

BOOST_AUTO_TEST_CASE( test_throw_logs_then_throws )
{
    Logging::Category errors("Logs Test Errors");
    auto writer = make_shared<RecordingWriter>();
    errors.writeTo(writer);

    string message;
    try {
        THROW(errors) << "bad value: " << 42;
    }
    catch (const Coderun::Exception & exc) {
        message = exc.what();
    }
    BOOST_CHECK_EQUAL(message, "bad value: 42");
    BOOST_REQUIRE_EQUAL(writer->records.size(), 1u);
    BOOST_CHECK_EQUAL(writer->records[0], "Logs Test Errors: bad value: 42");

    /* the lock was released: logging still works */
    LOG(errors) << "after" << endl;
    BOOST_CHECK_EQUAL(writer->records.size(), 2u);
}

BOOST_AUTO_TEST_CASE( test_write_all_to )
{
    BOOST_CHECK_NO_THROW(Logging::Category::writeAllTo("json"));
    BOOST_CHECK_NO_THROW(Logging::Category::writeAllTo("console"));
    BOOST_CHECK_THROW(Logging::Category::writeAllTo("xml"),
                      Coderun::Exception);
}
