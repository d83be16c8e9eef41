/* date.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <errno.h>

#include "coderun/arch/exception.h"
#include "coderun/arch/format.h"

#include "date.h"

using namespace std;
namespace pt = boost::posix_time;


namespace {

const pt::ptime epoch(boost::gregorian::date(1970, 1, 1));

/* Fractional part of the second, printed as ".ddd" with "digits" digits. */
std::string
printFraction(const pt::time_duration & timeOfDay, unsigned digits)
{
    if (digits == 0)
        return "";
    double fraction = double(timeOfDay.fractional_seconds())
        / pt::time_duration::ticks_per_second();
    string result = Coderun::format("%.*f", int(digits), fraction);
    /* rounding up to 1.000 is truncated back, the whole seconds are
       already printed */
    if (result[0] != '0')
        result = "0." + string(digits, '9');
    return result.substr(1);
}

std::string
printNotADate(double secondsSinceEpoch)
{
    if (std::isnan(secondsSinceEpoch))
        return "NaD";
    return secondsSinceEpoch > 0 ? "Inf" : "-Inf";
}

} // file scope


namespace Coderun {

/*****************************************************************************/
/* DATE                                                                      */
/*****************************************************************************/

Date::
Date(const pt::ptime & date)
    : secondsSinceEpoch_((date - epoch).total_microseconds() / 1000000.0)
{
}

Date
Date::
positiveInfinity()
{
    return fromSecondsSinceEpoch(INFINITY);
}

Date
Date::
negativeInfinity()
{
    return fromSecondsSinceEpoch(-INFINITY);
}

Date
Date::
now()
{
    timespec time;
    int res = clock_gettime(CLOCK_REALTIME, &time);
    if (res == -1)
        throw Coderun::Exception(errno, "clock_gettime");
    return fromSecondsSinceEpoch(time.tv_sec + time.tv_nsec * 0.000000001);
}

pt::ptime
Date::
toBoost() const
{
    if (!isADate()) {
        throw Coderun::Exception("cannot convert " + print()
                                 + " to a posix time");
    }
    double wholeSeconds = std::floor(secondsSinceEpoch_);
    long long micros = (secondsSinceEpoch_ - wholeSeconds) * 1000000;
    return pt::from_time_t(time_t(wholeSeconds)) + pt::microseconds(micros);
}

std::string
Date::
print(unsigned secondsDigits) const
{
    if (!isADate())
        return printNotADate(secondsSinceEpoch_);

    pt::ptime time = toBoost();
    pt::time_duration timeOfDay = time.time_of_day();

    return format("%s %02d:%02d:%02d",
                  boost::gregorian::to_simple_string(time.date()).c_str(),
                  int(timeOfDay.hours()), int(timeOfDay.minutes()),
                  int(timeOfDay.seconds()))
        + printFraction(timeOfDay, secondsDigits);
}

std::string
Date::
printIso8601(unsigned fractionDigits) const
{
    if (!isADate())
        return printNotADate(secondsSinceEpoch_);

    pt::ptime time = toBoost();
    pt::time_duration timeOfDay = time.time_of_day();

    return format("%sT%02d:%02d:%02d",
                  boost::gregorian::to_iso_extended_string(time.date()).c_str(),
                  int(timeOfDay.hours()), int(timeOfDay.minutes()),
                  int(timeOfDay.seconds()))
        + printFraction(timeOfDay, fractionDigits) + "Z";
}

std::ostream & operator << (std::ostream & stream, const Date & date)
{
    return stream << date.print();
}

} // namespace Coderun
