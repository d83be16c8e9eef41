/* date.h                                                          -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Wall clock time, as seconds since the epoch.
*/

#pragma once

#include <time.h>

#include <cmath>
#include <iostream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>


namespace Coderun {

/*****************************************************************************/
/* DATE                                                                      */
/*****************************************************************************/

/** A point in time with microsecond resolution.  Infinite dates are used as
    "never" and "not yet" markers. */

struct Date {

    Date()
        : secondsSinceEpoch_(0.0)
    {
    }

    explicit Date(const boost::posix_time::ptime & date);

    static Date fromSecondsSinceEpoch(double numSeconds)
    {
        Date result;
        result.secondsSinceEpoch_ = numSeconds;
        return result;
    }

    static Date positiveInfinity();
    static Date negativeInfinity();
    static Date now();

    bool isADate() const
    {
        return std::isfinite(secondsSinceEpoch_);
    }

    double secondsSinceEpoch() const
    {
        return secondsSinceEpoch_;
    }

    /** "2026-Oct-19 14:03:12", followed by the given number of fractional
        digits.  Always in UTC. */
    std::string print(unsigned secondsDigits = 0) const;

    /** "2026-10-19T14:03:12.250Z" */
    std::string printIso8601(unsigned fractionDigits = 3) const;

    bool operator == (const Date & other) const
    {
        return secondsSinceEpoch_ == other.secondsSinceEpoch_;
    }

    bool operator != (const Date & other) const
    {
        return !operator == (other);
    }

    bool operator < (const Date & other) const
    {
        return secondsSinceEpoch_ < other.secondsSinceEpoch_;
    }

    bool operator > (const Date & other) const
    {
        return secondsSinceEpoch_ > other.secondsSinceEpoch_;
    }

    double operator - (const Date & other) const
    {
        return secondsSinceEpoch_ - other.secondsSinceEpoch_;
    }

    Date plusSeconds(double interval) const
    {
        return fromSecondsSinceEpoch(secondsSinceEpoch_ + interval);
    }

    double secondsUntil(const Date & other) const
    {
        return other.secondsSinceEpoch_ - secondsSinceEpoch_;
    }

    double secondsSince(const Date & other) const
    {
        return secondsSinceEpoch_ - other.secondsSinceEpoch_;
    }

    /** Convert to a boost posix time.  Only valid for finite dates. */
    boost::posix_time::ptime toBoost() const;

private:
    double secondsSinceEpoch_;
};

std::ostream & operator << (std::ostream & stream, const Date & date);

} // namespace Coderun
