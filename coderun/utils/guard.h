/* guard.h                                                         -*- C++ -*-
   Jeremy Barnes, 13 February 2007
   Copyright (c) 2007 Jeremy Barnes.  All rights reserved.

   Scope guard that runs a function on destruction unless cleared.
*/

#ifndef __coderun__utils__guard_h__
#define __coderun__utils__guard_h__

#include <boost/function.hpp>

namespace Coderun {

struct Call_Guard {

    typedef boost::function<void ()> Fn;

    Call_Guard(const Fn & fn, bool condition = true)
        : fn(condition ? fn : Fn())
    {
    }

    Call_Guard()
    {
    }

    Call_Guard(Call_Guard && other)
        : fn(other.fn)
    {
        other.clear();
    }

    Call_Guard & operator = (Call_Guard && other)
    {
        if (fn) fn();
        fn = other.fn;
        other.clear();
        return *this;
    }

    ~Call_Guard()
    {
        if (fn) fn();
    }

    void clear() { fn = Fn(); }

    void set(const Fn & fn) { this->fn = fn; }

    boost::function<void ()> fn;

private:
    Call_Guard(const Call_Guard & other);
    void operator = (const Call_Guard & other);
};

template<typename Fn>
Call_Guard call_guard(Fn fn, bool condition = true)
{
    return Call_Guard(fn, condition);
}

} // namespace Coderun

#endif /* __coderun__utils__guard_h__ */
