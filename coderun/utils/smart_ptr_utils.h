/* smart_ptr_utils.h                                               -*- C++ -*-
   Jeremy Barnes, 1 February 2005
   Copyright (c) 2005 Jeremy Barnes.  All rights reserved.

   Utilities to help with smart pointers.
*/

#ifndef __coderun__utils__smart_ptr_utils_h__
#define __coderun__utils__smart_ptr_utils_h__

#include <memory>

namespace Coderun {

struct Dont_Delete {
    template<class X> void operator () (const X & x) const
    {
    }
};

/** Wrap an object whose lifetime is managed elsewhere (typically a stack
    variable in a test) so that it can be passed to something that wants a
    shared_ptr.  The caller must outlive every copy.
*/
template<class T>
std::shared_ptr<T> make_unowned_std_sp(T & val)
{
    return std::shared_ptr<T>(&val, Dont_Delete());
}

} // namespace Coderun

#endif /* __coderun__utils__smart_ptr_utils_h__ */
