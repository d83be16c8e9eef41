/* format.cc                                                       -*- C++ -*-
   Jeremy Barnes, 26 February 2009
   Copyright (c) 2009 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   printf-style formatting into a std::string.
*/

#include <stdio.h>
#include <stdlib.h>

#include <memory>

#include "exception.h"
#include "format.h"

using namespace std;


namespace Coderun {

std::string format(const char * fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    string result;
    try {
        result = vformat(fmt, ap);
    }
    catch (...) {
        va_end(ap);
        throw;
    }
    va_end(ap);
    return result;
}

std::string vformat(const char * fmt, va_list ap)
{
    char * mem;
    int res = vasprintf(&mem, fmt, ap);
    if (res < 0)
        throw Exception("format(): vasprintf error on %s", fmt);

    unique_ptr<char, void (*)(void *)> owned(mem, free);
    return string(mem, res);
}

} // namespace Coderun
