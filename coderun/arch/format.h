/* format.h                                                        -*- C++ -*-
   Jeremy Barnes, 26 February 2009
   Copyright (c) 2009 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   printf-style formatting into a std::string.
*/

#ifndef __coderun__arch__format_h__
#define __coderun__arch__format_h__

#include <stdarg.h>
#include <string>

namespace Coderun {

std::string format(const char * fmt, ...)
    __attribute__((__format__(__printf__, 1, 2)));

std::string vformat(const char * fmt, va_list ap)
    __attribute__((__format__(__printf__, 1, 0)));

} // namespace Coderun

#endif /* __coderun__arch__format_h__ */
