/* exception.h                                                     -*- C++ -*-
   Jeremy Barnes, 26 January 2005
   Copyright (c) 2005 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Defines our exception class.
*/

#ifndef __coderun__arch__exception_h__
#define __coderun__arch__exception_h__

#include <stdarg.h>
#include <exception>
#include <string>

namespace Coderun {

class Exception : public std::exception {
public:
    Exception(const std::string & msg);
    Exception(const char * msg, ...);
    Exception(const char * msg, va_list ap);
    Exception(int errnum, const std::string & msg, const char * function = 0);
    virtual ~Exception() throw();

    virtual const char * what() const throw();

private:
    std::string message;
};

/** Return the demangled type name of the exception currently being
    handled. */
std::string getExceptionString();

/** Return a description of the exception held by "excPtr", suitable for
    reporting to a remote peer. */
std::string describeException(const std::exception_ptr & excPtr);

} // namespace Coderun

#endif /* __coderun__arch__exception_h__ */
