/* exception.cc
   Jeremy Barnes, 7 February 2005
   Copyright (c) 2005 Jeremy Barnes.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Exception class.
*/

#include <stdlib.h>
#include <string.h>
#include <cxxabi.h>

#include "coderun/arch/format.h"
#include "exception.h"

using namespace std;


namespace Coderun {

Exception::Exception(const std::string & msg)
    : message(msg)
{
    message.c_str();  // make sure we have a null terminator
}

Exception::Exception(const char * msg, ...)
{
    va_list ap;
    va_start(ap, msg);
    try {
        message = vformat(msg, ap);
        message.c_str();
        va_end(ap);
    }
    catch (...) {
        va_end(ap);
        throw;
    }
}

Exception::Exception(const char * msg, va_list ap)
{
    message = vformat(msg, ap);
    message.c_str();
}

Exception::
Exception(int errnum, const std::string & msg, const char * function)
{
    string error = strerror(errnum);

    if (function) {
        message = function;
        message += ": ";
    }

    message += msg;
    message += ": ";

    message += error;

    message.c_str();
}

Exception::~Exception() throw()
{
}

const char * Exception::what() const throw()
{
    return message.c_str();
}

std::string getExceptionString()
{
    const std::type_info * t = abi::__cxa_current_exception_type();
    if (!t)
        return "<no exception>";

    int status = 0;
    char * demangled = abi::__cxa_demangle(t->name(), 0, 0, &status);
    if (status != 0 || !demangled)
        return t->name();

    string result(demangled);
    free(demangled);
    return result;
}

std::string describeException(const std::exception_ptr & excPtr)
{
    if (!excPtr)
        return "unknown error";

    try {
        std::rethrow_exception(excPtr);
    }
    catch (const std::exception & exc) {
        return exc.what();
    }
    catch (...) {
        return "exception of type " + getExceptionString();
    }
}

} // namespace Coderun
