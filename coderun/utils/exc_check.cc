/* exc_check.cc
   Jeremy Barnes, 15 July 2010
   Copyright (c) 2010 Datacratic Inc.  All rights reserved.

*/

#include <stdlib.h>

#include "exc_check.h"

using namespace std;


namespace {

const bool abortOnFailure = getenv("CODERUN_ABORT") != nullptr;

} // file scope


namespace Coderun {

Check_Failure::
Check_Failure(const std::string & msg)
    : Exception(msg)
{
}

Check_Failure::
Check_Failure(const char * assertion,
              const char * function,
              const char * file,
              int line)
    : Exception(format("%s at %s:%d in %s",
                       assertion, file, line, function))
{
}

Assertion_Failure::
Assertion_Failure(const std::string & msg)
    : Exception(msg)
{
}

Assertion_Failure::
Assertion_Failure(const char * assertion,
                  const char * function,
                  const char * file,
                  int line)
    : Exception(format("assertion failure: %s at %s:%d in %s",
                       assertion, file, line, function))
{
}

void do_abort()
{
    if (abortOnFailure)
        abort();
}

} // namespace Coderun
