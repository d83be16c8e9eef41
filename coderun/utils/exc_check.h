/* exc_check.h                                                    -*- C++ -*-
   Rémi Attab, 24 Febuary 2012
   Copyright (c) 2012 Datacratic.  All rights reserved.

   Throw an exception when a condition does not hold.

   A failed check calls Coderun::do_abort() before throwing, which aborts
   the process when CODERUN_ABORT is set in the environment.  Run under a
   debugger to stop right where the check failed.
*/

#pragma once

#include <string>

#include <boost/lexical_cast.hpp>

#include "coderun/arch/exception.h"
#include "coderun/arch/format.h"


namespace Coderun {

/** Thrown by the ExcCheck macros: a precondition of a call was not met. */
struct Check_Failure: public Exception {
    Check_Failure(const std::string & msg);
    Check_Failure(const char * assertion,
                  const char * function,
                  const char * file,
                  int line);
};

/** Thrown by the ExcAssert macros: an internal invariant was broken. */
struct Assertion_Failure: public Exception {
    Assertion_Failure(const std::string & msg);
    Assertion_Failure(const char * assertion,
                      const char * function,
                      const char * file,
                      int line);
};

/** Abort the process if CODERUN_ABORT is set in the environment. */
void do_abort();

} // namespace Coderun

#define ExcCheckImpl(condition, message, exc_type)                      \
    do {                                                                \
        if (!(condition)) {                                             \
            std::string msg__ =                                         \
                Coderun::format("%s: %s", std::string(message).c_str(), \
                                #condition);                            \
            Coderun::do_abort();                                        \
            throw exc_type(msg__.c_str(), __PRETTY_FUNCTION__,          \
                           __FILE__, __LINE__);                         \
        }                                                               \
    } while (0)

/* The values must not have side effects as they are evaluated twice. */
#define ExcCheckOpImpl(op, value1, value2, message, exc_type)           \
    do {                                                                \
        if (!((value1) op (value2))) {                                  \
            std::string v1__ = boost::lexical_cast<std::string>(value1);\
            std::string v2__ = boost::lexical_cast<std::string>(value2);\
            std::string msg__ = Coderun::format(                        \
                    "%s: !(%s " #op " %s) [!(%s " #op " %s)]",          \
                    std::string(message).c_str(), #value1, #value2,     \
                    v1__.c_str(), v2__.c_str());                        \
            Coderun::do_abort();                                        \
            throw exc_type(msg__.c_str(), __PRETTY_FUNCTION__,          \
                           __FILE__, __LINE__);                         \
        }                                                               \
    } while (0)

#define ExcCheck(condition, message)                    \
    ExcCheckImpl(condition, message, Coderun::Check_Failure)

#define ExcCheckOp(op, value1, value2, message)                         \
    ExcCheckOpImpl(op, value1, value2, message, Coderun::Check_Failure)

#define ExcCheckGreater(value1, value2, message)        \
    ExcCheckOp(>, value1, value2, message)
