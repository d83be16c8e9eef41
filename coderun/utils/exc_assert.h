/* exc_assert.h                                                    -*- C++ -*-
   Jeremy Barnes, 15 July 2010
   Copyright (c) 2010 Datacratic.  All rights reserved.

   Asserts that throw Assertion_Failure rather than abort the program.
*/

#pragma once

#include "coderun/utils/exc_check.h"

#define ExcAssert(condition)                    \
    ExcCheckImpl(condition, "Assert failure", Coderun::Assertion_Failure)
