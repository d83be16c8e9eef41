/* execution_event.h                                               -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Events emitted by the execution engine for one execution.
*/

#pragma once

#include <iostream>
#include <string>

#include <json/json.h>


namespace Coderun {

/*****************************************************************************/
/* EXECUTION EVENT                                                           */
/*****************************************************************************/

/** One record of the event stream of an execution.  The stream of an
    execution always starts with START and ends with exactly one terminal
    event (COMPLETE, TIMEOUT or ERROR).
*/

struct ExecutionEvent {
    enum Kind {
        START,      ///< Execution admitted, unit starting
        STDOUT,     ///< One non-blank line of standard output
        STDERR,     ///< One non-blank line of standard error
        COMPLETE,   ///< Unit finished before the deadline
        TIMEOUT,    ///< Deadline exceeded, or stop requested
        ERROR       ///< Unit or relay fault
    };

    ExecutionEvent(Kind kind = ERROR,
                   const std::string & executionId = "",
                   const std::string & text = "");

    Kind kind;
    std::string executionId;

    /** Line of output for STDOUT/STDERR, human readable message for the
        others. */
    std::string text;

    /** Only meaningful for COMPLETE. */
    int exitCode;
    bool success;

    bool isTerminal() const
    {
        return kind == COMPLETE || kind == TIMEOUT || kind == ERROR;
    }

    /** Wire representation: {"type", "execution_id", "content"|"message"},
        plus "exit_code" and "success" for completions. */
    Json::Value toJson() const;
};

/** Wire name of the event kind ("execution_start", "stdout", ...). */
std::string to_string(ExecutionEvent::Kind kind);

std::ostream &
operator << (std::ostream & stream, ExecutionEvent::Kind kind);

} // namespace Coderun
