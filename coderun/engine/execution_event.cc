/* execution_event.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include "coderun/arch/exception.h"

#include "execution_event.h"

using namespace std;


namespace Coderun {

/*****************************************************************************/
/* EXECUTION EVENT                                                           */
/*****************************************************************************/

ExecutionEvent::
ExecutionEvent(Kind kind, const std::string & executionId,
               const std::string & text)
    : kind(kind), executionId(executionId), text(text),
      exitCode(-1), success(false)
{
}

Json::Value
ExecutionEvent::
toJson() const
{
    Json::Value result(Json::objectValue);

    result["type"] = to_string(kind);
    result["execution_id"] = executionId;
    if (kind == STDOUT || kind == STDERR) {
        result["content"] = text;
    }
    else {
        result["message"] = text;
    }
    if (kind == COMPLETE) {
        result["exit_code"] = exitCode;
        result["success"] = success;
    }

    return result;
}

std::string
to_string(ExecutionEvent::Kind kind)
{
    switch (kind) {
    case ExecutionEvent::START: return "execution_start";
    case ExecutionEvent::STDOUT: return "stdout";
    case ExecutionEvent::STDERR: return "stderr";
    case ExecutionEvent::COMPLETE: return "execution_complete";
    case ExecutionEvent::TIMEOUT: return "timeout";
    case ExecutionEvent::ERROR: return "error";
    }
    throw Coderun::Exception("unknown execution event kind %d", (int)kind);
}

std::ostream &
operator << (std::ostream & stream, ExecutionEvent::Kind kind)
{
    return stream << to_string(kind);
}

} // namespace Coderun
