/* execution_backend.h                                             -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Interface to an external service running code submissions as tasks.
*/

#pragma once

#include <functional>
#include <iostream>
#include <string>


namespace Coderun {

/*****************************************************************************/
/* BACKEND RESULT                                                            */
/*****************************************************************************/

struct BackendResult {
    enum Status {
        SUCCESS,  ///< The code ran and exited with code 0
        FAILED,   ///< The code ran and exited with an error or a signal
        ERROR,    ///< The code could not be run
        REVOKED   ///< The task was revoked before it completed
    };

    BackendResult()
        : status(ERROR), exitCode(-1), signum(0)
    {
    }

    Status status;
    std::string stdOut;
    std::string stdErr;
    int exitCode;
    int signum;
    std::string error;
};

std::string to_string(BackendResult::Status status);

std::ostream &
operator << (std::ostream & stream, BackendResult::Status status);


/*****************************************************************************/
/* EXECUTION BACKEND                                                         */
/*****************************************************************************/

/** A backend is shared by every delegated unit of an engine and must be
    usable from any thread.
*/

struct ExecutionBackend {
    typedef std::function<void ()> OnReady;

    virtual ~ExecutionBackend()
    {
    }

    /** Submit the code and return the identifier of the new task. */
    virtual std::string submit(const std::string & code) = 0;

    /** Return whether the task has completed, filling "result" when it has.
        A task is forgotten by the backend once its result has been
        returned.  Throws for unknown tasks. */
    virtual bool poll(const std::string & taskId, BackendResult & result) = 0;

    /** Cancel the task.  A running task is interrupted when "force" is
        false and killed otherwise.  Unknown or completed tasks are
        ignored. */
    virtual void revoke(const std::string & taskId, bool force) = 0;

    /** Arrange for "onReady" to be called, from any thread, once the task
        has completed.  Returns false when the backend can not notify, in
        which case the caller has to poll. */
    virtual bool notifyWhenReady(const std::string & taskId,
                                 const OnReady & onReady)
    {
        return false;
    }
};

} // namespace Coderun
