/* execution_registry.h                                            -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Index of the executions in flight, keyed by their identifier.
*/

#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "coderun/types/date.h"


namespace Coderun {

/*****************************************************************************/
/* REGISTERED EXECUTION                                                      */
/*****************************************************************************/

/** What the registry knows how to do with an execution it indexes. */

struct RegisteredExecution {
    virtual ~RegisteredExecution()
    {
    }

    /** Request the termination of the execution.  Must not block. */
    virtual void cancel() = 0;
};


/*****************************************************************************/
/* EXECUTION REGISTRY                                                        */
/*****************************************************************************/

/** Thread-safe map from execution identifier to the execution.  Entries do
    not own their execution.

    Each entry carries a "stopping" flag: the first caller of claimStop gets
    the execution, later callers get nothing, which makes stopping
    idempotent.
*/

struct ExecutionRegistry {
    struct Entry {
        Date startDate;
        std::weak_ptr<RegisteredExecution> execution;
        bool stopping;
    };

    /** Register the execution.  Returns false if the identifier is already
        registered. */
    bool add(const std::string & id,
             const std::shared_ptr<RegisteredExecution> & execution,
             Date startDate = Date::now());

    /** Deregister the execution.  Returns false if it was not registered.
        When "wasStopping" is given, it receives whether a stop had been
        claimed for the execution. */
    bool remove(const std::string & id, bool * wasStopping = nullptr);

    /** Mark the execution as stopping and return it, unless it is unknown
        or already stopping, in which case null is returned. */
    std::shared_ptr<RegisteredExecution> claimStop(const std::string & id);

    bool contains(const std::string & id) const;

    /** Throws if the identifier is not registered. */
    Date startDate(const std::string & id) const;

    /** Snapshot of the registered identifiers. */
    std::set<std::string> ids() const;

    size_t size() const;

    /** Wait until no execution is registered, for at most "timeout"
        seconds.  Returns whether the registry is empty. */
    bool waitEmpty(double timeout) const;

private:
    typedef std::mutex Mutex;
    typedef std::unique_lock<Mutex> Guard;

    mutable Mutex lock_;
    mutable std::condition_variable emptied_;
    std::map<std::string, Entry> entries_;
};

} // namespace Coderun
