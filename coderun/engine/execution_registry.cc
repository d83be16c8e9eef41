/* execution_registry.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <chrono>
#include <cmath>

#include "coderun/arch/exception.h"

#include "execution_registry.h"

using namespace std;


namespace Coderun {

/*****************************************************************************/
/* EXECUTION REGISTRY                                                        */
/*****************************************************************************/

bool
ExecutionRegistry::
add(const std::string & id,
    const std::shared_ptr<RegisteredExecution> & execution,
    Date startDate)
{
    Guard guard(lock_);

    Entry entry;
    entry.startDate = startDate;
    entry.execution = execution;
    entry.stopping = false;

    return entries_.insert(make_pair(id, entry)).second;
}

bool
ExecutionRegistry::
remove(const std::string & id, bool * wasStopping)
{
    Guard guard(lock_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        if (wasStopping) {
            *wasStopping = false;
        }
        return false;
    }

    if (wasStopping) {
        *wasStopping = it->second.stopping;
    }
    entries_.erase(it);
    if (entries_.empty()) {
        emptied_.notify_all();
    }

    return true;
}

std::shared_ptr<RegisteredExecution>
ExecutionRegistry::
claimStop(const std::string & id)
{
    Guard guard(lock_);

    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.stopping) {
        return nullptr;
    }

    auto execution = it->second.execution.lock();
    if (execution) {
        it->second.stopping = true;
    }

    return execution;
}

bool
ExecutionRegistry::
contains(const std::string & id) const
{
    Guard guard(lock_);
    return entries_.count(id) > 0;
}

Date
ExecutionRegistry::
startDate(const std::string & id) const
{
    Guard guard(lock_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw Coderun::Exception("unknown execution '%s'", id.c_str());
    }

    return it->second.startDate;
}

std::set<std::string>
ExecutionRegistry::
ids() const
{
    Guard guard(lock_);

    std::set<std::string> result;
    for (const auto & entry: entries_) {
        result.insert(entry.first);
    }

    return result;
}

size_t
ExecutionRegistry::
size() const
{
    Guard guard(lock_);
    return entries_.size();
}

bool
ExecutionRegistry::
waitEmpty(double timeout) const
{
    Guard guard(lock_);

    auto isEmpty = [&] () { return entries_.empty(); };
    if (!std::isfinite(timeout)) {
        emptied_.wait(guard, isEmpty);
        return true;
    }

    auto duration = chrono::duration<double>(max(timeout, 0.0));
    return emptied_.wait_for(guard, duration, isEmpty);
}

} // namespace Coderun
