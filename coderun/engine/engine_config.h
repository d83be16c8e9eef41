/* engine_config.h                                                 -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Configuration of the execution engine.
*/

#pragma once

#include <string>
#include <vector>

#include <json/json.h>

#include "subprocess_unit.h"


namespace Coderun {

/*****************************************************************************/
/* ENGINE CONFIG                                                             */
/*****************************************************************************/

struct EngineConfig {
    EngineConfig();

    /** Seconds an execution may run before it is terminated. */
    double executionTimeout;

    /** Seconds between the graceful and the forced termination of a unit,
        and between two forced terminations. */
    double terminationGrace;

    /** Maximum number of characters of a submission.  Enforced by the
        session, not by the engine. */
    int maxCodeLength;

    /** "subprocess" or "delegated". */
    std::string strategy;

    std::vector<std::string> interpreter;
    std::vector<std::string> syntaxCheck;
    std::string fileSuffix;

    /** Name of the language, as shown to the clients. */
    std::string language;

    /** Seconds between two polls of a backend that can't notify. */
    double pollInterval;

    /** Worker threads of the local task queue. */
    int workers;

    /** Throw if the configuration can not be used. */
    void validate() const;

    /** Settings of the subprocess units and of the local task queue. */
    SubprocessConfig subprocessConfig() const;

    /** Override the fields present in the given object.  Unknown fields
        and values of the wrong type are rejected. */
    void fromJson(const Json::Value & json);
    Json::Value toJson() const;

    static EngineConfig parseJson(const std::string & text);

    /** Override the fields from the PYTHON_EXECUTION_TIMEOUT and
        MAX_CODE_LENGTH environment variables, when set. */
    void loadFromEnvironment();

    void loadFromFile(const std::string & filename);
};

} // namespace Coderun
