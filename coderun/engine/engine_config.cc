/* engine_config.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <stdlib.h>

#include <boost/lexical_cast.hpp>

#include "coderun/arch/exception.h"
#include "coderun/service/logs.h"
#include "coderun/types/json.h"

#include "engine_config.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category errors("Engine Config Error");

double asSeconds(const Json::Value & value, const string & field)
{
    if (!value.isNumeric()) {
        throw Coderun::Exception("engine config field " + field
                                 + " must be a number of seconds");
    }
    return value.asDouble();
}

int asInt(const Json::Value & value, const string & field)
{
    if (!value.isIntegral()) {
        throw Coderun::Exception("engine config field " + field
                                 + " must be an integer");
    }
    return value.asInt();
}

string asString(const Json::Value & value, const string & field)
{
    if (!value.isString()) {
        throw Coderun::Exception("engine config field " + field
                                 + " must be a string");
    }
    return value.asString();
}

vector<string> asCommand(const Json::Value & value, const string & field)
{
    if (!value.isArray()) {
        throw Coderun::Exception("engine config field " + field
                                 + " must be an array of strings");
    }
    vector<string> result;
    for (const auto & arg: value) {
        result.push_back(asString(arg, field));
    }
    return result;
}

Json::Value commandToJson(const vector<string> & command)
{
    Json::Value result(Json::arrayValue);
    for (const auto & arg: command) {
        result.append(arg);
    }
    return result;
}

template<typename T>
bool getEnv(const char * name, T & value)
{
    const char * text = ::getenv(name);
    if (!text || !*text) {
        return false;
    }
    try {
        value = boost::lexical_cast<T>(text);
    }
    catch (const boost::bad_lexical_cast &) {
        throw Coderun::Exception("invalid value for %s: '%s'", name, text);
    }
    return true;
}

} // file scope


namespace Coderun {

/*****************************************************************************/
/* ENGINE CONFIG                                                             */
/*****************************************************************************/

EngineConfig::
EngineConfig()
    : executionTimeout(30.0), terminationGrace(0.5), maxCodeLength(3000),
      strategy("subprocess"), language("Python"),
      pollInterval(0.1), workers(2)
{
    SubprocessConfig defaults;
    interpreter = defaults.interpreter;
    syntaxCheck = defaults.syntaxCheck;
    fileSuffix = defaults.fileSuffix;
}

void
EngineConfig::
validate() const
{
    if (!(executionTimeout > 0)) {
        THROW(errors) << "execution timeout must be positive: "
                      << executionTimeout;
    }
    if (!(terminationGrace > 0)) {
        THROW(errors) << "termination grace must be positive: "
                      << terminationGrace;
    }
    if (maxCodeLength <= 0) {
        THROW(errors) << "max code length must be positive: "
                      << maxCodeLength;
    }
    if (strategy != "subprocess" && strategy != "delegated") {
        THROW(errors) << "unknown execution strategy '" << strategy << "'";
    }
    if (interpreter.empty() || interpreter[0].empty()) {
        THROW(errors) << "no interpreter configured";
    }
    if (!(pollInterval > 0)) {
        THROW(errors) << "poll interval must be positive: " << pollInterval;
    }
    if (workers <= 0) {
        THROW(errors) << "number of workers must be positive: " << workers;
    }
}

SubprocessConfig
EngineConfig::
subprocessConfig() const
{
    SubprocessConfig result;
    result.interpreter = interpreter;
    result.syntaxCheck = syntaxCheck;
    result.fileSuffix = fileSuffix;
    return result;
}

void
EngineConfig::
fromJson(const Json::Value & json)
{
    if (!json.isObject()) {
        throw Coderun::Exception("engine config must be a JSON object");
    }

    for (auto it = json.begin(), end = json.end();  it != end;  ++it) {
        string name = it.name();
        const Json::Value & val = *it;

        if (name == "execution_timeout")
            executionTimeout = asSeconds(val, name);
        else if (name == "termination_grace")
            terminationGrace = asSeconds(val, name);
        else if (name == "max_code_length")
            maxCodeLength = asInt(val, name);
        else if (name == "strategy")
            strategy = asString(val, name);
        else if (name == "interpreter")
            interpreter = asCommand(val, name);
        else if (name == "syntax_check")
            syntaxCheck = asCommand(val, name);
        else if (name == "file_suffix")
            fileSuffix = asString(val, name);
        else if (name == "language")
            language = asString(val, name);
        else if (name == "poll_interval")
            pollInterval = asSeconds(val, name);
        else if (name == "workers")
            workers = asInt(val, name);
        else {
            throw Coderun::Exception("engine config has invalid key: %s",
                                     name.c_str());
        }
    }
}

Json::Value
EngineConfig::
toJson() const
{
    Json::Value result;
    result["execution_timeout"] = executionTimeout;
    result["termination_grace"] = terminationGrace;
    result["max_code_length"] = maxCodeLength;
    result["strategy"] = strategy;
    result["interpreter"] = commandToJson(interpreter);
    result["syntax_check"] = commandToJson(syntaxCheck);
    result["file_suffix"] = fileSuffix;
    result["language"] = language;
    result["poll_interval"] = pollInterval;
    result["workers"] = workers;
    return result;
}

EngineConfig
EngineConfig::
parseJson(const std::string & text)
{
    EngineConfig result;
    result.fromJson(Coderun::parseJson(text));
    return result;
}

void
EngineConfig::
loadFromEnvironment()
{
    getEnv("PYTHON_EXECUTION_TIMEOUT", executionTimeout);
    getEnv("MAX_CODE_LENGTH", maxCodeLength);
}

void
EngineConfig::
loadFromFile(const std::string & filename)
{
    fromJson(loadJsonFromFile(filename));
}

} // namespace Coderun
