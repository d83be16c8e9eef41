/* json.h                                                          -*- C++ -*-
   Copyright (c) 2013 Datacratic.  All rights reserved.

   Helpers around jsoncpp values.
*/

#pragma once

#include <string>

#include <json/json.h>


namespace Coderun {

/** Parse the given text as a single JSON document.  Throws on any syntax
    error or trailing garbage. */
Json::Value parseJson(const std::string & text);

/** Print the value on a single line, without a trailing newline. */
std::string printJson(const Json::Value & value);

Json::Value loadJsonFromFile(const std::string & filename);

/** Return the given member of the object, throwing if it is missing. */
const Json::Value & jsonMember(const Json::Value & value,
                               const char * fieldName,
                               const char * object);

} // namespace Coderun
