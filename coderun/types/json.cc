/* json.cc
   Copyright (c) 2013 Datacratic.  All rights reserved.

*/

#include <errno.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "coderun/arch/exception.h"

#include "json.h"

using namespace std;


namespace Coderun {

Json::Value
parseJson(const std::string & text)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = false;
    unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value result;
    string errors;
    if (!reader->parse(text.data(), text.data() + text.size(),
                       &result, &errors)) {
        throw Coderun::Exception("invalid JSON: " + errors);
    }

    return result;
}

std::string
printJson(const Json::Value & value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

Json::Value
loadJsonFromFile(const std::string & filename)
{
    ifstream stream(filename);
    if (!stream) {
        throw Coderun::Exception(errno, "opening " + filename);
    }

    ostringstream contents;
    contents << stream.rdbuf();
    if (stream.bad()) {
        throw Coderun::Exception("error reading " + filename);
    }

    try {
        return parseJson(contents.str());
    }
    catch (const Coderun::Exception & exc) {
        throw Coderun::Exception("%s: %s", filename.c_str(), exc.what());
    }
}

const Json::Value &
jsonMember(const Json::Value & value, const char * fieldName,
           const char * object)
{
    if (!value.isObject() || !value.isMember(fieldName))
        throw Coderun::Exception("Expected field '%s' in '%s'",
                                 fieldName, object);

    return value[fieldName];
}

} // namespace Coderun
