/* execution_session.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <vector>

#include "coderun/arch/exception.h"
#include "coderun/arch/format.h"
#include "coderun/service/logs.h"
#include "coderun/types/json.h"
#include "coderun/utils/exc_check.h"

#include "execution_session.h"

using namespace std;


namespace {

using namespace Coderun;

Logging::Category logs("Execution Session");
Logging::Category errors("Execution Session Error", logs);

} // file scope


namespace Coderun {

/*****************************************************************************/
/* EXECUTION SESSION                                                         */
/*****************************************************************************/

void
ExecutionSession::Channel::
sendJson(const Json::Value & message)
{
    if (closed)
        return;

    string frame = printJson(message);
    try {
        send(frame);
    }
    catch (const std::exception & exc) {
        LOG(errors) << "could not send frame, closing the session: "
                    << exc.what() << endl;
        closed = true;
    }
}

ExecutionSession::
ExecutionSession(ExecutionEngine & engine, const SendFrame & send,
                 int maxCodeLength)
    : engine_(engine), maxCodeLength_(maxCodeLength),
      channel_(make_shared<Channel>(send))
{
    ExcCheck(send, "a send callback is required");
    ExcCheckGreater(maxCodeLength_, 0, "invalid maximum code length");
}

ExecutionSession::
~ExecutionSession()
{
    close();
}

size_t
ExecutionSession::
characterCount(const std::string & text)
{
    size_t result = 0;
    for (unsigned char c: text) {
        if ((c & 0xc0) != 0x80) {
            ++result;
        }
    }
    return result;
}

void
ExecutionSession::
handleFrame(const std::string & frame)
{
    Json::Value message;
    try {
        message = parseJson(frame);
    }
    catch (const std::exception & exc) {
        LOG(logs) << "invalid JSON frame: " << exc.what() << endl;
        sendError("Invalid JSON format. Please send properly formatted"
                  " JSON data.");
        return;
    }

    try {
        string type = "execute";
        if (message.isObject() && message.isMember("type")) {
            type = message["type"].isString()
                ? message["type"].asString() : string();
        }

        if (message.isObject() && type == "execute") {
            handleExecute(message);
        }
        else if (message.isObject() && type == "stop") {
            handleStop(message);
        }
        else {
            sendError("Message format is invalid. Please send JSON with"
                      " 'type' and 'code' fields.");
        }
    }
    catch (const std::exception & exc) {
        LOG(errors) << "error processing frame: " << exc.what() << endl;
        sendError(string("Server error occurred: ") + exc.what()
                  + ". Please try again or contact support if the problem"
                  " persists.");
    }
}

void
ExecutionSession::
handleExecute(const Json::Value & message)
{
    const Json::Value & codeValue = message["code"];
    if (!codeValue.isString() || codeValue.asString().empty()) {
        sendError("Message format is invalid. Please send JSON with"
                  " 'type' and 'code' fields.");
        return;
    }

    string code = codeValue.asString();
    size_t length = characterCount(code);
    if (length > (size_t)maxCodeLength_) {
        sendError(format("%zu characters is greater than the %d characters"
                         " allowed. Please submit a shorter string.",
                         length, maxCodeLength_));
        return;
    }

    /* Events are sent while holding the channel lock, which also keeps the
       terminal event of the execution from being handled before it has
       been recorded as active. */
    weak_ptr<Channel> weakChannel(channel_);
    auto onEvent = [weakChannel] (const ExecutionEvent & event) {
        auto channel = weakChannel.lock();
        if (!channel)
            return;

        std::unique_lock<std::mutex> guard(channel->lock);
        if (event.isTerminal()) {
            channel->active.erase(event.executionId);
        }
        channel->sendJson(event.toJson());
    };

    std::unique_lock<std::mutex> guard(channel_->lock);
    if (channel_->closed)
        return;
    string id = engine_.submit(code, onEvent);
    channel_->active.insert(id);
}

void
ExecutionSession::
handleStop(const Json::Value & message)
{
    const Json::Value & idValue = message["execution_id"];
    if (!idValue.isString() || idValue.asString().empty()) {
        sendError("Message format is invalid. Please send JSON with"
                  " 'type' and 'execution_id' fields.");
        return;
    }
    string id = idValue.asString();

    bool owned;
    {
        std::unique_lock<std::mutex> guard(channel_->lock);
        owned = channel_->active.count(id);
    }

    bool stopped = owned && engine_.stop(id);

    Json::Value result;
    result["type"] = "stop_result";
    result["execution_id"] = id;
    result["stopped"] = stopped;

    std::unique_lock<std::mutex> guard(channel_->lock);
    channel_->sendJson(result);
}

void
ExecutionSession::
sendError(const std::string & message)
{
    Json::Value result;
    result["type"] = "error";
    result["message"] = message;

    std::unique_lock<std::mutex> guard(channel_->lock);
    channel_->sendJson(result);
}

void
ExecutionSession::
close()
{
    set<string> active;
    {
        std::unique_lock<std::mutex> guard(channel_->lock);
        if (channel_->closed && channel_->active.empty())
            return;
        channel_->closed = true;
        active = channel_->active;
    }

    for (const auto & id: active) {
        if (engine_.stop(id)) {
            LOG(logs) << "stopped execution " << id
                      << " of a closed session" << endl;
        }
    }
}

std::set<std::string>
ExecutionSession::
activeExecutions() const
{
    std::unique_lock<std::mutex> guard(channel_->lock);
    return channel_->active;
}

} // namespace Coderun
