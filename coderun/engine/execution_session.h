/* execution_session.h                                             -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Adapter between a client connection exchanging JSON text frames and the
   execution engine.
*/

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <json/json.h>

#include "execution_engine.h"


namespace Coderun {

/*****************************************************************************/
/* EXECUTION SESSION                                                         */
/*****************************************************************************/

/** Handles the frames of one client connection:

    {"type": "execute", "code": "..."} submits the code, whose events are
    sent back as frames built by ExecutionEvent::toJson.  "type" defaults to
    "execute".

    {"type": "stop", "execution_id": "..."} stops one of the executions of
    this session and answers with
    {"type": "stop_result", "execution_id": "...", "stopped": bool}.

    Invalid frames and oversized code are answered with an "error" frame
    and never reach the engine.

    Frames may be sent from the engine's thread as well as from the thread
    calling handleFrame; "send" is never called concurrently.
*/

struct ExecutionSession {
    typedef std::function<void (const std::string & frame)> SendFrame;

    ExecutionSession(ExecutionEngine & engine, const SendFrame & send,
                     int maxCodeLength = 3000);
    ~ExecutionSession();

    void handleFrame(const std::string & frame);

    /** Stop every execution of the session.  No frame is sent afterwards. */
    void close();

    /** Executions of this session that have not ended yet. */
    std::set<std::string> activeExecutions() const;

    /** Number of characters of the UTF-8 encoded text. */
    static size_t characterCount(const std::string & text);

private:
    struct Channel {
        Channel(const SendFrame & send)
            : closed(false), send(send)
        {
        }

        void sendJson(const Json::Value & message);

        mutable std::mutex lock;
        bool closed;
        SendFrame send;
        std::set<std::string> active;
    };

    void handleExecute(const Json::Value & message);
    void handleStop(const Json::Value & message);
    void sendError(const std::string & message);

    ExecutionEngine & engine_;
    int maxCodeLength_;
    std::shared_ptr<Channel> channel_;
};

} // namespace Coderun
