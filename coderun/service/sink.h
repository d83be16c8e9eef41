/* sink.h                                                          -*- C++ -*-
   Wolfgang Sourdeau, September 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   A sink mechanism for receiving data from "pipes".
 */

#pragma once

#include <functional>
#include <string>
#include <utility>


namespace Coderun {

/* INPUTSINK

   A sink that provides a medium-independent interface for receiving data.

   The client is responsible for the resource management. The provider
   returns the appropriate InputSink for its operations.
 */

struct InputSink {
    virtual ~InputSink()
    {}

    /* Notify that data has been received and transfers it. */
    virtual void notifyReceived(std::string && data) = 0;

    /* Notify that the input has been closed and that data will not be
       received anymore. */
    virtual void notifyClosed(void) = 0;

    /* Notify that reading the input failed.  "notifyClosed" follows. */
    virtual void notifyError(const std::string & error)
    {}
};


/* NULLINPUTSINK

   An InputSink that discards everything.
 */

struct NullInputSink : public InputSink {
    virtual void notifyReceived(std::string && data);
    virtual void notifyClosed();
};


/* CALLBACKINPUTSINK

   An InputSink invoking a callback upon data reception.
 */

struct CallbackInputSink : public InputSink {
    typedef std::function<void(std::string && data)> OnData;
    typedef std::function<void()> OnClose;

    CallbackInputSink(const OnData & onData,
                      const OnClose & onClose = nullptr)
        : onData_(onData), onClose_(onClose)
    {}

    virtual void notifyReceived(std::string && data);
    virtual void notifyClosed();

private:
    OnData onData_;
    OnClose onClose_;
};


/* STRINGINPUTSINK

   An InputSink accumulating the data it receives, up to "maxSize" bytes.
   What comes beyond is dropped and the sink is marked as truncated.
 */

struct StringInputSink : public InputSink {
    StringInputSink(size_t maxSize = std::string::npos)
        : maxSize_(maxSize), truncated_(false), closed_(false)
    {}

    virtual void notifyReceived(std::string && data);
    virtual void notifyClosed();

    const std::string & data() const { return data_; }
    std::string && release() { return std::move(data_); }

    bool truncated() const { return truncated_; }
    bool closed() const { return closed_; }

private:
    size_t maxSize_;
    std::string data_;
    bool truncated_;
    bool closed_;
};

} // namespace Coderun
