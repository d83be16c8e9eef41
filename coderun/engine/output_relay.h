/* output_relay.h                                                  -*- C++ -*-
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   Sink that turns the raw output of a unit into lines of text.
*/

#pragma once

#include <functional>
#include <string>

#include "coderun/service/sink.h"


namespace Coderun {

/*****************************************************************************/
/* OUTPUT RELAY                                                              */
/*****************************************************************************/

/** Splits the bytes it receives into lines and forwards each non-blank line,
    decoded as UTF-8 with invalid sequences replaced by U+FFFD and stripped
    of trailing whitespace.  A partial last line is forwarded when the
    stream is closed.

    Lines longer than "maxLineLength" bytes are forwarded in pieces, cut
    before any UTF-8 sequence that would straddle the limit.

    When the line callback throws, or the stream reports a read error, the
    relay reports it once through "onFault" and forwards nothing more.  Once
    sealed, the relay drops everything it receives.
*/

struct OutputRelay : public InputSink {
    typedef std::function<void (std::string && line)> OnLine;
    typedef std::function<void (const std::string & error)> OnFault;

    OutputRelay(const OnLine & onLine,
                const OnFault & onFault = nullptr,
                size_t maxLineLength = 65536);

    virtual void notifyReceived(std::string && data);
    virtual void notifyClosed();
    virtual void notifyError(const std::string & error);

    /** Stop forwarding, discarding anything buffered. */
    void seal();

    bool closed() const { return closed_; }
    bool sealed() const { return sealed_; }
    bool faulted() const { return faulted_; }

    /** Number of lines forwarded so far. */
    size_t linesForwarded() const { return linesForwarded_; }

    /** Replace every invalid UTF-8 sequence by U+FFFD. */
    static std::string decodeUtf8(const std::string & data);

    /** Strip trailing whitespace, as Python's str.rstrip does. */
    static void rstrip(std::string & line);

private:
    void forward(const char * start, size_t length);
    void fault(const std::string & error);

    OnLine onLine_;
    OnFault onFault_;
    size_t maxLineLength_;

    std::string buffer_;
    bool closed_;
    bool sealed_;
    bool faulted_;
    size_t linesForwarded_;
};

} // namespace Coderun
