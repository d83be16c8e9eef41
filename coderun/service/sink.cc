/* sink.cc                                                         -*- C++ -*-
   Wolfgang Sourdeau, September 2013
   Copyright (c) 2013 Datacratic.  All rights reserved.
   Copyright (c) 2026 The coderun authors.  All rights reserved.

   A sink mechanism for receiving data from "pipes".
 */

#include "sink.h"


using namespace std;
using namespace Coderun;


/* NULLINPUTSINK */

void
NullInputSink::
notifyReceived(std::string && data)
{}

void
NullInputSink::
notifyClosed()
{}


/* CALLBACKINPUTSINK */

void
CallbackInputSink::
notifyReceived(std::string && data)
{
    onData_(move(data));
}

void
CallbackInputSink::
notifyClosed()
{
    if (onClose_) {
        onClose_();
    }
}


/* STRINGINPUTSINK */

void
StringInputSink::
notifyReceived(std::string && data)
{
    size_t room = maxSize_ - data_.size();
    if (data.size() > room) {
        data_.append(data, 0, room);
        truncated_ = true;
    }
    else if (data_.empty()) {
        data_ = move(data);
    }
    else {
        data_.append(data);
    }
}

void
StringInputSink::
notifyClosed()
{
    closed_ = true;
}
