/* output_relay.cc
   Copyright (c) 2026 The coderun authors.  All rights reserved.

*/

#include <string.h>

#include "coderun/utils/exc_check.h"

#include "output_relay.h"

using namespace std;


namespace {

const char replacementChar[] = "\xef\xbf\xbd";

/* Length of the sequence introduced by the given lead byte, 0 if the byte
   cannot start a sequence. */
int sequenceLength(unsigned char c)
{
    if (c < 0x80)
        return 1;
    if (c >= 0xc2 && c <= 0xdf)
        return 2;
    if (c >= 0xe0 && c <= 0xef)
        return 3;
    if (c >= 0xf0 && c <= 0xf4)
        return 4;
    return 0;
}

/* Is "c" valid as the continuation byte at "index" of a sequence started
   by "lead"?  The ranges of the second byte exclude overlong forms,
   surrogates and code points above U+10FFFF. */
bool validContinuation(unsigned char lead, int index, unsigned char c)
{
    if (index == 1) {
        if (lead == 0xe0) return c >= 0xa0 && c <= 0xbf;
        if (lead == 0xed) return c >= 0x80 && c <= 0x9f;
        if (lead == 0xf0) return c >= 0x90 && c <= 0xbf;
        if (lead == 0xf4) return c >= 0x80 && c <= 0x8f;
    }
    return c >= 0x80 && c <= 0xbf;
}

/* Where to cut a piece of "cut" bytes starting at "data" so that no UTF-8
   sequence is split: before the lead byte of a sequence that would extend
   past the cut, unless that sequence starts the piece. */
size_t pieceLength(const char * data, size_t cut)
{
    const unsigned char * p = (const unsigned char *)data;
    for (size_t back = 1; back <= 3 && back <= cut; back++) {
        unsigned char c = p[cut - back];
        if ((c & 0xc0) == 0x80)
            continue;
        if (sequenceLength(c) > (int)back && back < cut)
            return cut - back;
        break;
    }
    return cut;
}

} // file scope


namespace Coderun {

/*****************************************************************************/
/* OUTPUT RELAY                                                              */
/*****************************************************************************/

OutputRelay::
OutputRelay(const OnLine & onLine, const OnFault & onFault,
            size_t maxLineLength)
    : onLine_(onLine), onFault_(onFault), maxLineLength_(maxLineLength),
      closed_(false), sealed_(false), faulted_(false), linesForwarded_(0)
{
    ExcCheck(onLine_, "an output relay needs a line callback");
    ExcCheckGreater(maxLineLength_, 0u, "invalid maximum line length");
}

void
OutputRelay::
notifyReceived(std::string && data)
{
    if (sealed_ || faulted_ || closed_)
        return;

    if (buffer_.empty()) {
        buffer_ = move(data);
    }
    else {
        buffer_.append(data);
    }

    size_t start = 0;
    while (!sealed_ && !faulted_) {
        size_t eol = buffer_.find('\n', start);
        if (eol == string::npos) {
            if (buffer_.size() - start >= maxLineLength_) {
                size_t piece = pieceLength(buffer_.data() + start,
                                           maxLineLength_);
                forward(buffer_.data() + start, piece);
                start += piece;
                continue;
            }
            break;
        }
        size_t length = eol - start;
        while (length > maxLineLength_) {
            size_t piece = pieceLength(buffer_.data() + start,
                                       maxLineLength_);
            forward(buffer_.data() + start, piece);
            start += piece;
            length -= piece;
        }
        forward(buffer_.data() + start, length);
        start = eol + 1;
    }

    if (sealed_ || faulted_) {
        buffer_.clear();
    }
    else {
        buffer_.erase(0, start);
    }
}

void
OutputRelay::
notifyClosed()
{
    if (closed_)
        return;

    if (!sealed_ && !faulted_ && !buffer_.empty()) {
        forward(buffer_.data(), buffer_.size());
    }
    buffer_.clear();
    closed_ = true;
}

void
OutputRelay::
notifyError(const std::string & error)
{
    if (sealed_ || faulted_ || closed_)
        return;

    buffer_.clear();
    fault("read error: " + error);
}

void
OutputRelay::
seal()
{
    sealed_ = true;
    buffer_.clear();
}

void
OutputRelay::
forward(const char * start, size_t length)
{
    if (sealed_ || faulted_)
        return;

    string line = decodeUtf8(string(start, length));
    rstrip(line);
    if (line.empty())
        return;

    try {
        onLine_(move(line));
        linesForwarded_++;
    }
    catch (const std::exception & exc) {
        fault(exc.what());
    }
}

void
OutputRelay::
fault(const std::string & error)
{
    faulted_ = true;
    if (onFault_) {
        onFault_(error);
    }
}

std::string
OutputRelay::
decodeUtf8(const std::string & data)
{
    string result;
    result.reserve(data.size());

    const unsigned char * p = (const unsigned char *)data.data();
    size_t size = data.size();
    size_t i = 0;

    while (i < size) {
        unsigned char lead = p[i];
        int len = sequenceLength(lead);
        if (len == 1) {
            result.push_back(lead);
            i++;
            continue;
        }
        if (len == 0) {
            result.append(replacementChar);
            i++;
            continue;
        }

        /* A truncated or malformed sequence is replaced as a whole, up to
           the first byte that does not belong to it. */
        int valid = 1;
        while (valid < len && i + valid < size
               && validContinuation(lead, valid, p[i + valid])) {
            valid++;
        }
        if (valid == len) {
            result.append((const char *)p + i, len);
        }
        else {
            result.append(replacementChar);
        }
        i += valid;
    }

    return result;
}

void
OutputRelay::
rstrip(std::string & line)
{
    size_t end = line.size();
    while (end > 0 && line[end - 1] != '\0'
           && strchr(" \t\n\r\v\f", line[end - 1]) != nullptr) {
        end--;
    }
    line.resize(end);
}

} // namespace Coderun
