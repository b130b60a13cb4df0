// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <execinfo.h>
#include <stdlib.h>

#include <algorithm>
#include <sstream>

#include <boost/shared_ptr.hpp>

namespace Rested {

std::vector<void *>
backtrace(int framesToSkip)
{
    std::vector<void *> frames(64);
    int count = ::backtrace(&frames[0], (int)frames.size());
    frames.resize(count);
    // Leave out this function too
    size_t skip = std::min((size_t)count, (size_t)framesToSkip + 1);
    frames.erase(frames.begin(), frames.begin() + skip);
    return frames;
}

std::string
formatBacktrace(const std::vector<void *> &frames)
{
    if (frames.empty())
        return std::string();
    boost::shared_ptr<char *> symbols(backtrace_symbols(&frames[0],
        (int)frames.size()), &free);
    std::ostringstream os;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (symbols)
            os << symbols.get()[i];
        else
            os << frames[i];
        os << '\n';
    }
    return os.str();
}

std::string
to_string(const errinfo_backtrace &bt)
{
    return formatBacktrace(bt.value());
}

}
