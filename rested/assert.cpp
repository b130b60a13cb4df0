// Copyright (c) 2010 - Mozy, Inc.

#include "assert.h"

namespace Rested {

bool Assertion::throwOnAssertion;

void
assertionFailed(const char *expr, const char *function, const char *file,
    int line)
{
    // Not a static; assertions can fire during static initialization
    Log::lookup("rested:assert")->log(Log::FATAL, file, line).os()
        << "ASSERTION: " << expr << " in " << function << "\nbacktrace:\n"
        << formatBacktrace(backtrace(1));
    if (Assertion::throwOnAssertion)
        throw boost::enable_current_exception(
            boost::enable_error_info(Assertion(expr)))
            << boost::throw_function(function)
            << boost::throw_file(file)
            << boost::throw_line(line)
            << errinfo_backtrace(backtrace(1));
    std::terminate();
}

}
