#ifndef __RESTED_EXCEPTION_H__
#define __RESTED_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "predef.h"

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

#include "version.h"

namespace Rested {

typedef boost::error_info<struct tag_backtrace, std::vector<void *> > errinfo_backtrace;

/// Return addresses of the calling stack, innermost first
std::vector<void *> backtrace(int framesToSkip = 0);
/// One symbolized frame per line
std::string formatBacktrace(const std::vector<void *> &frames);
/// Used by boost::diagnostic_information()
std::string to_string(const errinfo_backtrace &bt);

/// Throws x with the throwing function, file, line and stack attached
#define RESTED_THROW_EXCEPTION(x)                                               \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                      \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::Rested::errinfo_backtrace(::Rested::backtrace())

struct Exception : virtual boost::exception, virtual std::exception {};

/// A system call failed; carries boost::errinfo_errno and
/// boost::errinfo_api_function
struct NativeException : virtual Exception {};
/// The Stream was already closed
struct StreamClosedException : virtual Exception {};

}

#endif
