#ifndef __RESTED_ASSERT_H__
#define __RESTED_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <exception>
#include <string>

#include <boost/config.hpp>
#include <boost/current_function.hpp>

#include "exception.h"
#include "log.h"
#include "version.h"

namespace Rested {

/// A RESTED_ASSERT failed while throwOnAssertion was set
struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    /// Set by the unit test runner; otherwise a failed assertion terminates
    static bool throwOnAssertion;

private:
    std::string m_expr;
};

/// Logs expr at FATAL with a backtrace, then throws Assertion or terminates
BOOST_NORETURN void assertionFailed(const char *expr, const char *function,
    const char *file, int line);

}

#endif

// No include guard; NDEBUG may differ between inclusions
#undef RESTED_ASSERT
#undef RESTED_NOTREACHED

#ifdef NDEBUG

#define RESTED_ASSERT(x) ((void)0)
#define RESTED_NOTREACHED() ::std::terminate()

#else

#define RESTED_ASSERT(x)                                                        \
    ((x) ? (void)0 : ::Rested::assertionFailed(# x, BOOST_CURRENT_FUNCTION,     \
        __FILE__, __LINE__))
#define RESTED_NOTREACHED()                                                     \
    ::Rested::assertionFailed("not reached", BOOST_CURRENT_FUNCTION,            \
        __FILE__, __LINE__)

#endif
