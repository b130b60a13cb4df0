#ifndef __RESTED_STRING_H__
#define __RESTED_STRING_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include "version.h"

namespace Rested {

/// Splits str at every delim; empty fields are kept, and an empty str gives
/// no fields at all
std::vector<std::string> split(const std::string &str, char delim);

/// Strips leading and trailing characters in delimiters (space and tab by
/// default)
std::string trim(const std::string &str, const char *delimiters = " \t");

std::string join(const std::vector<std::string> &parts,
    const std::string &separator);

/// Orders header names and the like without regard to case
struct caseinsensitiveless
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

}

#endif
