// Copyright (c) 2009 - Mozy, Inc.

#include "predef.h"

#include "string.h"

namespace Rested {

std::vector<std::string>
split(const std::string &str, char delim)
{
    std::vector<std::string> result;
    if (str.empty())
        return result;
    size_t start = 0;
    while (true) {
        size_t end = str.find(delim, start);
        if (end == std::string::npos) {
            result.push_back(str.substr(start));
            return result;
        }
        result.push_back(str.substr(start, end - start));
        start = end + 1;
    }
}

std::string
trim(const std::string &str, const char *delimiters)
{
    size_t start = str.find_first_not_of(delimiters);
    if (start == std::string::npos)
        return std::string();
    size_t end = str.find_last_not_of(delimiters);
    return str.substr(start, end - start + 1);
}

std::string
join(const std::vector<std::string> &parts, const std::string &separator)
{
    std::string result;
    for (std::vector<std::string>::const_iterator it = parts.begin();
        it != parts.end();
        ++it) {
        if (it != parts.begin())
            result.append(separator);
        result.append(*it);
    }
    return result;
}

bool
caseinsensitiveless::operator ()(const std::string &lhs,
    const std::string &rhs) const
{
    return stricmp(lhs.c_str(), rhs.c_str()) < 0;
}

}
