// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <ctype.h>

#include <algorithm>
#include <vector>

extern char **environ;

namespace Rested {

static Logger::ptr g_log = Log::lookup("rested:config");

Config::ConfigVarSet &
Config::vars()
{
    static ConfigVarSet vars;
    return vars;
}

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::iterator it = vars().find(name);
    if (it == vars().end())
        return ConfigVarBase::ptr();
    return *it;
}

bool
Config::isValidName(const std::string &name)
{
    return !name.empty() &&
        name.find_first_not_of("abcdefghijklmnopqrstuvwxyz.") ==
        std::string::npos;
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    if (argc <= 1)
        return;
    std::vector<char *> remaining(argv, argv + 1);
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--")
            break;
        if (arg.compare(0, 2, "--") != 0) {
            remaining.push_back(argv[i]);
            continue;
        }
        size_t equals = arg.find('=');
        std::string name = arg.substr(2,
            equals == std::string::npos ? std::string::npos : equals - 2);
        ConfigVarBase::ptr var = lookup(name);
        if (!var) {
            remaining.push_back(argv[i]);
            continue;
        }
        std::string value;
        if (equals != std::string::npos) {
            value = arg.substr(equals + 1);
        } else {
            if (i + 1 == argc)
                RESTED_THROW_EXCEPTION(std::invalid_argument(name));
            value = argv[++i];
        }
        if (!var->fromString(value))
            RESTED_THROW_EXCEPTION(std::invalid_argument(name));
        RESTED_LOG_VERBOSE(g_log) << name << " = " << var->toString()
            << " (command line)";
    }
    for (; i < argc; ++i)
        remaining.push_back(argv[i]);
    std::copy(remaining.begin(), remaining.end(), argv);
    argc = (int)remaining.size();
    argv[argc] = NULL;
}

void
Config::loadFromEnvironment()
{
    if (!environ)
        return;
    for (char **env = environ; *env; ++env) {
        std::string entry(*env);
        size_t equals = entry.find('=');
        if (equals == std::string::npos || equals == 0)
            continue;
        std::string name = entry.substr(0, equals);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);
        std::replace(name.begin(), name.end(), '_', '.');
        if (!isValidName(name))
            continue;
        ConfigVarBase::ptr var = lookup(name);
        if (!var)
            continue;
        if (var->fromString(entry.substr(equals + 1)))
            RESTED_LOG_VERBOSE(g_log) << name << " = " << var->toString()
                << " (environment)";
        else
            RESTED_LOG_WARNING(g_log) << "ignoring invalid value for " << name
                << " from the environment";
    }
}

HijackConfigVar::HijackConfigVar(const std::string &name,
    const std::string &value)
    : m_var(Config::lookup(name))
{
    if (!m_var)
        RESTED_THROW_EXCEPTION(std::invalid_argument(name));
    m_previous = m_var->toString();
    if (!m_var->fromString(value))
        RESTED_THROW_EXCEPTION(std::invalid_argument(name));
}

HijackConfigVar::~HijackConfigVar()
{
    if (!m_var->fromString(m_previous))
        RESTED_LOG_WARNING(g_log) << "unable to restore " << m_var->name()
            << " to " << m_previous;
}

}
