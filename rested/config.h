#ifndef __RESTED_CONFIG_H__
#define __RESTED_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "predef.h"

#include <stdexcept>
#include <string>

#include <boost/lexical_cast.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/signals2/signal.hpp>

#include "assert.h"

namespace Rested {

/*
ConfigVars are named, typed settings that can be changed at runtime.

Names are lower case letters separated by "." ("http.compression.minsize").
Each one is declared exactly once, at namespace scope in the file that uses
it:

static ConfigVar<std::string>::ptr g_alternatives =
    Config::lookup<std::string>("http.alternatives",
        std::string("application/json"), "Representations offered");

Anything else (the command line, the environment, tests) finds it by name
with the non-template Config::lookup() and goes through fromString().
*/

class ConfigVarBase : boost::noncopyable
{
public:
    typedef boost::shared_ptr<ConfigVarBase> ptr;

public:
    ConfigVarBase(const std::string &name, const std::string &description)
        : m_name(name),
          m_description(description)
    {}
    virtual ~ConfigVarBase() {}

    const std::string &name() const { return m_name; }
    const std::string &description() const { return m_description; }

    virtual std::string toString() const = 0;
    /// @return false if str does not convert to the variable's type, or the
    /// new value was vetoed
    virtual bool fromString(const std::string &str) = 0;

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
private:
    /// A change goes ahead only if every beforeChange slot agrees
    struct Unanimous
    {
        typedef bool result_type;
        template <typename InputIterator>
        bool operator()(InputIterator first, InputIterator last) const
        {
            for (; first != last; ++first)
                if (!*first)
                    return false;
            return true;
        }
    };

public:
    typedef boost::shared_ptr<ConfigVar> ptr;

public:
    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description)
        : ConfigVarBase(name, description),
          m_val(defaultValue)
    {}

    /// Return false to veto a new value
    boost::signals2::signal<bool (const T &), Unanimous> beforeChange;
    boost::signals2::signal<void (const T &)> onChange;

    T val() const { return m_val; }
    bool val(const T &v)
    {
        if (v == m_val)
            return true;
        if (!beforeChange(v))
            return false;
        m_val = v;
        onChange(m_val);
        return true;
    }

    std::string toString() const
    {
        return boost::lexical_cast<std::string>(m_val);
    }

    bool fromString(const std::string &str)
    {
        T v;
        try {
            v = boost::lexical_cast<T>(str);
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
        return val(v);
    }

private:
    T m_val;
};

class Config
{
private:
    typedef boost::multi_index_container<
        ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
                boost::multi_index::const_mem_fun<ConfigVarBase,
                    const std::string &, &ConfigVarBase::name>
            >
        >
    > ConfigVarSet;

public:
    /// Declares a ConfigVar
    /// @throws std::invalid_argument if name is not made of lower case
    /// letters and "."
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        if (!isValidName(name))
            RESTED_THROW_EXCEPTION(std::invalid_argument(name));
        typename ConfigVar<T>::ptr var(new ConfigVar<T>(name, defaultValue,
            description));
        bool inserted = vars().insert(var).second;
        RESTED_ASSERT(inserted);
        return var;
    }

    /// @return The ConfigVar declared as name, or NULL
    static ConfigVarBase::ptr lookup(const std::string &name);

    static bool isValidName(const std::string &name);

    /// Applies "--name=value" and "--name value" arguments that name a
    /// ConfigVar, and removes them from argv
    ///
    /// argv[0] and everything from a "--" argument on are left alone.
    /// @throws std::invalid_argument (what() is the name) if the value is
    /// missing or is rejected
    static void loadFromCommandLine(int &argc, char *argv[]);

    /// Applies environment variables that name a ConfigVar once lower cased
    /// with "_" read as "." (HTTP_ALTERNATIVES sets http.alternatives)
    ///
    /// Rejected values are logged and skipped.
    static void loadFromEnvironment();

private:
    static ConfigVarSet &vars();
};

/// Sets a ConfigVar for the lifetime of this object, then puts back the
/// value it had before
class HijackConfigVar : boost::noncopyable
{
public:
    /// @throws std::invalid_argument if name is not a ConfigVar or rejects
    /// value
    HijackConfigVar(const std::string &name, const std::string &value);
    ~HijackConfigVar();

private:
    ConfigVarBase::ptr m_var;
    std::string m_previous;
};

}

#endif
