#pragma once

#include <map>
#include <string>

#include "basic_types.hpp"

namespace rat {
    typedef std::map<std::string, std::string> EnvMap;

    /** Get the value of environment variable, empty if unset */
    std::string getenv(const std::string& var);

    /** Gets the current working directory of the process */
    std::string getcwd();
    /** Sets the current working directory of process. */
    void setcwd(const std::string& path);

    class EnvironSetter {
    public:
        EnvironSetter(const std::string& name);
        operator std::string() { return to_string(); }
        /** true if set to something other than "", "0" or "false" */
        explicit operator bool() const;
        std::string to_string();
        EnvironSetter &operator=(const std::string &str);
        EnvironSetter &operator=(const char* str);
        EnvironSetter &operator=(std::nullptr_t) { return *this = (const char*)0;}
        EnvironSetter &operator=(int value);
        EnvironSetter &operator=(bool value);
    private:
        std::string mName;
    };

    /** Used for working with environment variables */
    class Environ {
    public:
        EnvironSetter operator[](const std::string&);
    };

    /** Makes it easy to get/set environment variables.
        e.g. like so `rat::cenv["RAT_LOG"] = "debug";`
    */
    extern Environ cenv;

    /** Creates a copy of current environment variables and returns the map */
    EnvMap current_env_copy();

    /** Use this to put a guard for changing current working directory. On
        destruction the current working directory will be reset to as it was
        on construction.
    */
    class CwdGuard {
    public:
        CwdGuard() {
            mCwd = rat::getcwd();
        }
        ~CwdGuard() {
            rat::setcwd(mCwd);
        }

    private:
        std::string mCwd;
    };

    /** On destruction reset environment variables and current working directory
        to as it was on construction.
    */
    class EnvGuard : public CwdGuard {
    public:
        EnvGuard() {
            mEnv = current_env_copy();
        }
        ~EnvGuard();

    private:
        EnvMap mEnv;
    };
}
