#include "environ.hpp"

#include <stdlib.h>
#include <filesystem>
#include <string>

extern "C" char **environ;

namespace rat {
    Environ cenv;

    std::string getenv(const std::string& var) {
        const char* ptr = ::getenv(var.c_str());
        if(ptr == nullptr)
            return "";
        return ptr;
    }
    std::string getcwd() {
        return std::filesystem::current_path().string();
    }
    void setcwd(const std::string& path) {
        std::filesystem::current_path(path);
    }

    EnvironSetter::EnvironSetter(const std::string& name) {
        mName = name;
    }
    EnvironSetter::operator bool() const {
        if (mName.empty())
            return false;
        const char* value = ::getenv(mName.c_str());
        if (value == nullptr || !*value)
            return false;
        std::string str = value;
        return str != "0" && str != "false";
    }
    std::string EnvironSetter::to_string() {
        const char *value = ::getenv(mName.c_str());
        return value? value : "" ;
    }
    EnvironSetter &EnvironSetter::operator=(const std::string &str) {
        return *this = str.c_str();
    }

    EnvironSetter &EnvironSetter::operator=(const char* str) {
        if (str == nullptr || !*str) {
            unsetenv(mName.c_str());
        } else {
            setenv(mName.c_str(), str, true);
        }
        return *this;
    }
    EnvironSetter &EnvironSetter::operator=(int value) {
        return *this = std::to_string(value);
    }
    EnvironSetter &EnvironSetter::operator=(bool value) {
        return *this = value? "1" : "0";
    }


    EnvironSetter Environ::operator[](const std::string &name) {
        return {name};
    }


    EnvGuard::~EnvGuard() {
        auto new_env = current_env_copy();
        for(auto& var : new_env) {
            auto it = mEnv.find(var.first);
            if (it == mEnv.end()) {
                cenv[var.first] = nullptr;
            } else if (var.second != it->second) {
                cenv[it->first] = it->second;
            }
        }
        for (auto& var : mEnv) {
            cenv[var.first] = var.second;
        }
    }
    EnvMap current_env_copy() {
        EnvMap env;
        for (char** list = environ; *list; ++list) {
            char *name_start = *list;
            char *name_end = name_start;
            while (*name_end != '=' && *name_end)++name_end;
            if (*name_end != '=' || name_end == name_start)
                continue;
            std::string name(name_start, name_end);
            char *value = name_end+1;
            if (!*value)
                continue;
            env[name] = value;
        }
        return env;
    }
}
