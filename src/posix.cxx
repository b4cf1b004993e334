#include <string>
#include <string_view>

#include <cstdlib>

#include "sys.hpp"

using std::string; using std::string_view;

namespace argsafe::sys {

string getenv(string_view k)
{
    string key{k};
    char const* val = ::getenv(key.c_str());
    return narrow(val);
}

void setenv(string_view k, string_view v)
{
    string key{k}, value{v};
    ::setenv(key.c_str(), value.c_str(), true);
}

void rmenv(string_view k)
{
    string key{k};
    ::unsetenv(key.c_str());
}

string narrow(envchar const* s)
{
    return s ? s : "";
}

} /* namespace argsafe::sys */
