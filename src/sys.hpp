// system layer
#pragma once
#include <string>
#include <string_view>

namespace argsafe::sys
{
using std::string;
using std::string_view;

#ifdef WIN32
using envchar = wchar_t;
#else
using envchar = char;
#endif

// env
// An unset variable reads as the empty string.
string getenv(string_view key);
void setenv(string_view key, string_view value);
void rmenv(string_view key);

string narrow(envchar const* s);

} /* namespace argsafe::sys */
