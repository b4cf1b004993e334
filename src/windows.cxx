#define _CRT_SECURE_NO_WARNINGS
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX

#include <windows.h>

#include <string>
#include <string_view>
#include <system_error>

#include <cerrno>
#include <cstdlib>

#include "argsafe/config.h"
#include "sys.hpp"

using std::string; using std::wstring;
using std::string_view; using std::wstring_view;

namespace {

    constexpr UINT NARROW_CP =
#ifdef ARGSAFE_UTF8
        CP_UTF8;
#else
        CP_ACP;
#endif // ARGSAFE_UTF8

    [[noreturn]]
    void throw_win_error(DWORD error = GetLastError())
    {
        throw std::system_error(static_cast<int>(error), std::system_category());
    }

    auto narrow(wchar_t const* wstr, int wstr_l = -1, char* ptr = nullptr, int length = 0) {
        return WideCharToMultiByte(
            NARROW_CP, 0,
            wstr, wstr_l,
            ptr, length,
            nullptr, nullptr);
    }

    auto wide(const char* nstr, int nstr_l = -1, wchar_t* ptr = nullptr, int length = 0) {
        return MultiByteToWideChar(
            NARROW_CP, 0,
            nstr, nstr_l,
            ptr, length);
    }

    string to_narrow(wstring_view wstr) {
        if (wstr.empty())
            return {};

        auto length = narrow(wstr.data(), static_cast<int>(wstr.size()));
        auto str = string(length, '*');
        auto result = narrow(wstr.data(), static_cast<int>(wstr.size()), str.data(), length);

        if (result == 0)
            throw_win_error();

        str.resize(result);
        return str;
    }

    wstring to_wide(string_view nstr) {
        if (nstr.empty())
            return {};

        auto length = wide(nstr.data(), static_cast<int>(nstr.size()));
        auto wstr = wstring(length, L'*');
        auto result = wide(nstr.data(), static_cast<int>(nstr.size()), wstr.data(), length);

        if (result == 0)
            throw_win_error();

        wstr.resize(result);
        return wstr;
    }

} /* nameless namespace */

namespace argsafe::sys {

string getenv(string_view k)
{
    auto wkey = to_wide(k);
    auto* var = _wgetenv(wkey.c_str());
    return narrow(var);
}

void setenv(string_view k, string_view v)
{
    auto wkey = to_wide(k);
    auto wvalue = to_wide(v);
    if (_wputenv_s(wkey.c_str(), wvalue.c_str()) != 0)
        throw std::system_error(errno, std::generic_category());
}

void rmenv(string_view k)
{
    // an empty value removes the variable
    auto wkey = to_wide(k);
    if (_wputenv_s(wkey.c_str(), L"") != 0)
        throw std::system_error(errno, std::generic_category());
}

string narrow(envchar const* s)
{
    return s ? to_narrow(s) : "";
}

} /* namespace argsafe::sys */
