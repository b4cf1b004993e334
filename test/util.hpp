#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>


// the library's system layer, for setting up environments
namespace argsafe::sys
{
    std::string getenv(std::string_view key);
    void setenv(std::string_view key, std::string_view value);
    void rmenv(std::string_view key);
}

// reference parsers, used to read escaped values back

// words of a POSIX shell command line: '...' quoting, \ escapes, blank separators
std::vector<std::string> split_posix_shell(std::string_view line);

// argv as the Microsoft C runtime builds it from a command line
std::vector<std::string> split_windows_command_line(std::string_view line);

// contents of one PowerShell single-quoted string
std::string unquote_powershell(std::string_view token);
