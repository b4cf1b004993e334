#include <string>
#include <string_view>

#include "argsafe/escape.hpp"

using std::string; using std::string_view;

namespace {

    // output rarely grows by more than a few quotes
    string make_buffer(string_view value)
    {
        string out;
        out.reserve(value.size() + 4);
        return out;
    }

} /* nameless namespace */

namespace argsafe {

string escape_posix_shell(string_view value)
{
    auto out = make_buffer(value);

    out += '\'';
    for (auto unit : scan(value, dialect::posix_shell))
    {
        if (unit.special)
            out += R"('\'')";
        else
            out += unit.value;
    }
    out += '\'';

    return out;
}

string escape_windows_argument(string_view value)
{
    auto out = make_buffer(value);

    out += '"';
    for (auto unit : scan(value, dialect::windows_crt))
    {
        if (!unit.special) {
            out += unit.value;
        }
        else if (unit.value == '"') {
            out += R"("")";
        }
        else {
            // % can't be escaped inside quotes, but is literal outside them
            out += R"("%")";
        }
    }
    out += '"';

    return out;
}

string escape_powershell(string_view value)
{
    // the callee still splits its command line with the C runtime rules
    auto const native = escape_windows_argument(value);
    auto out = make_buffer(native);

    out += '\'';
    for (auto unit : scan(native, dialect::powershell))
    {
        if (unit.special)
            out += "''";
        else
            out += unit.value;
    }
    out += '\'';

    return out;
}

string escape(string_view value, dialect d)
{
    switch (d)
    {
    case dialect::posix_shell:
        return escape_posix_shell(value);
    case dialect::powershell:
        return escape_powershell(value);
    case dialect::windows_crt:
        return escape_windows_argument(value);
    }

    return escape_posix_shell(value);
}

bool windows_argument_is_exact(string_view value) noexcept
{
    bool after_backslash = false;

    for (auto unit : scan(value, dialect::windows_crt))
    {
        if (unit.special && after_backslash)
            return false;

        after_backslash = unit.value == '\\';
    }

    // the closing quote
    return !after_backslash;
}

} /* namespace argsafe */
