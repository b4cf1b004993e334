// implementation helpers
#ifndef ARGSAFE_SRC_IMPL_HPP
#define ARGSAFE_SRC_IMPL_HPP

#include <string>
#include <string_view>

namespace impl {

// `in` as a JSON string literal, quotes included
inline std::string json_quote(std::string_view in)
{
    auto hex = [](unsigned v) -> char {
        return (v < 10) ? char('0' + v) : char('a' + (v - 10));
    };

    std::string out;
    out.reserve(in.size() + 2);
    out += '"';

    for (unsigned char c : in)
    {
        switch (c)
        {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b";  break;
        case '\f': out += "\\f";  break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if (c < 0x20) {
                out += "\\u00";
                out += hex((c >> 4) & 0xF);
                out += hex(c & 0xF);
            }
            else {
                out += static_cast<char>(c);
            }
        }
    }

    out += '"';
    return out;
}

} /* namespace impl */

#endif /* ARGSAFE_SRC_IMPL_HPP */
