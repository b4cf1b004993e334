#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/split.hpp>

#include "argsafe/config.h"
#include "argsafe/url.hpp"
#include "sys.hpp"

using std::string; using std::string_view;

namespace {

    bool starts_with(string_view s, string_view prefix) noexcept
    {
        return s.substr(0, prefix.size()) == prefix;
    }

    bool ends_with(string_view s, string_view suffix) noexcept
    {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    string lowercase(string_view s)
    {
        string out{s};
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        return out;
    }

    [[noreturn]]
    void throw_bad_url(string_view what, string_view text)
    {
        throw argsafe::bad_url(string(what) + " in URL \"" + string(text) + '"');
    }

    // ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    bool valid_scheme(string_view s)
    {
        if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front())))
            return false;

        return ranges::all_of(s, [](unsigned char ch) {
            return std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.';
        });
    }

    std::uint16_t parse_port(string_view port, string_view text)
    {
        unsigned value = 0;
        auto const* first = port.data();
        auto const* last = port.data() + port.size();
        auto [ptr, ec] = std::from_chars(first, last, value);

        if (ec != std::errc() || ptr != last || value > 0xFFFF)
            throw_bad_url("invalid port \"" + string(port) + '"', text);

        return static_cast<std::uint16_t>(value);
    }

    // `path` relative to "/", with "." and ".." segments resolved
    string relative_to_root(string_view path)
    {
        using namespace ranges;

        std::vector<string> segments;
        for (auto&& part : path | views::split('/'))
        {
            auto segment = to<string>(part);
            if (segment.empty() || segment == ".")
                continue;

            if (segment == "..") {
                if (!segments.empty())
                    segments.pop_back();
                continue;
            }

            segments.push_back(std::move(segment));
        }

        return segments | views::join('/') | to<string>();
    }

    string join_path(string const& base, string const& relative)
    {
        // the override root itself, as a directory
        if (relative.empty()) {
            if (base.empty())
                return "/";
            return base.back() == '/' ? base : base + '/';
        }
        if (base.empty())
            return '/' + relative;
        if (base.back() == '/')
            return base + relative;

        return base + '/' + relative;
    }

    std::optional<string> env_override(char const* key)
    {
        auto value = argsafe::sys::getenv(key);
        if (value.empty())
            return std::nullopt;

        return value;
    }

} /* nameless namespace */

namespace argsafe {

url url::parse(string_view text)
{
    url u;
    string_view rest = text;

    if (auto hash = rest.find('#'); hash != string_view::npos) {
        u.fragment = string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != string_view::npos) {
        u.query = string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    auto const colon = rest.find(':');
    if (colon != string_view::npos && colon < rest.find('/'))
    {
        auto scheme = rest.substr(0, colon);
        if (!valid_scheme(scheme))
            throw_bad_url("invalid scheme \"" + string(scheme) + '"', text);

        u.scheme = lowercase(scheme);
        rest.remove_prefix(colon + 1);
    }

    if (starts_with(rest, "//"))
    {
        u.has_authority = true;
        rest.remove_prefix(2);

        auto const path_start = std::min(rest.find('/'), rest.size());
        auto authority = rest.substr(0, path_start);
        rest.remove_prefix(path_start);

        if (auto at = authority.rfind('@'); at != string_view::npos) {
            u.user_info = string(authority.substr(0, at));
            authority.remove_prefix(at + 1);
        }

        string_view host = authority, port;
        bool has_port = false;

        if (starts_with(authority, "["))
        {
            // IPv6 literal
            auto const close = authority.find(']');
            if (close == string_view::npos)
                throw_bad_url("unterminated IPv6 address", text);

            host = authority.substr(0, close + 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':')
                    throw_bad_url("unexpected characters after IPv6 address", text);
                has_port = true;
                port = after.substr(1);
            }
        }
        else if (auto sep = authority.rfind(':'); sep != string_view::npos)
        {
            host = authority.substr(0, sep);
            has_port = true;
            port = authority.substr(sep + 1);
        }

        u.host = lowercase(host);
        if (has_port && !port.empty())
            u.port = parse_port(port, text);
    }

    u.path = string(rest);
    return u;
}

string url::str() const
{
    string out;

    if (!scheme.empty()) {
        out += scheme;
        out += ':';
    }

    if (has_authority || scheme == "file" || !host.empty() || !user_info.empty() || port)
    {
        out += "//";
        if (!user_info.empty()) {
            out += user_info;
            out += '@';
        }
        out += host;
        if (port) {
            out += ':';
            out += std::to_string(*port);
        }
    }

    out += path;

    if (query) {
        out += '?';
        out += *query;
    }
    if (fragment) {
        out += '#';
        out += *fragment;
    }

    return out;
}


host_overrides host_overrides::from_environment()
{
    host_overrides overrides;
    overrides.git_host = env_override(ARGSAFE_TEST_GIT_HOST_VAR);
    overrides.host = env_override(ARGSAFE_TEST_HOST_VAR);
    return overrides;
}

string rewrite_url_for_testing(string_view text, host_overrides const& overrides)
{
    auto const& chosen = ends_with(text, ".git") && overrides.git_host
        ? overrides.git_host
        : overrides.host;

    if (!chosen)
        return string(text);

    auto const base = url::parse(*chosen);
    auto result = url::parse(text);

    result.scheme = base.scheme;
    result.host = base.host;
    result.port = base.port;
    result.has_authority = base.has_authority;
    result.path = join_path(base.path, relative_to_root(result.path));

    // git refuses file: URLs that carry user info
    if (base.scheme == "file")
        result.user_info.clear();

    return result.str();
}

string rewrite_url_for_testing(string_view text)
{
    return rewrite_url_for_testing(text, host_overrides::from_environment());
}

} /* namespace argsafe */
