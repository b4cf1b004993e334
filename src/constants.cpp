#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>

#include <range/v3/algorithm/find_if.hpp>

#include "argsafe/constants.hpp"
#include "impl.hpp"

using std::string; using std::string_view;

namespace {

    using argsafe::constant_check;
    using argsafe::constant_violation;

    // mangled by cmd.exe style command line reassembly
    constexpr std::array<char, 6> windows_subprocess_chars = { '%', '<', '>', '|', '^', '&' };

    struct key_finder
    {
        string_view key;

        explicit key_finder(string_view k) : key(k) {}

        bool operator() (argsafe::constant_set::value_type const& entry) const noexcept
        {
            return entry.first == key;
        }
    };

    struct check_info
    {
        string_view where;
        string_view issue;
    };

    check_info describe(constant_check check) noexcept
    {
        switch (check)
        {
        case constant_check::windows_quote:
            return { "on Windows", "https://github.com/dart-lang/sdk/issues/46079" };
        case constant_check::windows_subprocess:
            return { "in Windows subprocess environments", "https://github.com/dart-lang/sdk/issues/46067" };
        case constant_check::compiled_executable:
            return { "when compiled into an executable", "https://github.com/dart-lang/sdk/issues/44995" };
        }
        return {};
    }

    std::optional<constant_violation>
    check_entry(string const& name, string const& value, argsafe::verify_options const& opts)
    {
        auto violation = [&](char offender, constant_check check) {
            return constant_violation{ name, value, offender, check };
        };

        if (opts.target == argsafe::platform::windows)
        {
            if (value.find('"') != string::npos)
                return violation('"', constant_check::windows_quote);

            if (opts.for_subprocess)
            {
                auto it = ranges::find_if(windows_subprocess_chars, [&](char ch) {
                    return value.find(ch) != string::npos;
                });
                if (it != windows_subprocess_chars.end())
                    return violation(*it, constant_check::windows_subprocess);
            }
        }

        if (opts.for_compiled_executable && value.find(',') != string::npos)
            return violation(',', constant_check::compiled_executable);

        return std::nullopt;
    }

} /* nameless namespace */

namespace argsafe {

constant_set::constant_set(std::initializer_list<value_type> init)
{
    for (auto const& [name, value] : init)
        set(name, value);
}

void constant_set::set(string_view name, string_view value)
{
    auto it = std::find_if(m_entries.begin(), m_entries.end(), key_finder(name));
    if (it != m_entries.end()) {
        it->second = string(value);
    }
    else {
        m_entries.emplace_back(string(name), string(value));
    }
}

auto constant_set::find(string_view name) const noexcept -> iterator
{
    return ranges::find_if(m_entries, key_finder(name));
}

string const& constant_set::at(string_view name) const
{
    auto it = find(name);
    if (it == end()) {
        throw std::out_of_range("no environment constant named " + impl::json_quote(name));
    }

    return it->second;
}


string constant_violation::message() const
{
    string const quote = offender == '"' ? "'\"'" : string{ '"', offender, '"' };

    auto const info = describe(check);

    string msg = "Environment constant " + impl::json_quote(name);
    msg += " contains " + quote;
    msg += " which is broken ";
    msg += info.where;
    msg += ".\nSee ";
    msg += info.issue;
    msg += "\nFull value: " + impl::json_quote(value);
    return msg;
}

invalid_environment_constant::invalid_environment_constant(constant_violation v)
    : std::runtime_error(v.message()), m_violation(std::move(v))
{}


std::optional<constant_violation>
find_environment_constant_violation(constant_set const& constants, verify_options const& opts)
{
    for (auto const& [name, value] : constants)
    {
        if (auto found = check_entry(name, value, opts))
            return found;
    }

    return std::nullopt;
}

void verify_environment_constants(constant_set const& constants, verify_options const& opts)
{
    if (auto found = find_environment_constant_violation(constants, opts))
        throw invalid_environment_constant(std::move(*found));
}

void verify_environment_constants(constant_set const& constants,
    bool for_subprocess, bool for_compiled_executable)
{
    verify_options opts;
    opts.for_subprocess = for_subprocess;
    opts.for_compiled_executable = for_compiled_executable;
    verify_environment_constants(constants, opts);
}

} /* namespace argsafe */
