#ifndef ARGSAFE_ESCAPE_HPP
#define ARGSAFE_ESCAPE_HPP

#include <string>
#include <string_view>

#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/iterator/traits.hpp>
#include <range/v3/view/subrange.hpp>

#include "platform.hpp"
#include "scanner.hpp"

namespace argsafe {

    // Single-quoted shell word. Embedded ' becomes '\''.
    std::string escape_posix_shell(std::string_view value);

    /* A single argument for programs that split their command line with the
       Microsoft C runtime rules.

       The value is double-quoted, embedded " are doubled and every % drops out
       of the quoted section ("%"). Backslashes are copied as-is, so see
       windows_argument_is_exact() for the values this can't represent.
    */
    std::string escape_windows_argument(std::string_view value);

    /* An argument for a native executable invoked from PowerShell.
       The C runtime form of the value, wrapped in PowerShell single quotes.
    */
    std::string escape_powershell(std::string_view value);

    std::string escape(std::string_view value, dialect d);

    /* False if escape_windows_argument(value) puts a run of backslashes right
       before a double quote (a backslash followed by ", by % or by the end of
       the value). The C runtime reads those back as escaped quotes.
    */
    [[nodiscard]]
    bool windows_argument_is_exact(std::string_view value) noexcept;

    // dialect of the shell commands are run through on `p`
    constexpr dialect shell_dialect(platform p = host_platform) noexcept {
        return p == platform::windows ? dialect::powershell : dialect::posix_shell;
    }


    CPP_template(class Rng)
        (requires ranges::range<Rng> && concepts::convertible_to<ranges::range_reference_t<Rng>, std::string_view>)
    std::string join_arguments(Rng&& rng, dialect d) {
        std::string line;
        for (auto&& arg : rng) {
            if (!line.empty())
                line += ' ';
            line += escape(std::string_view(arg), d);
        }

        return line;
    }

    CPP_template(class Iter)
        (requires concepts::convertible_to<ranges::iter_reference_t<Iter>, std::string_view>)
    std::string join_arguments(Iter begin, Iter end, dialect d) {
        return join_arguments(ranges::subrange(begin, end), d);
    }

} /* namespace argsafe */

#endif /* ARGSAFE_ESCAPE_HPP */
