#ifndef ARGSAFE_SCANNER_HPP
#define ARGSAFE_SCANNER_HPP

#include <cstddef>
#include <string_view>

#include <range/v3/view/facade.hpp>
#include <range/v3/iterator/default_sentinel.hpp>
#include <range/v3/algorithm/any_of.hpp>

namespace argsafe {

    // argument quoting rule sets
    enum class dialect
    {
        posix_shell,
        powershell,
        windows_crt,
    };

    /* Whether `ch` needs escaping under `d`.
       Only ASCII units are ever special, so scanning UTF-8 byte by byte
       never splits a multi-byte sequence.
    */
    constexpr bool is_special(char ch, dialect d) noexcept
    {
        switch (d)
        {
        case dialect::posix_shell:
        case dialect::powershell:
            return ch == '\'';
        case dialect::windows_crt:
            return ch == '"' || ch == '%';
        }
        return false;
    }

    struct code_unit
    {
        char value;
        bool special;
    };

    // view over the code units of a string, classified for one dialect
    class scanner : public ranges::view_facade<scanner, ranges::finite>
    {
        friend ranges::range_access;

        class cursor
        {
            char const* pos = nullptr;
            char const* last = nullptr;
            dialect rules = dialect::posix_shell;

        public:
            code_unit read() const noexcept { return { *pos, is_special(*pos, rules) }; }
            void next() noexcept { ++pos; }
            void prev() noexcept { --pos; }
            void advance(std::ptrdiff_t n) noexcept { pos += n; }

            bool equal(cursor const& other) const noexcept {
                return pos == other.pos;
            }
            bool equal(ranges::default_sentinel_t) const noexcept {
                return pos == last;
            }
            std::ptrdiff_t distance_to(cursor const& that) const noexcept {
                return that.pos - pos;
            }

            cursor() = default;
            cursor(std::string_view s, dialect d) noexcept
                : pos(s.data()), last(s.data() + s.size()), rules(d)
            {}
        };

        cursor begin_cursor() const noexcept { return cursor(m_value, m_dialect); }

    public:
        scanner() = default;
        scanner(std::string_view value, dialect d) noexcept : m_value(value), m_dialect(d)
        {}

        std::string_view value() const noexcept { return m_value; }
        dialect rules() const noexcept { return m_dialect; }

        [[nodiscard]]
        bool has_special() const {
            return ranges::any_of(*this, [](code_unit u) { return u.special; });
        }

    private:
        std::string_view m_value;
        dialect m_dialect = dialect::posix_shell;
    };

    static_assert(ranges::bidirectional_range<scanner>, "scanner is a bidirectional range.");

    inline scanner scan(std::string_view value, dialect d) noexcept {
        return scanner(value, d);
    }

} /* namespace argsafe */

#endif /* ARGSAFE_SCANNER_HPP */
