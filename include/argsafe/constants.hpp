#ifndef ARGSAFE_CONSTANTS_HPP
#define ARGSAFE_CONSTANTS_HPP

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "platform.hpp"

namespace argsafe {

    /* Named string constants, kept in declaration order.
       Setting a name that is already present replaces its value in place.
    */
    class constant_set
    {
    public:
        using value_type = std::pair<std::string, std::string>;
        using iterator = std::vector<value_type>::const_iterator;
        using size_type = std::size_t;

        constant_set() = default;
        constant_set(std::initializer_list<value_type> init);

        void set(std::string_view name, std::string_view value);

        std::string const& at(std::string_view name) const;

        iterator find(std::string_view name) const noexcept;
        bool contains(std::string_view name) const noexcept { return find(name) != end(); }

        iterator begin() const noexcept { return m_entries.cbegin(); }
        iterator end() const noexcept { return m_entries.cend(); }
        iterator cbegin() const noexcept { return begin(); }
        iterator cend() const noexcept { return end(); }

        size_type size() const noexcept { return m_entries.size(); }

        [[nodiscard]]
        bool empty() const noexcept { return m_entries.empty(); }

    private:
        std::vector<value_type> m_entries;
    };


    // which rule a constant broke
    enum class constant_check
    {
        windows_quote,        // " anywhere, Windows only
        windows_subprocess,   // % < > | ^ & in a subprocess environment, Windows only
        compiled_executable,  // , in a value compiled into an executable
    };

    struct verify_options
    {
        bool for_subprocess = false;
        bool for_compiled_executable = false;
        platform target = host_platform;
    };

    struct constant_violation
    {
        std::string name;
        std::string value;
        char offender;
        constant_check check;

        std::string message() const;
    };

    class invalid_environment_constant : public std::runtime_error
    {
    public:
        explicit invalid_environment_constant(constant_violation v);

        std::string_view name() const noexcept { return m_violation.name; }
        std::string_view value() const noexcept { return m_violation.value; }
        char offender() const noexcept { return m_violation.offender; }
        constant_check check() const noexcept { return m_violation.check; }

    private:
        constant_violation m_violation;
    };


    /* First constant, in declaration order, that would be corrupted when used
       as described by `opts`. Each constant is checked against the Windows
       quote rule, then the Windows subprocess rule, then the comma rule.
    */
    [[nodiscard]]
    std::optional<constant_violation>
    find_environment_constant_violation(constant_set const& constants, verify_options const& opts);

    // throws invalid_environment_constant for the first violation
    void verify_environment_constants(constant_set const& constants, verify_options const& opts);

    void verify_environment_constants(constant_set const& constants,
        bool for_subprocess, bool for_compiled_executable);

} /* namespace argsafe */

#endif /* ARGSAFE_CONSTANTS_HPP */
