#ifndef ARGSAFE_PLATFORM_HPP
#define ARGSAFE_PLATFORM_HPP

#include <string>
#include <string_view>
#include <vector>

#include "argsafe/config.h"

namespace argsafe {

    enum class platform
    {
        posix,
        windows,
    };

    inline constexpr platform host_platform =
#ifdef WIN32
        platform::windows;
#else
        platform::posix;
#endif

    // ".exe" on Windows, empty everywhere else.
    constexpr std::string_view executable_suffix(platform p = host_platform) noexcept {
        return p == platform::windows ? ".exe" : "";
    }

    // ".bat" on Windows, empty everywhere else.
    constexpr std::string_view batch_suffix(platform p = host_platform) noexcept {
        return p == platform::windows ? ".bat" : "";
    }

    std::string_view platform_name(platform p) noexcept;

    // "macOS", "iOS", otherwise capitalized ("linux" -> "Linux")
    std::string human_os_name(std::string_view os);

    // architectures release packages are built for on `os` ("linux", "macos", "windows")
    std::vector<std::string_view> release_architectures(std::string_view os);

    /* True when ARGSAFE_TESTING_VAR is set to "true" in the process environment.
       Tools use it to switch to test fixtures.
    */
    [[nodiscard]]
    bool is_testing();

} /* namespace argsafe */

#endif /* ARGSAFE_PLATFORM_HPP */
