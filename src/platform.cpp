#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "argsafe/platform.hpp"
#include "sys.hpp"

namespace {

    using arch_list = std::vector<std::string_view>;

    std::array<std::pair<std::string_view, arch_list>, 3> const os_archs = {{
        { "macos", { "x64", "arm64" } },
        { "linux", { "ia32", "x64", "arm", "arm64" } },
        { "windows", { "ia32", "x64" } },
    }};

} /* nameless namespace */

namespace argsafe {

std::string_view platform_name(platform p) noexcept
{
    switch (p)
    {
    case platform::posix:
        return "posix";
    case platform::windows:
        return "windows";
    }
    return "unknown";
}

std::string human_os_name(std::string_view os)
{
    if (os == "ios")
        return "iOS";
    if (os == "macos")
        return "macOS";

    std::string name{os};
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (!name.empty())
        name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));

    return name;
}

std::vector<std::string_view> release_architectures(std::string_view os)
{
    auto it = std::find_if(os_archs.begin(), os_archs.end(), [os](auto const& entry) {
        return entry.first == os;
    });

    return it != os_archs.end() ? it->second : arch_list{};
}

bool is_testing()
{
    return sys::getenv(ARGSAFE_TESTING_VAR) == "true";
}

} /* namespace argsafe */
