#ifndef ARGSAFE_URL_HPP
#define ARGSAFE_URL_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace argsafe {

    class bad_url : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /* scheme:[//[user_info@]host[:port]]path[?query][#fragment]
       Components are kept as written; nothing is percent-decoded.
    */
    struct url
    {
        std::string scheme;
        std::string user_info;
        std::string host;
        std::optional<std::uint16_t> port;
        std::string path;
        std::optional<std::string> query;
        std::optional<std::string> fragment;

        // whether the text had a "//" authority section
        bool has_authority = false;

        static url parse(std::string_view text);

        std::string str() const;
    };

    // replacement locations for rewrite_url_for_testing()
    struct host_overrides
    {
        // used for URLs ending in ".git"
        std::optional<std::string> git_host;
        // used for everything else, and for ".git" URLs without a git_host
        std::optional<std::string> host;

        // reads ARGSAFE_TEST_GIT_HOST_VAR and ARGSAFE_TEST_HOST_VAR, empty means unset
        static host_overrides from_environment();
    };

    /* Points `text` at a test fixture instead of the real server.

       The chosen override supplies scheme, host and port, and its path becomes
       the root the original path is rebased under. Query and fragment are kept.
       A "file" override also drops the user info, which Git rejects.
       Without an applicable override `text` is returned unchanged.

       Throws bad_url when the override (or, once an override applies, `text`)
       can't be parsed.
    */
    std::string rewrite_url_for_testing(std::string_view text, host_overrides const& overrides);

    // same, using host_overrides::from_environment()
    std::string rewrite_url_for_testing(std::string_view text);

} /* namespace argsafe */

#endif /* ARGSAFE_URL_HPP */
