#ifndef WEBPROBE_HTTP_UTIL_URL_HPP
#define WEBPROBE_HTTP_UTIL_URL_HPP

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace webprobe::http::util::url{

    struct parsed_url {
        std::string scheme;
        std::string host;
        std::optional<uint16_t> port;
        std::string path;
        std::string query;
        std::string fragment;
    };

    // splits an absolute URL into its components, std::nullopt if it is not one
    std::optional<parsed_url> parse(const std::string& url);

    // percent-escapes every character of value found in unsafe (uppercase hex)
    std::string percent_escape(std::string_view value, std::string_view unsafe);

    // decodes %XX sequences, leaving malformed sequences untouched
    std::string percent_unescape(std::string_view value);

}

#endif
