#ifndef WEBPROBE_ELEMENTS_COOKIE_CODEC_HPP
#define WEBPROBE_ELEMENTS_COOKIE_CODEC_HPP

#include <string>
#include <string_view>

namespace webprobe::elements::cookie_codec {

    // escapes '+', ';', '%', '=' and NUL, then turns spaces into '+'
    std::string encode(std::string_view value);

    // turns '+' into spaces, then unescapes %XX sequences
    std::string decode(std::string_view value);

}

#endif
