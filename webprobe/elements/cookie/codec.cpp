#include "codec.hpp"
#include "../../http/util/url.hpp"
#include <algorithm>

namespace webprobe::elements::cookie_codec {

    namespace {
        // NUL is part of the set, so the length has to be explicit
        constexpr std::string_view unsafe_chars("+;%=\0", 5);
    }

    std::string encode(std::string_view value){
        auto escaped = http::util::url::percent_escape(value, unsafe_chars);
        std::replace(escaped.begin(), escaped.end(), ' ', '+');
        return escaped;
    }

    std::string decode(std::string_view value){
        std::string spaced(value);
        std::replace(spaced.begin(), spaced.end(), '+', ' ');
        return http::util::url::percent_unescape(spaced);
    }

}
