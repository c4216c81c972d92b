#include "url.hpp"
#include <regex>
#include <boost/lexical_cast.hpp>

namespace webprobe::http::util::url{

    namespace {
        constexpr char hex_chars[] = "0123456789ABCDEF";

        inline int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // scheme://[userinfo@]host[:port][path][?query][#fragment]
        const std::regex url_regex(
            R"(^([A-Za-z][A-Za-z0-9+.\-]*)://(?:[^@/?#]*@)?(\[[^\]]*\]|[^/?#:]*)(?::([0-9]*))?([^?#]*)(?:\?([^#]*))?(?:#(.*))?$)");
    }

    std::optional<parsed_url> parse(const std::string& url){
        std::smatch match;
        if(!std::regex_match(url, match, url_regex)){
            return std::nullopt;
        }

        parsed_url result;
        result.scheme = match[1].str();
        result.host = match[2].str();
        if(match[3].matched && match[3].length() > 0){
            try{
                result.port = boost::lexical_cast<uint16_t>(match[3].str());
            }catch(const boost::bad_lexical_cast&){
                return std::nullopt;
            }
        }
        result.path = match[4].str();
        result.query = match[5].str();
        result.fragment = match[6].str();
        return result;
    }

    std::string percent_escape(std::string_view value, std::string_view unsafe) {
        std::string result;
        result.reserve(value.size());

        for (char ch : value) {
            if (unsafe.find(ch) != std::string_view::npos) {
                auto c = static_cast<unsigned char>(ch);
                result += '%';
                result += hex_chars[c >> 4];
                result += hex_chars[c & 0x0F];
            } else {
                result += ch;
            }
        }

        return result;
    }

    std::string percent_unescape(std::string_view value) {
        std::string out;
        out.reserve(value.size());

        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '%' && i + 2 < value.size()) {
                int hi = hex_digit(value[i + 1]);
                int lo = hex_digit(value[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
            }
            out += value[i];
        }
        return out;
    }

}
