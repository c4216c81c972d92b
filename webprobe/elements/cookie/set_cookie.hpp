#ifndef WEBPROBE_ELEMENTS_SET_COOKIE_HPP
#define WEBPROBE_ELEMENTS_SET_COOKIE_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "attributes.hpp"
#include "cookie.hpp"
#include "parse_result.hpp"
#include "../../http/common/headers.hpp"
#include "../../http/common/http_response.hpp"
#include "../../html/document.hpp"

namespace webprobe::elements {

    class set_cookie_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Parser of Set-Cookie strings ("name=value; Path=/; Secure; ..."), as
     * found in response headers and in <meta http-equiv="Set-Cookie"> tags.
     *
     * Attribute names are case-insensitive. Path, Domain, Comment, CommentURL
     * and Port are kept as text, Expires is converted to a time, Max-Age and
     * Version to integers, and Secure, HttpOnly and Discard are flags. Only
     * an unparsable Expires fails the cookie; a non-numeric Max-Age or
     * Version is left unset.
     */
    class set_cookie {
    public:
        /**
         * Splits a header value folding several cookies with commas. A comma
         * only separates cookies when a "name=" follows it before the next ';'
         * or ',', which keeps "Expires=Thu, 01 Jan 1970 ..." in one piece.
         */
        static std::vector<std::string> split(std::string_view header);

        /**
         * Raw attributes of a single cookie string. The name is decoded, the
         * value is left for the cookie to decode.
         * Throws set_cookie_error without a name=value pair and
         * time_parse_error for an unparsable Expires.
         */
        static attribute_map parse_attributes(std::string_view cookie_string);

        /**
         * Cookies of one Set-Cookie string.
         * Throws set_cookie_error or time_parse_error if the string is malformed.
         */
        static std::vector<cookie> parse(const std::string& url, std::string_view set_cookie_string);

        /**
         * Cookies of every string, duplicates parsed once. All or nothing: a
         * single malformed string empties the result and sets its error.
         */
        static parse_result parse(const std::string& url, const std::vector<std::string>& set_cookie_strings);

        // cookies of the Set-Cookie headers, empty with the error set on failure
        static parse_result from_headers(const std::string& url, const http::headers& headers);

        /**
         * Cookies of the Set-Cookie meta tags of an HTML document. Returns
         * right away, without looking for tags, unless the markup has a head
         * mentioning "set-cookie". Empty with the error set on failure.
         */
        static parse_result from_document(const std::string& url, std::string_view markup);
        static parse_result from_document(const std::string& url, const html::document& document);

        /**
         * Union of the document and header cookies of a response, duplicates
         * dropped. Each source is all or nothing on its own: when one fails,
         * the result still holds the cookies of the other, and error carries
         * the first failure (document before headers). So a result may be
         * both non-empty and not ok().
         */
        static parse_result from_response(const http::http_response& response);
    };

}

#endif
