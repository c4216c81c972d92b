#ifndef WEBPROBE_ELEMENTS_COOKIE_EXPIRES_HPP
#define WEBPROBE_ELEMENTS_COOKIE_EXPIRES_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace webprobe::elements {

    // second precision, so expiries up to year 9999 stay representable
    using time_point = std::chrono::sys_seconds;

    class time_parse_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Converts a cookie expiry to an absolute time.
     *
     * A purely numeric string with a positive value is taken as seconds since
     * the Unix epoch. Anything else must be an HTTP date: RFC 1123
     * ("Tue, 02 Oct 2012 19:25:57 GMT"), RFC 850 / Netscape
     * ("Tuesday, 02-Oct-12 19:25:57 GMT"), asctime ("Tue Oct  2 19:25:57 2012")
     * or ISO 8601 ("2012-10-02T19:25:57Z"). Dates without a zone are UTC.
     *
     * @return std::nullopt if the value is neither
     */
    std::optional<time_point> parse_expires(std::string_view expires);
    std::optional<time_point> parse_expires(int64_t seconds);

    // same as parse_expires, throws time_parse_error on failure
    time_point expires_to_time(std::string_view expires);
    time_point expires_to_time(int64_t seconds);

    // RFC 1123 representation, always GMT
    std::string format_http_date(time_point time);

    // current time at the precision of an expiry
    time_point now();

}

#endif
