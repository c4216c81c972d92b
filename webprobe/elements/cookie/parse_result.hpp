#ifndef WEBPROBE_ELEMENTS_COOKIE_PARSE_RESULT_HPP
#define WEBPROBE_ELEMENTS_COOKIE_PARSE_RESULT_HPP

#include <string>
#include <vector>
#include <cstddef>
#include "cookie.hpp"

namespace webprobe::elements {

/**
 * Outcome of extracting cookies from a cookiejar, header or document.
 */
struct parse_result {
    std::vector<cookie> cookies;
    std::string error;              // Empty if parsing succeeded
    size_t skipped = 0;             // Malformed lines or entries left out

    /**
     * Returns true if no error occurred. An ok result may still hold no
     * cookies when the source simply had none.
     */
    bool ok() const { return error.empty(); }

    /**
     * Conversion to bool for if(result) checks.
     */
    explicit operator bool() const { return ok(); }

    bool empty() const { return cookies.empty(); }

    size_t size() const { return cookies.size(); }
};

} // namespace webprobe::elements

#endif
