#ifndef WEBPROBE_ELEMENTS_COOKIE_JAR_HPP
#define WEBPROBE_ELEMENTS_COOKIE_JAR_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include "cookie.hpp"
#include "parse_result.hpp"

namespace webprobe::elements {

/**
 * Reader of Netscape HTTP cookiejar files, one cookie per line:
 *
 *   domain <TAB> flag <TAB> path <TAB> secure <TAB> expires <TAB> name <TAB> value
 *
 * Blank lines and lines starting with '#' are ignored. The expires column
 * is optional: when it does not hold a valid expiry the line is read as
 *
 *   domain <TAB> flag <TAB> path <TAB> secure <TAB> name <TAB> value
 *
 * and the cookie is a session cookie. Lines with fewer than six columns
 * are skipped.
 */
class cookie_jar {
public:
    static parse_result from_file(const std::string& url, const std::filesystem::path& path);

    static parse_result parse(const std::string& url, std::istream& input);

    // std::nullopt for comments, blank and malformed lines
    static std::optional<cookie> parse_line(const std::string& url, std::string_view line);
};

} // namespace webprobe::elements

#endif
