#ifndef WEBPROBE_CONFIG_SCAN_OPTIONS_HPP
#define WEBPROBE_CONFIG_SCAN_OPTIONS_HPP

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace webprobe::config {

/**
 * Scanner-wide settings consumed by element auditing.
 *
 * JSON form:
 *   {
 *     "exclude_cookies": ["session_id", "csrf"],
 *     "audit_cookies_extensively": true,
 *     "seed": "c0ffee"
 *   }
 */
struct scan_options {
    // cookie names never audited
    std::vector<std::string> exclude_cookies;

    // also submit page links and forms carrying each cookie mutation
    bool audit_cookies_extensively = false;

    // marker value of flipped parameters, skipped by the generic mutator
    std::string seed = generate_seed();

    [[nodiscard]] bool is_cookie_excluded(const std::string& name) const;

    static scan_options from_json(const nlohmann::json& json);

    /**
     * Load options from a JSON file.
     * Throws std::runtime_error if the file cannot be read and
     * nlohmann::json::exception if it is not valid JSON.
     */
    static scan_options load(const std::filesystem::path& path);

    [[nodiscard]] nlohmann::json to_json() const;

    static std::string generate_seed();
};

} // namespace webprobe::config

#endif
