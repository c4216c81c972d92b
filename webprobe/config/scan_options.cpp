#include "scan_options.hpp"
#include "../util/logger.hpp"
#include <algorithm>
#include <fstream>
#include <random>
#include <stdexcept>

namespace webprobe::config {

bool scan_options::is_cookie_excluded(const std::string& name) const {
    return std::find(exclude_cookies.begin(), exclude_cookies.end(), name) != exclude_cookies.end();
}

scan_options scan_options::from_json(const nlohmann::json& json) {
    scan_options options;
    if (!json.is_object()) {
        return options;
    }

    if (json.contains("exclude_cookies") && json["exclude_cookies"].is_array()) {
        for (const auto& name : json["exclude_cookies"]) {
            if (name.is_string()) {
                options.exclude_cookies.push_back(name.get<std::string>());
            }
        }
    }

    options.audit_cookies_extensively = json.value("audit_cookies_extensively", false);

    auto seed = json.value("seed", std::string{});
    if (!seed.empty()) {
        options.seed = std::move(seed);
    }

    return options;
}

scan_options scan_options::load(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open options file: " + path.string());
    }

    auto json = nlohmann::json::parse(ifs);
    LOG_DEBUG("Loaded scan options from {}", path.string());
    return from_json(json);
}

nlohmann::json scan_options::to_json() const {
    return {
        {"exclude_cookies", exclude_cookies},
        {"audit_cookies_extensively", audit_cookies_extensively},
        {"seed", seed}
    };
}

std::string scan_options::generate_seed() {
    static const char chars[] = "0123456789abcdef";

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

    std::string seed;
    for (int i = 0; i < 32; ++i) {
        seed += chars[dis(gen)];
    }

    return seed;
}

} // namespace webprobe::config
