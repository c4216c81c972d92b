#ifndef WEBPROBE_ELEMENTS_COOKIE_ATTRIBUTES_HPP
#define WEBPROBE_ELEMENTS_COOKIE_ATTRIBUTES_HPP

#include <array>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <cstdint>
#include "expires.hpp"

namespace webprobe::elements {

    // std::monostate stands for an absent (nil) attribute
    using attribute_value = std::variant<std::monostate, std::string, bool, int64_t, time_point>;

    // raw attributes as produced by the parsers, keyed by attribute name
    using attribute_map = std::map<std::string, attribute_value>;

    class no_such_attribute : public std::out_of_range {
    public:
        explicit no_such_attribute(std::string_view name) :
            std::out_of_range("No such cookie attribute: '" + std::string(name) + "'") {}
    };

    namespace attribute {
        constexpr auto name         = "name";
        constexpr auto value        = "value";
        constexpr auto version      = "version";
        constexpr auto port         = "port";
        constexpr auto discard      = "discard";
        constexpr auto comment_url  = "comment_url";
        constexpr auto expires      = "expires";
        constexpr auto max_age      = "max_age";
        constexpr auto comment      = "comment";
        constexpr auto secure       = "secure";
        constexpr auto path         = "path";
        constexpr auto domain       = "domain";
        constexpr auto httponly     = "httponly";
    }

    /**
     * The fixed set of cookie attributes. Every attribute is always present;
     * those never supplied hold their default (version 0, httponly false,
     * everything else absent).
     */
    class attribute_set {
    public:
        attribute_set();

        static const std::array<std::string_view, 13>& names();
        static bool has(std::string_view name);

        // overwrites known attributes with the supplied ones, unknown keys are ignored
        void merge(const attribute_map& raw);

        // throw no_such_attribute for names outside the fixed set
        [[nodiscard]] const attribute_value& get(std::string_view name) const;
        void set(std::string_view name, attribute_value value);

        [[nodiscard]] bool is_absent(std::string_view name) const;

        // typed views, std::nullopt when absent or holding another type
        [[nodiscard]] std::optional<std::string> get_string(std::string_view name) const;
        [[nodiscard]] std::optional<bool> get_bool(std::string_view name) const;
        [[nodiscard]] std::optional<int64_t> get_integer(std::string_view name) const;
        [[nodiscard]] std::optional<time_point> get_time(std::string_view name) const;

        [[nodiscard]] const std::map<std::string, attribute_value, std::less<>>& values() const;

        bool operator==(const attribute_set& other) const = default;

    private:
        std::map<std::string, attribute_value, std::less<>> values_;
    };

}

#endif
