#ifndef WEBPROBE_HTTP_HEADERS_HPP
#define WEBPROBE_HTTP_HEADERS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <initializer_list>

namespace webprobe::http {

    namespace header{
        constexpr auto cookie           = "Cookie";
        constexpr auto set_cookie       = "Set-Cookie";
        constexpr auto content_type     = "Content-Type";
        constexpr auto location         = "Location";
    }

    // ordered, multi-valued header collection with case-insensitive keys
    class headers {
    public:
        using http_header = std::pair<std::string, std::string>;

        headers() = default;
        headers(std::initializer_list<http_header> items);
        virtual ~headers() = default;

        void add_header(std::string key, std::string value);
        void set_header(std::string key, std::string value);
        bool remove_header(std::string_view key);

        [[nodiscard]] bool has_header(std::string_view key) const;
        [[nodiscard]] const std::string& get_header(std::string_view key) const;
        [[nodiscard]] std::vector<std::string> get_headers_with_key(std::string_view key) const;
        [[nodiscard]] const std::vector<http_header>& get_headers() const;
        [[nodiscard]] bool empty_headers() const;

        void log(const char* scope) const;

        static bool is_header(std::string_view key, std::string_view header);

    private:
        std::vector<http_header> headers_;
    };

}

#endif
