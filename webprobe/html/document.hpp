#ifndef WEBPROBE_HTML_DOCUMENT_HPP
#define WEBPROBE_HTML_DOCUMENT_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>

namespace webprobe::html {

    // a <meta> tag, attribute names lower-cased and values entity-decoded
    class meta_element {
    public:
        meta_element() = default;
        explicit meta_element(std::map<std::string, std::string> attributes);

        [[nodiscard]] bool has_attribute(std::string_view name) const;
        [[nodiscard]] const std::string& attribute(std::string_view name) const;
        [[nodiscard]] const std::map<std::string, std::string>& attributes() const;

    private:
        std::map<std::string, std::string> attributes_;
    };

    /**
     * Lightweight view over an HTML document exposing the elements the scanner
     * extracts from markup. Only <meta> tags are collected.
     */
    class document {
    public:
        document() = default;
        explicit document(std::vector<meta_element> meta);

        // collects every <meta> tag found in the markup
        static document parse(std::string_view markup);

        // text from the first "<head" up to the end of the last "</head>"
        static std::optional<std::string_view> head_region(std::string_view markup);

        [[nodiscard]] const std::vector<meta_element>& meta_elements() const;

        // meta tags whose http-equiv attribute equals value, case-insensitively
        [[nodiscard]] std::vector<meta_element> meta_with_http_equiv(std::string_view value) const;

        static std::string decode_entities(std::string_view text);

    private:
        std::vector<meta_element> meta_;
    };

}

#endif
