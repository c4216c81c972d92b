#ifndef WEBPROBE_ELEMENTS_COOKIE_HPP
#define WEBPROBE_ELEMENTS_COOKIE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "attributes.hpp"
#include "expires.hpp"
#include "../element.hpp"
#include "../capabilities/auditable.hpp"
#include "../capabilities/mutable.hpp"

namespace webprobe::elements {

    /**
     * A cookie as a fuzzable input: a single name/value pair carried in the
     * Cookie request header, plus the attributes it was set with.
     *
     * Usage:
     *   cookie c("http://example.com/app", "session", "abc123");
     *   c.to_string();                              // "session=abc123"
     *   c.get_string(attribute::domain);            // "example.com"
     *
     *   auto variants = c.mutations("<script>", {.param_flip = true}, scan);
     */
    class cookie : public element, public auditable {
    public:
        /**
         * Builds a cookie owned by url from raw attributes.
         *
         * When raw holds a "name" entry the input pair is (name, value);
         * otherwise the first string entry whose key is not an attribute name
         * is taken as the pair. Missing attributes get their defaults, the value
         * is decoded, and path and domain fall back to those of the url.
         */
        cookie(std::string url, const attribute_map& raw = {},
               std::shared_ptr<const mutable_capability> mutator = nullptr);

        cookie(std::string url, const std::string& name, const std::string& value,
               std::shared_ptr<const mutable_capability> mutator = nullptr);

        cookie(const cookie& other) = default;
        cookie& operator=(const cookie& other) = default;
        ~cookie() override = default;

        [[nodiscard]] std::shared_ptr<element> clone() const override;
        [[nodiscard]] std::string type() const override;

        // attribute access, throwing no_such_attribute for unknown names
        [[nodiscard]] static bool has_attribute(std::string_view name);
        [[nodiscard]] const attribute_value& attribute(std::string_view name) const;
        [[nodiscard]] std::optional<std::string> get_string(std::string_view name) const;
        [[nodiscard]] const attribute_set& attributes() const;

        [[nodiscard]] std::string name() const;
        [[nodiscard]] std::string value() const;
        [[nodiscard]] std::optional<std::string> domain() const;
        [[nodiscard]] std::optional<std::string> path() const;
        [[nodiscard]] std::optional<time_point> expires_at() const;
        [[nodiscard]] std::optional<int64_t> max_age() const;
        [[nodiscard]] std::optional<int64_t> version() const;

        [[nodiscard]] bool is_secure() const;
        [[nodiscard]] bool is_http_only() const;
        [[nodiscard]] bool is_session() const;
        [[nodiscard]] bool is_expired(time_point reference = elements::now()) const;

        // the input pair
        [[nodiscard]] input_map simple() const;

        // keeps only the first pair and mirrors it into the name/value attributes
        void set_inputs(input_map inputs) override;

        // Cookie header form: encode(name)=encode(value)
        [[nodiscard]] std::string to_string() const;

        /**
         * Variants injecting payload: those of the generic mutator, a
         * parameter flip when requested and, when auditing extensively under a
         * live page, every link and form of the page carrying each variant.
         */
        [[nodiscard]] std::vector<element_ptr> mutations(const std::string& payload,
                                                         const mutation_options& options,
                                                         const config::scan_options& scan) const;

        // refuses excluded cookies, otherwise dispatches every mutation
        audit_result audit(const std::string& payload,
                           const mutation_options& options,
                           const config::scan_options& scan,
                           http::transport& transport,
                           mutation_callback callback) override;

        static std::string encode(std::string_view value);
        static std::string decode(std::string_view value);

    protected:
        // cookies travel in the Cookie header of a GET request
        void http_request(http::transport& transport, http::request_options options,
                          http::response_callback callback) const override;

    private:
        attribute_set attributes_;
        std::shared_ptr<const mutable_capability> mutator_;
    };

}

#endif
