#ifndef WEBPROBE_ELEMENTS_ELEMENT_HPP
#define WEBPROBE_ELEMENTS_ELEMENT_HPP

#include <string>
#include <map>
#include <memory>
#include <vector>
#include "../http/client/request_options.hpp"
#include "../http/client/transport.hpp"

namespace webprobe::elements {

    class auditor;

    /**
     * Base of every auditable page element (cookies, links, forms). Holds the
     * owner URL, the inputs payloads are injected into and the request
     * options carried along when the element is submitted.
     *
     * Copies are deep: a clone never shares inputs or options with its source,
     * so mutations can be dispatched concurrently. Only the auditor, which is
     * shared scan context, is referenced.
     */
    class element {
    public:
        using input_map = std::map<std::string, std::string>;

        explicit element(std::string url, std::string method = "get");
        virtual ~element() = default;

        [[nodiscard]] virtual std::shared_ptr<element> clone() const = 0;
        [[nodiscard]] virtual std::string type() const = 0;

        // owner url and submission target
        [[nodiscard]] const std::string& url() const;
        [[nodiscard]] const std::string& action() const;
        void set_action(std::string action);
        [[nodiscard]] const std::string& method() const;
        void set_method(std::string method);

        // inputs
        [[nodiscard]] const input_map& inputs() const;
        virtual void set_inputs(input_map inputs);
        [[nodiscard]] const input_map& original() const;

        // mutation provenance
        [[nodiscard]] const std::string& altered() const;
        void set_altered(std::string altered);
        [[nodiscard]] bool is_mutation() const;

        // scope checks are bypassed for elements that can't match a known input
        [[nodiscard]] bool scope_override() const;
        void override_instance_scope();

        // side channel merged into the request on submission
        [[nodiscard]] http::request_options& options();
        [[nodiscard]] const http::request_options& options() const;

        [[nodiscard]] const std::shared_ptr<auditor>& get_auditor() const;
        void set_auditor(std::shared_ptr<auditor> auditor);

        // true when not attached to an auditor with a live page
        [[nodiscard]] bool is_orphan() const;

        // identity used to drop duplicate elements
        [[nodiscard]] std::string id() const;

        // assembles the request for the current inputs and hands it to the transport
        void submit(http::transport& transport, http::response_callback callback) const;

    protected:
        element(const element& other) = default;
        element& operator=(const element& other) = default;

        // snapshot of the inputs, taken once the element is fully built
        void freeze_original();

        virtual void http_request(http::transport& transport, http::request_options options,
                                  http::response_callback callback) const;

    private:
        std::string url_;
        std::string action_;
        std::string method_;
        input_map inputs_;
        input_map original_;
        std::string altered_;
        bool scope_override_ = false;
        http::request_options options_;
        std::shared_ptr<auditor> auditor_;
    };

    using element_ptr = std::shared_ptr<element>;

    // keeps the first occurrence of every element id, preserving order
    std::vector<element_ptr> unique(const std::vector<element_ptr>& elements);

}

#endif
