#ifndef WEBPROBE_ELEMENTS_FORM_HPP
#define WEBPROBE_ELEMENTS_FORM_HPP

#include "element.hpp"

namespace webprobe::elements {

    // HTML form, submitted with its own method (GET or POST)
    class form : public element {
    public:
        form(std::string url, std::string action, std::string method, input_map inputs);
        ~form() override = default;

        [[nodiscard]] std::shared_ptr<element> clone() const override;
        [[nodiscard]] std::string type() const override;
    };

}

#endif
