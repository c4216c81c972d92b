#ifndef WEBPROBE_ELEMENTS_LINK_HPP
#define WEBPROBE_ELEMENTS_LINK_HPP

#include "element.hpp"

namespace webprobe::elements {

    // anchor with query parameters, always requested with GET
    class link : public element {
    public:
        link(std::string url, std::string action, input_map inputs);
        ~link() override = default;

        [[nodiscard]] std::shared_ptr<element> clone() const override;
        [[nodiscard]] std::string type() const override;
    };

}

#endif
