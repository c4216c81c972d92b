#include "link.hpp"

namespace webprobe::elements {

    link::link(std::string url, std::string action, input_map inputs) :
        element(std::move(url), "get")
    {
        set_action(std::move(action));
        set_inputs(std::move(inputs));
        freeze_original();
    }

    std::shared_ptr<element> link::clone() const{
        return std::make_shared<link>(*this);
    }

    std::string link::type() const{
        return "link";
    }

}
