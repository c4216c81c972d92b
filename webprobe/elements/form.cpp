#include "form.hpp"
#include <boost/algorithm/string/case_conv.hpp>

namespace webprobe::elements {

    form::form(std::string url, std::string action, std::string method, input_map inputs) :
        element(std::move(url), boost::algorithm::to_lower_copy(method))
    {
        set_action(std::move(action));
        set_inputs(std::move(inputs));
        freeze_original();
    }

    std::shared_ptr<element> form::clone() const{
        return std::make_shared<form>(*this);
    }

    std::string form::type() const{
        return "form";
    }

}
