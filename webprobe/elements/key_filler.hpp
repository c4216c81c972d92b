#ifndef WEBPROBE_ELEMENTS_KEY_FILLER_HPP
#define WEBPROBE_ELEMENTS_KEY_FILLER_HPP

#include <string>
#include "element.hpp"

namespace webprobe::elements::key_filler {

    // placeholder for an input called name, picked by name pattern
    std::string value_for(const std::string& name);

    // returns inputs with every empty value replaced by a placeholder
    element::input_map fill(element::input_map inputs);

}

#endif
