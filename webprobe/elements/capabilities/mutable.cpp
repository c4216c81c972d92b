#include "mutable.hpp"
#include "../key_filler.hpp"
#include "../../util/logger.hpp"

namespace webprobe::elements {

    std::string basic_mutator::format(const std::string& payload, const std::string& original, injection_format format){
        switch(format){
            case injection_format::straight:
                return payload;
            case injection_format::append:
                return original + payload;
            case injection_format::null:
                return payload + '\0';
            case injection_format::semicolon:
                return ";" + payload;
        }
        return payload;
    }

    std::vector<element_ptr> basic_mutator::mutations(const element& source,
                                                      const std::string& payload,
                                                      const mutation_options& options,
                                                      const config::scan_options& scan) const{
        std::vector<element_ptr> variants;
        const auto& inputs = source.inputs();
        if(inputs.empty()){
            return variants;
        }

        auto filled = key_filler::fill(inputs);
        for(const auto& [name, value] : inputs){
            if(value == scan.seed) continue;

            for(auto f : options.formats){
                auto variant = source.clone();
                variant->set_altered(name);
                auto mutated = filled;
                mutated[name] = format(payload, filled[name], f);
                variant->set_inputs(std::move(mutated));
                variants.push_back(std::move(variant));
            }
        }

        auto result = unique(variants);
        LOG_TRACE("Generated {} {} mutations for {}", result.size(), source.type(), source.action());
        return result;
    }

}
