#include "key_filler.hpp"
#include <regex>
#include <utility>
#include <vector>

namespace webprobe::elements::key_filler {

    namespace {
        const std::string default_value = "1";

        // checked in order, first match wins
        const std::vector<std::pair<std::regex, std::string>>& patterns(){
            static const std::vector<std::pair<std::regex, std::string>> table = [] {
                auto icase = std::regex::ECMAScript | std::regex::icase;
                return std::vector<std::pair<std::regex, std::string>>{
                    {std::regex("name", icase),     "webprobe_name"},
                    {std::regex("user|usr", icase), "webprobe_user"},
                    {std::regex("pass|pwd", icase), "5543!%webprobe_secret"},
                    {std::regex("mail", icase),     "webprobe@example.com"},
                    {std::regex("txt|text", icase), "webprobe_text"},
                    {std::regex("num|amount|qty|count", icase), "132"},
                    {std::regex("account", icase),  "12"},
                    {std::regex("id", icase),       "1"},
                };
            }();
            return table;
        }
    }

    std::string value_for(const std::string& name){
        for(const auto& [pattern, value] : patterns()){
            if(std::regex_search(name, pattern)){
                return value;
            }
        }
        return default_value;
    }

    element::input_map fill(element::input_map inputs){
        for(auto& [name, value] : inputs){
            if(value.empty()){
                value = value_for(name);
            }
        }
        return inputs;
    }

}
