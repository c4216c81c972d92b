#include "attributes.hpp"

namespace webprobe::elements {

    namespace {
        template<typename T>
        std::optional<T> as(const attribute_value& value){
            if(const auto* v = std::get_if<T>(&value)){
                return *v;
            }
            return std::nullopt;
        }
    }

    attribute_set::attribute_set(){
        for(auto name : names()){
            values_.emplace(std::string(name), std::monostate{});
        }
        values_[attribute::version] = int64_t{0};
        values_[attribute::httponly] = false;
    }

    const std::array<std::string_view, 13>& attribute_set::names(){
        static const std::array<std::string_view, 13> names = {
            attribute::name, attribute::value, attribute::version, attribute::port,
            attribute::discard, attribute::comment_url, attribute::expires, attribute::max_age,
            attribute::comment, attribute::secure, attribute::path, attribute::domain,
            attribute::httponly
        };
        return names;
    }

    bool attribute_set::has(std::string_view name){
        for(auto n : names()){
            if(n == name) return true;
        }
        return false;
    }

    void attribute_set::merge(const attribute_map& raw){
        for(const auto& [name, value] : raw){
            if(has(name)){
                values_[name] = value;
            }
        }
    }

    const attribute_value& attribute_set::get(std::string_view name) const{
        auto it = values_.find(name);
        if(it == values_.end()){
            throw no_such_attribute(name);
        }
        return it->second;
    }

    void attribute_set::set(std::string_view name, attribute_value value){
        auto it = values_.find(name);
        if(it == values_.end()){
            throw no_such_attribute(name);
        }
        it->second = std::move(value);
    }

    bool attribute_set::is_absent(std::string_view name) const{
        return std::holds_alternative<std::monostate>(get(name));
    }

    std::optional<std::string> attribute_set::get_string(std::string_view name) const{
        return as<std::string>(get(name));
    }

    std::optional<bool> attribute_set::get_bool(std::string_view name) const{
        return as<bool>(get(name));
    }

    std::optional<int64_t> attribute_set::get_integer(std::string_view name) const{
        return as<int64_t>(get(name));
    }

    std::optional<time_point> attribute_set::get_time(std::string_view name) const{
        return as<time_point>(get(name));
    }

    const std::map<std::string, attribute_value, std::less<>>& attribute_set::values() const{
        return values_;
    }

}
