#include "headers.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include "../../util/logger.hpp"

namespace webprobe::http{

    headers::headers(std::initializer_list<http_header> items){
        for(const auto& [key, value] : items){
            add_header(key, value);
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    std::vector<std::string> headers::get_headers_with_key(std::string_view key) const{
        std::vector<std::string> values;
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                values.push_back(header.second);
            }
        }
        return values;
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    bool headers::remove_header(std::string_view key)
    {
        for(auto it=headers_.begin(); it!=headers_.end(); ++it){
            if(is_header(it->first, key)){
                headers_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool headers::empty_headers() const{
        return headers_.empty();
    }

    void headers::log(const char* scope) const{
        LOG_DEBUG("[{}] Headers:", scope);
        for(const auto& t: headers_){
            LOG_DEBUG("  {}: {}", t.first, t.second);
        }
    }

}
