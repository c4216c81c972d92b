#include "set_cookie.hpp"
#include "codec.hpp"
#include "../../util/logger.hpp"
#include <unordered_set>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace webprobe::elements {

    namespace {

        // quoted values ("1") are accepted, anything else non-numeric leaves the attribute unset
        std::optional<int64_t> to_integer(const std::string& attribute, const std::string& value){
            auto text = boost::algorithm::trim_copy_if(value, boost::is_any_of("\""));
            try{
                return boost::lexical_cast<int64_t>(text);
            }catch(const boost::bad_lexical_cast&){
                LOG_DEBUG("Ignoring invalid {} value: '{}'", attribute, value);
                return std::nullopt;
            }
        }

        std::pair<std::string, std::optional<std::string>> split_pair(const std::string& part){
            auto eq_pos = part.find('=');
            if(eq_pos == std::string::npos){
                return {boost::algorithm::trim_copy(part), std::nullopt};
            }
            return {boost::algorithm::trim_copy(part.substr(0, eq_pos)),
                    boost::algorithm::trim_copy(part.substr(eq_pos + 1))};
        }

    }

    std::vector<std::string> set_cookie::split(std::string_view header){
        std::vector<std::string> cookies;
        std::string current;

        for(std::string_view::size_type i = 0; i < header.size(); ++i){
            char c = header[i];
            if(c != ','){
                current += c;
                continue;
            }

            bool separates = (i + 1 == header.size());
            for(auto j = i + 1; !separates && j < header.size(); ++j){
                if(header[j] == ';' || header[j] == ',') break;
                if(header[j] == '=') separates = true;
            }

            if(separates){
                boost::algorithm::trim(current);
                if(!current.empty()) cookies.push_back(std::move(current));
                current.clear();
            }else{
                current += c;
            }
        }

        boost::algorithm::trim(current);
        if(!current.empty()) cookies.push_back(std::move(current));
        return cookies;
    }

    attribute_map set_cookie::parse_attributes(std::string_view cookie_string){
        std::vector<std::string> parts;
        std::string input(cookie_string);
        boost::split(parts, input, boost::is_any_of(";"));

        auto [name, value] = split_pair(parts.front());
        if(!value){
            throw set_cookie_error("Missing '=' in cookie: '" + input + "'");
        }

        attribute_map raw;
        raw[attribute::name] = cookie_codec::decode(name);
        raw[attribute::value] = *value;

        for(size_t i = 1; i < parts.size(); ++i){
            auto [key, raw_value] = split_pair(parts[i]);
            if(key.empty()) continue;
            auto text = raw_value.value_or("");

            auto lower = boost::algorithm::to_lower_copy(key);
            if(lower == "path"){
                raw[attribute::path] = text;
            }else if(lower == "domain"){
                raw[attribute::domain] = text;
            }else if(lower == "expires"){
                raw[attribute::expires] = expires_to_time(text);
            }else if(lower == "max-age"){
                if(auto seconds = to_integer(key, text)) raw[attribute::max_age] = *seconds;
            }else if(lower == "version"){
                if(auto version = to_integer(key, text)) raw[attribute::version] = *version;
            }else if(lower == "comment"){
                raw[attribute::comment] = text;
            }else if(lower == "commenturl"){
                raw[attribute::comment_url] = text;
            }else if(lower == "port"){
                raw[attribute::port] = text;
            }else if(lower == "secure"){
                raw[attribute::secure] = true;
            }else if(lower == "httponly"){
                raw[attribute::httponly] = true;
            }else if(lower == "discard"){
                raw[attribute::discard] = true;
            }else{
                LOG_TRACE("Ignoring unknown cookie attribute '{}'", key);
            }
        }

        return raw;
    }

    std::vector<cookie> set_cookie::parse(const std::string& url, std::string_view set_cookie_string){
        std::vector<cookie> cookies;
        for(const auto& single : split(set_cookie_string)){
            cookies.emplace_back(url, parse_attributes(single));
        }
        return cookies;
    }

    parse_result set_cookie::parse(const std::string& url, const std::vector<std::string>& set_cookie_strings){
        parse_result result;
        std::unordered_set<std::string> seen;

        try{
            for(const auto& str : set_cookie_strings){
                if(!seen.insert(str).second) continue;
                for(auto& c : parse(url, std::string_view(str))){
                    result.cookies.push_back(std::move(c));
                }
            }
        }catch(const std::exception& e){
            // all or nothing
            result.cookies.clear();
            result.error = e.what();
        }

        return result;
    }

    parse_result set_cookie::from_headers(const std::string& url, const http::headers& headers){
        auto strings = headers.get_headers_with_key(http::header::set_cookie);
        if(strings.empty()){
            return {};
        }

        auto result = parse(url, strings);
        if(!result){
            LOG_WARNING("Discarding Set-Cookie headers from {}: {}", url, result.error);
            headers.log("set-cookie");
        }
        return result;
    }

    parse_result set_cookie::from_document(const std::string& url, std::string_view markup){
        // most documents set no cookies, so avoid parsing unless the head mentions one
        auto head = html::document::head_region(markup);
        if(!head || !boost::algorithm::icontains(*head, "set-cookie")){
            return {};
        }

        return from_document(url, html::document::parse(*head));
    }

    parse_result set_cookie::from_document(const std::string& url, const html::document& document){
        parse_result result;
        try{
            for(const auto& meta : document.meta_with_http_equiv("set-cookie")){
                for(auto& c : parse(url, std::string_view(meta.attribute("content")))){
                    result.cookies.push_back(std::move(c));
                }
            }
        }catch(const std::exception& e){
            result.cookies.clear();
            result.error = e.what();
            LOG_WARNING("Discarding Set-Cookie meta tags from {}: {}", url, result.error);
        }
        return result;
    }

    parse_result set_cookie::from_response(const http::http_response& response){
        const auto& url = response.get_effective_url();
        auto from_body = from_document(url, response.get_content());
        auto from_hdrs = from_headers(url, response);

        parse_result result;
        result.error = !from_body.error.empty() ? from_body.error : from_hdrs.error;

        std::unordered_set<std::string> seen;
        for(auto* source : {&from_body.cookies, &from_hdrs.cookies}){
            for(auto& c : *source){
                if(seen.insert(c.id()).second){
                    result.cookies.push_back(std::move(c));
                }
            }
        }
        return result;
    }

}
