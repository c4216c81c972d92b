#include "document.hpp"
#include <regex>
#include <cctype>
#include <boost/algorithm/string/find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/range/iterator_range.hpp>

namespace webprobe::html {

    namespace {
        // name, or name=value with double, single or no quotes
        const std::regex attribute_regex(
            R"re(([^\s=/>"']+)(?:\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>"']+)))?)re");

        std::string_view::size_type tag_end(std::string_view markup, std::string_view::size_type from){
            char quote = 0;
            for(auto i = from; i < markup.size(); ++i){
                char c = markup[i];
                if(quote){
                    if(c == quote) quote = 0;
                }else if(c == '"' || c == '\''){
                    quote = c;
                }else if(c == '>'){
                    return i;
                }
            }
            return std::string_view::npos;
        }

        meta_element parse_meta(std::string_view tag){
            std::map<std::string, std::string> attributes;
            std::string text(tag);
            for(std::sregex_iterator it(text.begin(), text.end(), attribute_regex), end; it != end; ++it){
                const auto& match = *it;
                auto name = boost::algorithm::to_lower_copy(match[1].str());
                std::string value;
                if(match[2].matched) value = match[2].str();
                else if(match[3].matched) value = match[3].str();
                else if(match[4].matched) value = match[4].str();
                // first occurrence wins, as in browsers
                attributes.emplace(std::move(name), document::decode_entities(value));
            }
            return meta_element(std::move(attributes));
        }
    }

    meta_element::meta_element(std::map<std::string, std::string> attributes){
        for(auto& [name, value] : attributes){
            attributes_.emplace(boost::algorithm::to_lower_copy(name), std::move(value));
        }
    }

    bool meta_element::has_attribute(std::string_view name) const{
        return attributes_.find(boost::algorithm::to_lower_copy(std::string(name))) != attributes_.end();
    }

    const std::string& meta_element::attribute(std::string_view name) const{
        auto it = attributes_.find(boost::algorithm::to_lower_copy(std::string(name)));
        if(it != attributes_.end()){
            return it->second;
        }
        static const std::string empty;
        return empty;
    }

    const std::map<std::string, std::string>& meta_element::attributes() const{
        return attributes_;
    }

    document::document(std::vector<meta_element> meta) : meta_(std::move(meta)){}

    document document::parse(std::string_view markup){
        std::vector<meta_element> meta;
        auto range = boost::make_iterator_range(markup.begin(), markup.end());

        while(true){
            auto found = boost::algorithm::ifind_first(range, "<meta");
            if(found.empty()) break;

            auto start = static_cast<std::string_view::size_type>(found.end() - markup.begin());
            auto end = tag_end(markup, start);
            if(end == std::string_view::npos) break;

            // skip tags that merely start with "meta", like <metadata>
            if(start < markup.size()){
                auto next = static_cast<unsigned char>(markup[start]);
                if(std::isspace(next) || next == '/' || next == '>'){
                    meta.push_back(parse_meta(markup.substr(start, end - start)));
                }
            }

            range = boost::make_iterator_range(markup.begin() + end + 1, markup.end());
        }

        return document(std::move(meta));
    }

    std::optional<std::string_view> document::head_region(std::string_view markup){
        auto open = boost::algorithm::ifind_first(markup, "<head");
        if(open.empty()) return std::nullopt;

        auto close = boost::algorithm::ifind_last(markup, "</head>");
        if(close.empty() || close.begin() < open.end()) return std::nullopt;

        auto start = static_cast<std::string_view::size_type>(open.begin() - markup.begin());
        auto end = static_cast<std::string_view::size_type>(close.end() - markup.begin());
        return markup.substr(start, end - start);
    }

    const std::vector<meta_element>& document::meta_elements() const{
        return meta_;
    }

    std::vector<meta_element> document::meta_with_http_equiv(std::string_view value) const{
        std::vector<meta_element> result;
        for(const auto& element : meta_){
            if(element.has_attribute("http-equiv") && boost::iequals(element.attribute("http-equiv"), value)){
                result.push_back(element);
            }
        }
        return result;
    }

    std::string document::decode_entities(std::string_view text){
        static const std::pair<std::string_view, char> entities[] = {
            {"&amp;", '&'}, {"&quot;", '"'}, {"&#39;", '\''}, {"&apos;", '\''}, {"&lt;", '<'}, {"&gt;", '>'}
        };

        std::string result;
        result.reserve(text.size());
        for(std::string_view::size_type i = 0; i < text.size(); ++i){
            bool replaced = false;
            if(text[i] == '&'){
                for(const auto& [entity, ch] : entities){
                    if(text.substr(i, entity.size()) == entity){
                        result += ch;
                        i += entity.size() - 1;
                        replaced = true;
                        break;
                    }
                }
            }
            if(!replaced) result += text[i];
        }
        return result;
    }

}
