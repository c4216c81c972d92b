#include "cookie_jar.hpp"
#include "expires.hpp"
#include "../../util/logger.hpp"
#include <fstream>
#include <vector>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace webprobe::elements {

namespace {

    constexpr size_t min_fields = 6;

    bool is_ignored(const std::string& line){
        return line.empty() || line[0] == '#';
    }

}

std::optional<cookie> cookie_jar::parse_line(const std::string& url, std::string_view line){
    std::string trimmed(line);
    boost::algorithm::trim(trimmed);
    if(is_ignored(trimmed)){
        return std::nullopt;
    }

    std::vector<std::string> fields;
    boost::split(fields, trimmed, boost::is_any_of("\t"));
    if(fields.size() < min_fields){
        LOG_DEBUG("Skipping cookiejar line with {} fields: {}", fields.size(), trimmed);
        return std::nullopt;
    }

    attribute_map raw;
    raw[attribute::domain] = fields[0];
    raw[attribute::path] = fields[2];
    raw[attribute::secure] = fields[3] == "TRUE";

    auto& expires = fields[4];
    auto& name = fields[5];
    std::optional<std::string> value;
    if(fields.size() > 6){
        value = fields[6];
    }

    if(auto time = parse_expires(expires)){
        raw[attribute::expires] = *time;
        raw[attribute::name] = name;
        if(value){
            raw[attribute::value] = *value;
        }
    }else{
        // no expiry column, everything after the secure flag moves back one slot
        raw[attribute::expires] = std::monostate{};
        raw[attribute::name] = expires;
        raw[attribute::value] = name;
    }

    return cookie(url, raw);
}

parse_result cookie_jar::parse(const std::string& url, std::istream& input){
    parse_result result;
    std::string line;
    while(std::getline(input, line)){
        auto parsed = parse_line(url, line);
        if(parsed){
            result.cookies.push_back(std::move(*parsed));
            continue;
        }

        boost::algorithm::trim(line);
        if(!is_ignored(line)){
            ++result.skipped;
        }
    }

    LOG_DEBUG("Read {} cookies from cookiejar, {} lines skipped", result.cookies.size(), result.skipped);
    return result;
}

parse_result cookie_jar::from_file(const std::string& url, const std::filesystem::path& path){
    std::ifstream ifs(path);
    if(!ifs){
        parse_result result;
        result.error = "Cannot open cookiejar file: " + path.string();
        LOG_ERROR("{}", result.error);
        return result;
    }
    return parse(url, ifs);
}

} // namespace webprobe::elements
