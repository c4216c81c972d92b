#include "expires.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

namespace webprobe::elements {

    namespace {

        // two digit years first: %Y would happily take "12" as year 12
        constexpr std::array<const char*, 7> date_formats = {
            "%a, %d %b %y %H:%M:%S",
            "%a, %d %b %Y %H:%M:%S",    // RFC 1123
            "%a, %d-%b-%y %H:%M:%S",    // RFC 850
            "%a, %d-%b-%Y %H:%M:%S",    // Netscape
            "%a %b %d %H:%M:%S %Y",     // asctime
            "%Y-%m-%dT%H:%M:%S",        // ISO 8601
            "%Y-%m-%d %H:%M:%S"
        };

        bool is_numeric(std::string_view value){
            if(value.empty()) return false;
            for(char c : value){
                if(!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        // offset in seconds east of UTC for what follows the time, std::nullopt if unknown
        std::optional<int64_t> zone_offset(std::string zone){
            boost::algorithm::trim(zone);
            if(zone.empty() || boost::iequals(zone, "GMT") || boost::iequals(zone, "UTC") ||
               boost::iequals(zone, "UT") || boost::iequals(zone, "Z")){
                return 0;
            }

            if((zone[0] == '+' || zone[0] == '-') && zone.size() >= 5){
                std::string digits = zone.substr(1);
                digits.erase(std::remove(digits.begin(), digits.end(), ':'), digits.end());
                if(digits.size() != 4 || !is_numeric(digits)) return std::nullopt;
                int64_t hours = (digits[0] - '0') * 10 + (digits[1] - '0');
                int64_t minutes = (digits[2] - '0') * 10 + (digits[3] - '0');
                int64_t offset = hours * 3600 + minutes * 60;
                return zone[0] == '+' ? offset : -offset;
            }

            return std::nullopt;
        }

        std::optional<time_point> parse_http_date(const std::string& date){
            for(const auto* format : date_formats){
                std::tm tm = {};
                std::istringstream ss(date);
                ss.imbue(std::locale::classic());
                ss >> std::get_time(&tm, format);
                if(ss.fail()) continue;

                std::string rest;
                std::getline(ss, rest);
                auto offset = zone_offset(rest);
                if(!offset) continue;

                auto converted = timegm(&tm);
                if(converted == static_cast<std::time_t>(-1)) continue;

                auto seconds = static_cast<int64_t>(converted) - *offset;
                return time_point(std::chrono::seconds(seconds));
            }
            return std::nullopt;
        }

    }

    std::optional<time_point> parse_expires(int64_t seconds){
        if(seconds <= 0) return std::nullopt;
        return time_point(std::chrono::seconds(seconds));
    }

    std::optional<time_point> parse_expires(std::string_view expires){
        std::string value(expires);
        boost::algorithm::trim(value);
        if(value.empty()) return std::nullopt;

        if(is_numeric(value)){
            try{
                if(auto time = parse_expires(boost::lexical_cast<int64_t>(value))){
                    return time;
                }
            }catch(const boost::bad_lexical_cast&){
                // out of range, try it as a date
            }
        }

        return parse_http_date(value);
    }

    time_point expires_to_time(std::string_view expires){
        if(auto time = parse_expires(expires)){
            return *time;
        }
        throw time_parse_error("Invalid cookie expiry: '" + std::string(expires) + "'");
    }

    time_point expires_to_time(int64_t seconds){
        if(auto time = parse_expires(seconds)){
            return *time;
        }
        throw time_parse_error("Invalid cookie expiry: " + std::to_string(seconds));
    }

    std::string format_http_date(time_point time){
        auto t = static_cast<std::time_t>(time.time_since_epoch().count());
        std::tm tm = {};
        gmtime_r(&t, &tm);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
        return buf;
    }

    time_point now(){
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

}
