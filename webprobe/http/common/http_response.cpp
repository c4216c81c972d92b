#include "http_response.hpp"

namespace webprobe::http {

    http_response::http_response(std::string effective_url, uint16_t status_code, std::string content) :
        effective_url_(std::move(effective_url)),
        status_code_(status_code),
        content_(std::move(content))
    {}

    void http_response::set_effective_url(std::string url){
        effective_url_ = std::move(url);
    }

    void http_response::set_status(uint16_t status_code){
        status_code_ = status_code;
    }

    void http_response::set_content(std::string content){
        content_ = std::move(content);
    }

    const std::string& http_response::get_effective_url() const{
        return effective_url_;
    }

    uint16_t http_response::get_status_code() const{
        return status_code_;
    }

    const std::string& http_response::get_content() const{
        return content_;
    }

    bool http_response::is_ok() const{
        return status_code_ >= 200 && status_code_ < 300;
    }

}
