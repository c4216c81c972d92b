#ifndef WEBPROBE_HTTP_RESPONSE_HPP
#define WEBPROBE_HTTP_RESPONSE_HPP

#include <string>
#include <cstdint>
#include "headers.hpp"

namespace webprobe::http {

// response as handed back by the transport, headers inherited as in a raw reply
class http_response : public headers {

public:
    http_response() = default;
    http_response(std::string effective_url, uint16_t status_code, std::string content);
    ~http_response() override = default;

    void set_effective_url(std::string url);
    void set_status(uint16_t status_code);
    void set_content(std::string content);

    const std::string& get_effective_url() const;
    uint16_t get_status_code() const;
    const std::string& get_content() const;
    bool is_ok() const;

private:
    std::string effective_url_;
    uint16_t status_code_ = 200;
    std::string content_;
};

}

#endif
