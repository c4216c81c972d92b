#ifndef WEBPROBE_HTTP_CLIENT_REQUEST_OPTIONS_HPP
#define WEBPROBE_HTTP_CLIENT_REQUEST_OPTIONS_HPP

#include <string>
#include <map>

namespace webprobe::http {

/**
 * Parameters of a request assembled from an element, before the transport
 * turns them into wire format.
 */
struct request_options {
    std::map<std::string, std::string> params;      // Query string or body parameters
    std::map<std::string, std::string> cookies;     // Sent in the Cookie header
    std::map<std::string, std::string> headers;     // Extra request headers

    bool operator==(const request_options& other) const = default;
};

} // namespace webprobe::http

#endif // WEBPROBE_HTTP_CLIENT_REQUEST_OPTIONS_HPP
