#ifndef WEBPROBE_HTTP_CLIENT_TRANSPORT_HPP
#define WEBPROBE_HTTP_CLIENT_TRANSPORT_HPP

#include <string>
#include <functional>
#include "request_options.hpp"
#include "../common/http_response.hpp"

namespace webprobe::http {

/**
 * Callback invoked by the transport once the response of a dispatched
 * request is available.
 */
using response_callback = std::function<void(const http_response&)>;

/**
 * HTTP transport used to dispatch element requests. Timeouts, retries and
 * concurrency are the implementation's concern; callers only hand over fully
 * assembled, independent requests.
 */
class transport {
public:
    virtual ~transport() = default;

    virtual void get(const std::string& url, const request_options& options, response_callback callback) = 0;

    virtual void post(const std::string& url, const request_options& options, response_callback callback) = 0;
};

} // namespace webprobe::http

#endif // WEBPROBE_HTTP_CLIENT_TRANSPORT_HPP
