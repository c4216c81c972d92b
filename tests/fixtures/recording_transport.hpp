#ifndef WEBPROBE_TEST_RECORDING_TRANSPORT_HPP
#define WEBPROBE_TEST_RECORDING_TRANSPORT_HPP

#include <webprobe/http/client/transport.hpp>
#include <string>
#include <vector>

namespace webprobe::test {

// Transport that records every request and answers it immediately
struct RecordingTransport : public http::transport {
    struct request {
        std::string method;
        std::string url;
        http::request_options options;
    };

    std::vector<request> requests;
    uint16_t status = 200;

    void get(const std::string& url, const http::request_options& options, http::response_callback callback) override {
        record("GET", url, options, callback);
    }

    void post(const std::string& url, const http::request_options& options, http::response_callback callback) override {
        record("POST", url, options, callback);
    }

private:
    void record(const std::string& method, const std::string& url,
                const http::request_options& options, const http::response_callback& callback) {
        requests.push_back({method, url, options});
        if (callback) {
            callback(http::http_response(url, status, "ok"));
        }
    }
};

} // namespace webprobe::test

#endif
