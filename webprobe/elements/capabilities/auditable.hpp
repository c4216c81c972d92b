#ifndef WEBPROBE_ELEMENTS_CAPABILITIES_AUDITABLE_HPP
#define WEBPROBE_ELEMENTS_CAPABILITIES_AUDITABLE_HPP

#include <string>
#include <vector>
#include <functional>
#include <cstddef>
#include "mutable.hpp"
#include "../../http/client/transport.hpp"

namespace webprobe::elements {

    /**
     * Receives the response of every dispatched mutation along with the
     * mutation that produced it.
     */
    using mutation_callback = std::function<void(const http::http_response&, const element&)>;

    struct audit_result {
        bool skipped = false;       // audit refused before any mutation was built
        size_t dispatched = 0;      // requests handed to the transport
    };

    class auditable {
    public:
        virtual ~auditable() = default;

        virtual audit_result audit(const std::string& payload,
                                   const mutation_options& options,
                                   const config::scan_options& scan,
                                   http::transport& transport,
                                   mutation_callback callback) = 0;

    protected:
        // submits every mutation, returns the number of requests dispatched
        static size_t dispatch(const std::vector<element_ptr>& mutations,
                               http::transport& transport,
                               const mutation_callback& callback);
    };

}

#endif
