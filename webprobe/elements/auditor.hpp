#ifndef WEBPROBE_ELEMENTS_AUDITOR_HPP
#define WEBPROBE_ELEMENTS_AUDITOR_HPP

#include <memory>
#include <string>

namespace webprobe::elements {

    class page;

    /**
     * Scan context an element is audited under: the page currently being
     * audited and the sink for informational messages.
     */
    class auditor {
    public:
        virtual ~auditor() = default;

        // nullptr when no page is loaded
        [[nodiscard]] virtual std::shared_ptr<const page> get_page() const = 0;

        virtual void print_info(const std::string& message) = 0;
    };

}

#endif
