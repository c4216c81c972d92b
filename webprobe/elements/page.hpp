#ifndef WEBPROBE_ELEMENTS_PAGE_HPP
#define WEBPROBE_ELEMENTS_PAGE_HPP

#include <string>
#include <vector>
#include "element.hpp"

namespace webprobe::elements {

    class page {
    public:
        page(std::string url, std::vector<element_ptr> links, std::vector<element_ptr> forms) :
            url_(std::move(url)),
            links_(std::move(links)),
            forms_(std::move(forms))
        {}

        [[nodiscard]] const std::string& url() const { return url_; }
        [[nodiscard]] const std::vector<element_ptr>& links() const { return links_; }
        [[nodiscard]] const std::vector<element_ptr>& forms() const { return forms_; }

    private:
        std::string url_;
        std::vector<element_ptr> links_;
        std::vector<element_ptr> forms_;
    };

}

#endif
