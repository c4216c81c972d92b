#ifndef WEBPROBE_ELEMENTS_CAPABILITIES_MUTABLE_HPP
#define WEBPROBE_ELEMENTS_CAPABILITIES_MUTABLE_HPP

#include <string>
#include <vector>
#include "../element.hpp"
#include "../../config/scan_options.hpp"

namespace webprobe::elements {

    // how a payload is combined with the original input value
    enum class injection_format {
        straight,   // payload
        append,     // original value + payload
        null,       // payload + NUL
        semicolon   // ';' + payload
    };

    struct mutation_options {
        std::vector<injection_format> formats = {
            injection_format::straight,
            injection_format::append,
            injection_format::null,
            injection_format::semicolon
        };

        // add a variant carrying the payload as input name
        bool param_flip = false;
    };

    /**
     * Produces the variants of an element used to inject a payload.
     */
    class mutable_capability {
    public:
        virtual ~mutable_capability() = default;

        [[nodiscard]] virtual std::vector<element_ptr> mutations(const element& source,
                                                                 const std::string& payload,
                                                                 const mutation_options& options,
                                                                 const config::scan_options& scan) const = 0;
    };

    /**
     * Default strategy: one clone per input and format, with empty inputs filled
     * with placeholders. Inputs already holding the seed were flipped and are
     * left alone. Element specific layers such as parameter flips are not
     * applied here.
     */
    class basic_mutator : public mutable_capability {
    public:
        [[nodiscard]] std::vector<element_ptr> mutations(const element& source,
                                                         const std::string& payload,
                                                         const mutation_options& options,
                                                         const config::scan_options& scan) const override;

        static std::string format(const std::string& payload, const std::string& original, injection_format format);
    };

}

#endif
