#ifndef WEBPROBE_ELEMENTS_HPP
#define WEBPROBE_ELEMENTS_HPP

// Auditable elements and their capabilities
#include <webprobe/elements/element.hpp>                        // element base, element_ptr, unique()
#include <webprobe/elements/link.hpp>
#include <webprobe/elements/form.hpp>
#include <webprobe/elements/page.hpp>
#include <webprobe/elements/auditor.hpp>                        // scan context interface
#include <webprobe/elements/key_filler.hpp>                     // placeholder values for empty inputs
#include <webprobe/elements/capabilities/mutable.hpp>           // mutation_options, basic_mutator
#include <webprobe/elements/capabilities/auditable.hpp>         // audit_result, mutation_callback

// Cookies
#include <webprobe/elements/cookie/cookie.hpp>
#include <webprobe/elements/cookie/cookie_jar.hpp>              // Netscape cookiejar files
#include <webprobe/elements/cookie/set_cookie.hpp>              // Set-Cookie headers and meta tags
#include <webprobe/elements/cookie/codec.hpp>
#include <webprobe/elements/cookie/expires.hpp>

// Scan configuration
#include <webprobe/config/scan_options.hpp>

#endif // WEBPROBE_ELEMENTS_HPP
