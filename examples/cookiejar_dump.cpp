#include <webprobe/elements.hpp>
#include <webprobe/util/logger.hpp>
#include <iostream>

using namespace webprobe;

// Usage: cookiejar_dump <owner-url> <cookiejar> [options.json]
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <owner-url> <cookiejar> [options.json]" << std::endl;
        return 1;
    }

    logging::enable();

    config::scan_options options;
    if (argc > 3) {
        try {
            options = config::scan_options::load(argv[3]);
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot load options: {}", e.what());
            return 1;
        }
    }

    auto result = elements::cookie_jar::from_file(argv[1], argv[2]);
    if (!result) {
        std::cerr << result.error << std::endl;
        return 1;
    }

    elements::mutation_options mutation;
    mutation.param_flip = true;

    for (const auto& c : result.cookies) {
        std::cout << c.to_string()
                  << "\tdomain=" << c.domain().value_or("")
                  << "\tpath=" << c.path().value_or("")
                  << "\tsecure=" << std::boolalpha << c.is_secure()
                  << "\texpires=" << (c.is_session() ? std::string("session") : elements::format_http_date(*c.expires_at()));

        if (options.is_cookie_excluded(c.name())) {
            std::cout << "\t(excluded)" << std::endl;
            continue;
        }

        auto variants = c.mutations("<webprobe>", mutation, options);
        std::cout << "\tmutations=" << variants.size() << std::endl;
    }

    if (result.skipped > 0) {
        LOG_WARNING("{} malformed lines skipped", result.skipped);
    }

    return 0;
}
