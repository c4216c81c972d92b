#include "cookie.hpp"
#include "codec.hpp"
#include "../auditor.hpp"
#include "../key_filler.hpp"
#include "../page.hpp"
#include "../../http/util/url.hpp"
#include "../../util/logger.hpp"

namespace webprobe::elements {

    namespace {
        std::shared_ptr<const mutable_capability> default_mutator(){
            static const auto mutator = std::make_shared<const basic_mutator>();
            return mutator;
        }

        std::optional<std::pair<std::string, std::string>> input_pair(const attribute_map& raw){
            auto name = raw.find(attribute::name);
            if(name != raw.end()){
                if(const auto* n = std::get_if<std::string>(&name->second)){
                    std::string value;
                    auto v = raw.find(attribute::value);
                    if(v != raw.end()){
                        if(const auto* s = std::get_if<std::string>(&v->second)) value = *s;
                    }
                    return std::make_pair(*n, value);
                }
            }

            // a bare {name => value} map
            for(const auto& [key, value] : raw){
                if(attribute_set::has(key)) continue;
                if(const auto* s = std::get_if<std::string>(&value)){
                    return std::make_pair(key, *s);
                }
            }
            return std::nullopt;
        }
    }

    cookie::cookie(std::string url, const attribute_map& raw, std::shared_ptr<const mutable_capability> mutator) :
        element(std::move(url), "get"),
        mutator_(mutator ? std::move(mutator) : default_mutator())
    {
        attributes_.merge(raw);

        input_map inputs;
        if(auto pair = input_pair(raw)){
            auto& [name, value] = *pair;
            if(!value.empty()){
                value = decode(value);
            }
            inputs.emplace(std::move(name), std::move(value));
        }
        set_inputs(std::move(inputs));

        auto owner = http::util::url::parse(this->url());
        if(attributes_.is_absent(attribute::path)){
            std::string path = owner ? owner->path : std::string{};
            attributes_.set(attribute::path, path.empty() ? std::string("/") : path);
        }
        if(attributes_.is_absent(attribute::domain) && owner && !owner->host.empty()){
            attributes_.set(attribute::domain, owner->host);
        }

        freeze_original();
    }

    cookie::cookie(std::string url, const std::string& name, const std::string& value,
                   std::shared_ptr<const mutable_capability> mutator) :
        cookie(std::move(url), attribute_map{{attribute::name, name}, {attribute::value, value}}, std::move(mutator))
    {}

    std::shared_ptr<element> cookie::clone() const{
        return std::make_shared<cookie>(*this);
    }

    std::string cookie::type() const{
        return "cookie";
    }

    bool cookie::has_attribute(std::string_view name){
        return attribute_set::has(name);
    }

    const attribute_value& cookie::attribute(std::string_view name) const{
        return attributes_.get(name);
    }

    std::optional<std::string> cookie::get_string(std::string_view name) const{
        return attributes_.get_string(name);
    }

    const attribute_set& cookie::attributes() const{
        return attributes_;
    }

    std::string cookie::name() const{
        return attributes_.get_string(attribute::name).value_or("");
    }

    std::string cookie::value() const{
        return attributes_.get_string(attribute::value).value_or("");
    }

    std::optional<std::string> cookie::domain() const{
        return attributes_.get_string(attribute::domain);
    }

    std::optional<std::string> cookie::path() const{
        return attributes_.get_string(attribute::path);
    }

    std::optional<time_point> cookie::expires_at() const{
        return attributes_.get_time(attribute::expires);
    }

    std::optional<int64_t> cookie::max_age() const{
        return attributes_.get_integer(attribute::max_age);
    }

    std::optional<int64_t> cookie::version() const{
        return attributes_.get_integer(attribute::version);
    }

    bool cookie::is_secure() const{
        return attributes_.get_bool(attribute::secure).value_or(false);
    }

    bool cookie::is_http_only() const{
        return attributes_.get_bool(attribute::httponly).value_or(false);
    }

    bool cookie::is_session() const{
        return attributes_.is_absent(attribute::expires);
    }

    bool cookie::is_expired(time_point reference) const{
        auto expires = expires_at();
        return expires.has_value() && reference > *expires;
    }

    element::input_map cookie::simple() const{
        return inputs();
    }

    void cookie::set_inputs(input_map inputs){
        if(inputs.empty()){
            attributes_.set(attribute::name, std::monostate{});
            attributes_.set(attribute::value, std::monostate{});
            element::set_inputs({});
            return;
        }

        auto first = inputs.begin();
        attributes_.set(attribute::name, first->first);
        attributes_.set(attribute::value, first->second);

        if(first->first.empty()){
            element::set_inputs({});
        }else{
            element::set_inputs({{first->first, first->second}});
        }
    }

    std::string cookie::to_string() const{
        return encode(name()) + "=" + encode(value());
    }

    std::vector<element_ptr> cookie::mutations(const std::string& payload,
                                               const mutation_options& options,
                                               const config::scan_options& scan) const{
        // the flip is ours to build, keep the generic mutator out of it
        auto generic = options;
        generic.param_flip = false;
        auto variants = mutator_->mutations(*this, payload, generic, scan);

        if(options.param_flip){
            auto flipped = clone();
            // a flipped name matches no known cookie, so the element would fail scope checks
            flipped->override_instance_scope();
            flipped->set_altered("Parameter flip");
            flipped->set_inputs({{payload, scan.seed}});
            variants.push_back(std::move(flipped));
        }

        if(is_orphan() || !scan.audit_cookies_extensively){
            return variants;
        }

        auto page = get_auditor()->get_page();
        std::vector<element_ptr> targets = page->links();
        targets.insert(targets.end(), page->forms().begin(), page->forms().end());
        targets = unique(targets);

        // submit every link and form of the page along with each cookie variant
        std::vector<element_ptr> propagated;
        for(const auto& variant : variants){
            for(const auto& target : targets){
                if(target->inputs().empty()) continue;

                auto carrier = target->clone();
                carrier->set_altered("mutation for the '" + variant->altered() + "' cookie");
                carrier->set_auditor(get_auditor());
                carrier->options().cookies = variant->inputs();
                carrier->set_inputs(key_filler::fill(carrier->inputs()));
                propagated.push_back(std::move(carrier));
            }
        }

        LOG_DEBUG("Propagating {} cookie variants over {} page elements of {}",
                  variants.size(), targets.size(), page->url());

        variants.insert(variants.end(), propagated.begin(), propagated.end());
        return unique(variants);
    }

    audit_result cookie::audit(const std::string& payload,
                               const mutation_options& options,
                               const config::scan_options& scan,
                               http::transport& transport,
                               mutation_callback callback){
        if(scan.is_cookie_excluded(name())){
            auto message = "Skipping audit of '" + name() + "' cookie.";
            LOG_INFO("{}", message);
            if(auto auditor = get_auditor()){
                auditor->print_info(message);
            }
            return {true, 0};
        }

        auto variants = mutations(payload, options, scan);
        return {false, dispatch(variants, transport, callback)};
    }

    void cookie::http_request(http::transport& transport, http::request_options options,
                              http::response_callback callback) const{
        options.cookies = options.params;
        options.params.clear();
        transport.get(action(), options, std::move(callback));
    }

    std::string cookie::encode(std::string_view value){
        return cookie_codec::encode(value);
    }

    std::string cookie::decode(std::string_view value){
        return cookie_codec::decode(value);
    }

}
