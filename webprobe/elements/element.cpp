#include "element.hpp"
#include "auditor.hpp"
#include <unordered_set>
#include <boost/algorithm/string/predicate.hpp>

namespace webprobe::elements {

    namespace {
        // length-prefixed so that distinct inputs never serialize alike
        void append_field(std::string& out, const std::string& field){
            out += std::to_string(field.size());
            out += ':';
            out += field;
        }

        void append_map(std::string& out, const element::input_map& map){
            out += '{';
            for(const auto& [key, value] : map){
                append_field(out, key);
                append_field(out, value);
            }
            out += '}';
        }
    }

    element::element(std::string url, std::string method) :
        url_(std::move(url)),
        method_(std::move(method))
    {
        action_ = url_;
    }

    const std::string& element::url() const{
        return url_;
    }

    const std::string& element::action() const{
        return action_;
    }

    void element::set_action(std::string action){
        action_ = std::move(action);
    }

    const std::string& element::method() const{
        return method_;
    }

    void element::set_method(std::string method){
        method_ = std::move(method);
    }

    const element::input_map& element::inputs() const{
        return inputs_;
    }

    void element::set_inputs(input_map inputs){
        inputs_ = std::move(inputs);
    }

    const element::input_map& element::original() const{
        return original_;
    }

    void element::freeze_original(){
        original_ = inputs_;
    }

    const std::string& element::altered() const{
        return altered_;
    }

    void element::set_altered(std::string altered){
        altered_ = std::move(altered);
    }

    bool element::is_mutation() const{
        return !altered_.empty();
    }

    bool element::scope_override() const{
        return scope_override_;
    }

    void element::override_instance_scope(){
        scope_override_ = true;
    }

    http::request_options& element::options(){
        return options_;
    }

    const http::request_options& element::options() const{
        return options_;
    }

    const std::shared_ptr<auditor>& element::get_auditor() const{
        return auditor_;
    }

    void element::set_auditor(std::shared_ptr<auditor> auditor){
        auditor_ = std::move(auditor);
    }

    bool element::is_orphan() const{
        return !auditor_ || !auditor_->get_page();
    }

    std::string element::id() const{
        std::string id = type();
        id += '|';
        append_field(id, action_);
        append_field(id, method_);
        append_map(id, inputs_);
        append_map(id, options_.cookies);
        return id;
    }

    void element::submit(http::transport& transport, http::response_callback callback) const{
        http::request_options request = options_;
        request.params = inputs_;
        http_request(transport, std::move(request), std::move(callback));
    }

    void element::http_request(http::transport& transport, http::request_options options,
                               http::response_callback callback) const{
        if(boost::iequals(method_, "post")){
            transport.post(action_, options, std::move(callback));
        }else{
            transport.get(action_, options, std::move(callback));
        }
    }

    std::vector<element_ptr> unique(const std::vector<element_ptr>& elements){
        std::vector<element_ptr> result;
        std::unordered_set<std::string> seen;
        for(const auto& e : elements){
            if(!e) continue;
            if(seen.insert(e->id()).second){
                result.push_back(e);
            }
        }
        return result;
    }

}
