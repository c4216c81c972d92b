#include "auditable.hpp"
#include "../../util/logger.hpp"

namespace webprobe::elements {

    size_t auditable::dispatch(const std::vector<element_ptr>& mutations,
                               http::transport& transport,
                               const mutation_callback& callback){
        size_t dispatched = 0;
        for(const auto& mutation : mutations){
            if(!mutation) continue;
            // the callback keeps the mutation alive until its response arrives
            mutation->submit(transport, [mutation, callback](const http::http_response& response){
                if(callback) callback(response, *mutation);
            });
            ++dispatched;
        }
        LOG_DEBUG("Dispatched {} mutations", dispatched);
        return dispatched;
    }

}
