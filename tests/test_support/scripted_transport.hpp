#ifndef SCRIPTED_TRANSPORT_HPP
#define SCRIPTED_TRANSPORT_HPP

#include <deque>
#include <string>
#include <vector>
#include "api/general/api_errors.hpp"
#include "api/general/http_transport_interface.hpp"

namespace ValrTrader {
namespace Testing {

// Replays queued responses in order and records every request it was given.
class ScriptedTransport : public API::HttpTransportInterface {
public:
    struct ScriptedStep {
        bool throws_transport_error = false;
        HttpResponse response;
    };

    void enqueue_response(long status_code, const std::string& body) {
        ScriptedStep scripted_step;
        scripted_step.response.status_code = status_code;
        scripted_step.response.body = body;
        scripted_steps.push_back(scripted_step);
    }

    void enqueue_transport_error() {
        ScriptedStep scripted_step;
        scripted_step.throws_transport_error = true;
        scripted_steps.push_back(scripted_step);
    }

    HttpResponse perform(const HttpRequest& http_request) override {
        recorded_requests.push_back(http_request);
        if (scripted_steps.empty()) {
            throw API::TransportError("no scripted response left for " + http_request.url);
        }
        ScriptedStep scripted_step = scripted_steps.front();
        scripted_steps.pop_front();
        if (scripted_step.throws_transport_error) {
            throw API::TransportError("scripted transport failure");
        }
        return scripted_step.response;
    }

    const std::vector<HttpRequest>& get_requests() const { return recorded_requests; }
    size_t get_remaining_steps() const { return scripted_steps.size(); }

private:
    std::deque<ScriptedStep> scripted_steps;
    std::vector<HttpRequest> recorded_requests;
};

inline std::string find_header_value(const HttpRequest& http_request, const std::string& header_name) {
    std::string header_prefix = header_name + ": ";
    for (const std::string& header_line : http_request.headers) {
        if (header_line.compare(0, header_prefix.size(), header_prefix) == 0) {
            return header_line.substr(header_prefix.size());
        }
    }
    return "";
}

} // namespace Testing
} // namespace ValrTrader

#endif // SCRIPTED_TRANSPORT_HPP
