#include "AnalysisService.h"

#include <algorithm>
#include <iostream>
#include <map>

#include <httplib.h>

namespace {
void setJsonResponse(httplib::Response& response, const ServiceResponse& payload) {
    response.status = payload.status;
    response.set_content(payload.body, "application/json");
}
}

int AnalysisService::start(const Config& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };
    server.set_payload_max_length(defaults.limits.maxBytes + 1);

    server.Get("/health", [](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, ServiceResponse{200, "{\"status\":\"ok\"}"});
    });

    server.Get("/stats", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, handleStats());
    });

    server.Post("/analyze", [this](const httplib::Request& request, httplib::Response& response) {
        std::map<std::string, std::string> params;
        for (const auto& kv : request.params) {
            params.emplace(kv.first, kv.second);
        }
        setJsonResponse(response, handleAnalyze(request.body, params));
    });

    std::cout << "[SiftService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " max_bytes=" << defaults.limits.maxBytes
              << " max_rows=" << defaults.limits.maxRows
              << " max_columns=" << defaults.limits.maxColumns
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[SiftService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }
    return 0;
}
