#pragma once
#include "SiftConfig.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

struct ServiceResponse {
    int status = 200;
    std::string body;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t acceptedFiles = 0;
    uint64_t rejectedFiles = 0;
    uint64_t errorRequests = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordAccepted(double latencyMs);
    void recordRejected(double latencyMs);
    void recordError(double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void recordLatency(double latencyMs);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> acceptedFiles{0};
    std::atomic<uint64_t> rejectedFiles{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

class AnalysisService {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t threadCount = 8;
    };

    AnalysisService(SiftConfig defaults, RequestMonitor& monitor);

    /**
     * @brief Handles one POST /analyze: the body is the file, query params tune the request.
     * @details Recognized params: filename, encoding, delimiter, quote, preview.
     *          200 on success, 400 for rejections, encoding and parameter errors, 422 for NoValidRows.
     */
    ServiceResponse handleAnalyze(const std::string& body, const std::map<std::string, std::string>& params) const;

    ServiceResponse handleStats() const;

    /**
     * @brief Binds the HTTP server and blocks until it stops.
     * @return process exit code.
     */
    int start(const Config& config);

private:
    SiftConfig defaults;
    RequestMonitor& monitor;
};
