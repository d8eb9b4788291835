#include "AnalysisService.h"

#include "AnalysisEngine.h"
#include "JsonWriter.h"
#include "SiftExceptions.h"
#include "UploadPolicy.h"

#include <chrono>
#include <initializer_list>
#include <iostream>
#include <utility>
#include <variant>

namespace {
using Clock = std::chrono::steady_clock;

constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusUnprocessable = 422;
constexpr int kStatusInternalError = 500;

int statusFor(EngineError::Kind kind) {
    switch (kind) {
        case EngineError::Kind::NO_VALID_ROWS: return kStatusUnprocessable;
        case EngineError::Kind::INTERNAL_ERROR: return kStatusInternalError;
        case EngineError::Kind::ENCODING_ERROR:
        case EngineError::Kind::REJECTED: return kStatusBadRequest;
    }
    return kStatusBadRequest;
}

std::string findParam(const std::map<std::string, std::string>& params, const std::string& key) {
    const auto it = params.find(key);
    return it == params.end() ? std::string() : it->second;
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void logRequestLine(const std::string& fileName, int status, double latencyMs) {
    std::cout << "[SiftService] endpoint=/analyze file=" << fileName
              << " status=" << status
              << " latency_ms=" << latencyMs
              << "\n";
}
}

void RequestMonitor::recordLatency(double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    const double micros = latencyMs < 0.0 ? 0.0 : latencyMs * 1000.0;
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(micros), std::memory_order_relaxed);
}

void RequestMonitor::recordAccepted(double latencyMs) {
    recordLatency(latencyMs);
    acceptedFiles.fetch_add(1, std::memory_order_relaxed);
}

void RequestMonitor::recordRejected(double latencyMs) {
    recordLatency(latencyMs);
    rejectedFiles.fetch_add(1, std::memory_order_relaxed);
}

void RequestMonitor::recordError(double latencyMs) {
    recordLatency(latencyMs);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.acceptedFiles = acceptedFiles.load(std::memory_order_relaxed);
    out.rejectedFiles = rejectedFiles.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(totalLatencyMicros.load(std::memory_order_relaxed)) /
                               1000.0 / static_cast<double>(out.totalRequests);
    }
    return out;
}

AnalysisService::AnalysisService(SiftConfig defaultsValue, RequestMonitor& monitorRef)
    : defaults(std::move(defaultsValue)), monitor(monitorRef) {}

ServiceResponse AnalysisService::handleAnalyze(const std::string& body,
                                               const std::map<std::string, std::string>& params) const {
    const auto started = Clock::now();
    const std::string fileName = findParam(params, "filename");

    auto respondError = [&](int status, const EngineError& error) {
        ServiceResponse response{status, JsonWriter::errorToJson(error, fileName).dump()};
        if (error.kind == EngineError::Kind::INTERNAL_ERROR) {
            monitor.recordError(elapsedMs(started));
        } else {
            monitor.recordRejected(elapsedMs(started));
        }
        logRequestLine(fileName, status, elapsedMs(started));
        return response;
    };

    if (!fileName.empty() && !UploadPolicy::hasAllowedExtension(fileName)) {
        return respondError(kStatusBadRequest, EngineError{EngineError::Kind::REJECTED,
                                                           UploadPolicy::kInvalidFileTypeRule,
                                                           UploadPolicy::invalidFileTypeDetail()});
    }

    SiftConfig requestConfig = defaults;
    try {
        for (const char* key : {"encoding", "delimiter", "quote", "preview"}) {
            const std::string value = findParam(params, key);
            if (!value.empty()) SiftConfig::applySetting(requestConfig, key, value);
        }
        requestConfig.validate();
    } catch (const Sift::ConfigurationException& e) {
        ServiceResponse response{kStatusBadRequest, JsonWriter::errorToJson(
            EngineError{EngineError::Kind::REJECTED, "InvalidParameter", e.what()}, fileName).dump()};
        monitor.recordError(elapsedMs(started));
        logRequestLine(fileName, response.status, elapsedMs(started));
        return response;
    }

    RawFile raw;
    raw.bytes = body;
    raw.encodingHint = requestConfig.encoding;
    raw.fileName = fileName;

    AnalysisOutcome outcome = AnalysisEngine::evaluate(raw, requestConfig.limits, requestConfig.inference);
    if (const auto* error = std::get_if<EngineError>(&outcome)) {
        return respondError(statusFor(error->kind), *error);
    }

    ServiceResponse response{kStatusOk, JsonWriter::reportToJson(std::get<AnalysisReport>(outcome), fileName).dump()};
    monitor.recordAccepted(elapsedMs(started));
    logRequestLine(fileName, response.status, elapsedMs(started));
    return response;
}

ServiceResponse AnalysisService::handleStats() const {
    const MonitoringSnapshot snapshot = monitor.snapshot();
    JsonValue root = JsonValue::object();
    root.set("total_requests", JsonValue::integer(static_cast<int64_t>(snapshot.totalRequests)));
    root.set("accepted_files", JsonValue::integer(static_cast<int64_t>(snapshot.acceptedFiles)));
    root.set("rejected_files", JsonValue::integer(static_cast<int64_t>(snapshot.rejectedFiles)));
    root.set("error_requests", JsonValue::integer(static_cast<int64_t>(snapshot.errorRequests)));
    root.set("average_latency_ms", JsonValue::number(snapshot.averageLatencyMs));
    return ServiceResponse{kStatusOk, root.dump()};
}
