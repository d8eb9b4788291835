#include "AnalysisEngine.h"
#include "JsonWriter.h"
#include "SiftConfig.h"
#include "SiftExceptions.h"
#include "StructuralValidator.h"
#include "TerminalUI.h"
#include "UploadPolicy.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {
constexpr int kExitAccepted = 0;
constexpr int kExitFailure = 1;
constexpr int kExitRejected = 2;

struct FileJob {
    std::string path;
    RawFile raw;
    std::optional<AnalysisOutcome> outcome;
};

std::string readFileBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Sift::IOException("Could not open file: " + path);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Sift::IOException("Failed while reading file: " + path);
    return bytes;
}

// Resolves checks that do not need the file contents; returns an outcome when the file is settled early.
std::optional<AnalysisOutcome> precheck(const std::string& path, const SiftConfig& config) {
    if (!UploadPolicy::hasAllowedExtension(path)) {
        return AnalysisOutcome(EngineError{EngineError::Kind::REJECTED,
                                           UploadPolicy::kInvalidFileTypeRule,
                                           UploadPolicy::invalidFileTypeDetail()});
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) throw Sift::IOException("Could not stat file: " + path + " (" + ec.message() + ")");
    ValidationOutcome sizeCheck = StructuralValidator::checkSize(static_cast<size_t>(size), config.limits);
    if (!sizeCheck.accepted()) {
        return AnalysisOutcome(EngineError{EngineError::Kind::REJECTED, sizeCheck.rule, sizeCheck.detail});
    }
    return std::nullopt;
}

void render(std::ostream& out, const SiftConfig& config, const std::vector<FileJob>& jobs) {
    if (config.outputFormat == "json") {
        JsonValue root = JsonValue::array();
        for (const auto& job : jobs) {
            if (const auto* report = std::get_if<AnalysisReport>(&*job.outcome)) {
                root.push(JsonWriter::reportToJson(*report, job.path));
            } else {
                root.push(JsonWriter::errorToJson(std::get<EngineError>(*job.outcome), job.path));
            }
        }
        out << (jobs.size() == 1 ? root.arrayValue.front().dump() : root.dump()) << "\n";
        return;
    }

    for (const auto& job : jobs) {
        if (const auto* report = std::get_if<AnalysisReport>(&*job.outcome)) {
            TerminalUI::printProfileTable(out, job.path, *report);
            TerminalUI::printPreview(out, *report);
        } else {
            TerminalUI::printError(out, job.path, std::get<EngineError>(*job.outcome));
        }
    }
}
}

int main(int argc, char* argv[]) {
    SiftConfig config;
    try {
        config = SiftConfig::fromArgs(argc, argv);
    } catch (const Sift::SiftException& e) {
        std::cerr << "[Sift Error] " << e.what() << "\n\n" << SiftConfig::usage(argc > 0 ? argv[0] : "sift");
        return kExitFailure;
    }
    if (config.showHelp) {
        std::cout << SiftConfig::usage(argv[0]);
        return kExitAccepted;
    }

    std::vector<FileJob> jobs;
    jobs.reserve(config.inputPaths.size());
    try {
        for (const auto& path : config.inputPaths) {
            FileJob job;
            job.path = path;
            job.outcome = precheck(path, config);
            if (!job.outcome) {
                job.raw.bytes = readFileBytes(path);
                job.raw.encodingHint = config.encoding;
                job.raw.fileName = std::filesystem::path(path).filename().string();
                if (config.verbose) {
                    std::cout << "[Sift] Loaded " << path << " (" << job.raw.bytes.size() << " bytes)\n";
                }
            }
            jobs.push_back(std::move(job));
        }
    } catch (const Sift::SiftException& e) {
        std::cerr << "[Sift Error] " << e.what() << "\n";
        return kExitFailure;
    }

    const long long jobCount = static_cast<long long>(jobs.size());
    #pragma omp parallel for schedule(dynamic)
    for (long long i = 0; i < jobCount; ++i) {
        FileJob& job = jobs[static_cast<size_t>(i)];
        if (job.outcome) continue;
        job.outcome = AnalysisEngine::evaluate(job.raw, config.limits, config.inference);
        std::string().swap(job.raw.bytes);
    }

    int exitCode = kExitAccepted;
    for (const auto& job : jobs) {
        if (const auto* error = std::get_if<EngineError>(&*job.outcome)) {
            if (error->kind == EngineError::Kind::INTERNAL_ERROR) {
                exitCode = kExitFailure;
            } else if (exitCode == kExitAccepted) {
                exitCode = kExitRejected;
            }
            if (config.verbose) {
                std::cerr << "[Sift Warning] " << job.path << " rejected by rule " << error->rule << "\n";
            }
        } else if (config.verbose) {
            const auto& report = std::get<AnalysisReport>(*job.outcome);
            std::cout << "[Sift] " << job.path << ": " << report.rowCount() << " rows, "
                      << report.columnCount() << " columns, encoding " << report.encoding() << "\n";
        }
    }

    if (config.outputPath.empty()) {
        render(std::cout, config, jobs);
        return exitCode;
    }

    std::ofstream out(config.outputPath);
    if (!out) {
        std::cerr << "[Sift Error] Failed to open output file: " << config.outputPath << "\n";
        return kExitFailure;
    }
    render(out, config, jobs);
    if (!out.good()) {
        std::cerr << "[Sift Error] Failed while writing output file: " << config.outputPath << "\n";
        return kExitFailure;
    }
    std::cout << "[Sift] Results exported to: " << config.outputPath << "\n";
    return exitCode;
}
