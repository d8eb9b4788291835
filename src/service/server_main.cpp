#include "AnalysisService.h"
#include "SiftConfig.h"
#include "SiftExceptions.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --host <addr>      Bind address (default: 0.0.0.0)\n"
              << "  --port <n>         Listen port (default: 8080)\n"
              << "  --threads <n>      Worker threads (default: 8)\n"
              << "  --config <path>    key: value config file with analysis defaults\n"
              << "  --help             Show this help message\n";
}

int parseIntArg(const std::string& value, const std::string& flag, int minValue) {
    try {
        size_t pos = 0;
        const int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument("contains trailing characters");
        }
        if (parsed < minValue) {
            throw std::out_of_range("below minimum");
        }
        return parsed;
    } catch (const std::exception&) {
        throw Sift::ConfigurationException("Invalid integer value for " + flag + ": " + value);
    }
}
}

int main(int argc, char* argv[]) {
    AnalysisService::Config serviceConfig;
    SiftConfig analysisDefaults;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                throw Sift::ConfigurationException(arg + " expects a value");
            }
            const std::string value = argv[++i];
            if (arg == "--host") {
                serviceConfig.host = value;
            } else if (arg == "--port") {
                serviceConfig.port = parseIntArg(value, arg, 1);
            } else if (arg == "--threads") {
                serviceConfig.threadCount = static_cast<size_t>(parseIntArg(value, arg, 1));
            } else if (arg == "--config") {
                analysisDefaults = SiftConfig::fromFile(value, analysisDefaults);
            } else {
                throw Sift::ConfigurationException("Unknown option: " + arg);
            }
        }
        analysisDefaults.validate();
    } catch (const Sift::SiftException& e) {
        std::cerr << "[Sift Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    RequestMonitor monitor;
    AnalysisService service(analysisDefaults, monitor);
    return service.start(serviceConfig);
}
