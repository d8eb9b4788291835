#pragma once
#include "AnalysisConfig.h"

#include <string>
#include <vector>

struct SiftConfig {
    std::vector<std::string> inputPaths;
    std::string configPath;
    std::string encoding;               // empty => detect per file
    AnalysisLimits limits;
    InferenceConfig inference;
    std::string outputFormat = "table"; // table|json
    std::string outputPath;             // empty => stdout
    bool verbose = false;
    bool showHelp = false;

    /**
     * @brief Builds config from CLI args, layering flags over an optional --config file.
     * @post Returns a validated config object (or one with showHelp set).
     * @throws Sift::ConfigurationException on invalid arguments or values.
     */
    static SiftConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (with # comments) on top of `base`.
     * @throws Sift::ConfigurationException on unreadable files, unknown keys or invalid values.
     */
    static SiftConfig fromFile(const std::string& configPath, const SiftConfig& base);

    /**
     * @brief Applies one setting; CLI flags and config file keys share this path.
     * @throws Sift::ConfigurationException on unknown keys or invalid values.
     */
    static void applySetting(SiftConfig& config, const std::string& key, const std::string& value);

    /**
     * @brief Validates dialect, limits, boolean tokens and date patterns.
     * @throws Sift::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage(const std::string& prog);
};
