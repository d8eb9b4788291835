#include "SiftConfig.h"
#include "CommonUtils.h"
#include "EncodingResolver.h"
#include "SiftExceptions.h"
#include "TypeInference.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Sift::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Sift::SiftException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Sift::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key) {
    if (value.empty() || value.front() == '-') {
        throw Sift::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Sift::ConfigurationException("Value for " + key + " exceeds size_t range");
    }
    return static_cast<size_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Sift::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            const char next = value[i + 1];
            if (next == 't') { out.push_back('\t'); ++i; continue; }
            if (next == '\\') { out.push_back('\\'); ++i; continue; }
        }
        out.push_back(value[i]);
    }
    return out;
}

char parseSingleChar(const std::string& raw, const std::string& key) {
    const std::string lowered = CommonUtils::toLower(raw);
    if (lowered == "tab" || raw == "\\t") return '\t';
    if (lowered == "comma") return ',';
    if (lowered == "semicolon") return ';';
    if (lowered == "pipe") return '|';
    if (raw.size() != 1) throw Sift::ConfigurationException(key + " expects a single character");
    return raw.front();
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    static const std::unordered_map<std::string, std::string> aliases = {
        {"quote", "quote_char"},
        {"trim", "trim_chars"},
        {"preview", "preview_size"},
        {"format", "output_format"},
    };
    const auto it = aliases.find(out);
    return it == aliases.end() ? out : it->second;
}

std::vector<std::pair<std::string, std::string>> parseBooleanTokens(const std::string& value) {
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& item : CommonUtils::splitList(value, ',')) {
        const std::vector<std::string> parts = CommonUtils::splitList(item, '/');
        if (parts.size() != 2) {
            throw Sift::ConfigurationException("boolean_tokens expects pairs like true/false, got: " + item);
        }
        pairs.emplace_back(parts[0], parts[1]);
    }
    return pairs;
}
}

void SiftConfig::applySetting(SiftConfig& config, const std::string& rawKey, const std::string& rawValue) {
    const std::string key = normalizeConfigKey(rawKey);
    const std::string value = maybeUnquote(rawValue);

    if (key == "encoding") {
        const std::string lowered = CommonUtils::toLower(value);
        if (value.empty() || lowered == "auto") {
            config.encoding.clear();
            return;
        }
        const auto canonical = EncodingResolver::canonicalName(value);
        if (!canonical) throw Sift::ConfigurationException("Unsupported encoding: " + value);
        config.encoding = *canonical;
    } else if (key == "delimiter") {
        config.inference.dialect.delimiter = parseSingleChar(value, "delimiter");
    } else if (key == "quote_char") {
        config.inference.dialect.quote = parseSingleChar(value, "quote_char");
    } else if (key == "trim_chars") {
        config.inference.trimChars = unescape(value);
    } else if (key == "max_bytes") {
        config.limits.maxBytes = parseSizeStrict(value, key);
    } else if (key == "max_rows") {
        config.limits.maxRows = parseSizeStrict(value, key);
    } else if (key == "max_columns") {
        config.limits.maxColumns = parseSizeStrict(value, key);
    } else if (key == "preview_size") {
        config.limits.previewSize = parseSizeStrict(value, key);
    } else if (key == "boolean_tokens") {
        config.inference.booleanTokens = parseBooleanTokens(value);
    } else if (key == "date_patterns") {
        config.inference.datePatterns = CommonUtils::splitList(value, ';');
    } else if (key == "malformed_rows") {
        const std::string policy = CommonUtils::toLower(value);
        if (policy == "exclude") config.inference.malformedRows = MalformedRowPolicy::EXCLUDE;
        else if (policy == "reject") config.inference.malformedRows = MalformedRowPolicy::REJECT;
        else throw Sift::ConfigurationException("malformed_rows must be exclude or reject");
    } else if (key == "output_format") {
        config.outputFormat = CommonUtils::toLower(value);
    } else if (key == "output") {
        config.outputPath = value;
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else {
        throw Sift::ConfigurationException("Unknown configuration key: " + rawKey);
    }
}

SiftConfig SiftConfig::fromArgs(int argc, char* argv[]) {
    SiftConfig config;
    const std::string prog = argc > 0 ? argv[0] : "sift";

    // The config file is the base layer; every other flag overrides it.
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw Sift::ConfigurationException("--config expects a path");
            config.configPath = argv[i + 1];
            break;
        }
    }
    if (!config.configPath.empty()) {
        config = fromFile(config.configPath, config);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw Sift::ConfigurationException(arg + " expects a value");
            applySetting(config, arg.substr(2), argv[++i]);
            continue;
        }
        config.inputPaths.push_back(arg);
    }

    if (config.inputPaths.empty()) {
        throw Sift::ConfigurationException("Usage: " + prog + " <file.csv> [more.csv ...] [options]");
    }
    config.validate();
    return config;
}

SiftConfig SiftConfig::fromFile(const std::string& configPath, const SiftConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Sift::ConfigurationException("Could not open config file: " + configPath);

    SiftConfig config = base;
    config.configPath = configPath;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string trimmed = CommonUtils::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        const size_t sep = trimmed.find(':');
        if (sep == std::string::npos) {
            throw Sift::ConfigurationException("Expected 'key: value' at " + configPath + ":" + std::to_string(lineNo));
        }
        applySetting(config, trimmed.substr(0, sep), trimmed.substr(sep + 1));
    }

    config.validate();
    return config;
}

void SiftConfig::validate() const {
    const CSVUtils::Dialect& dialect = inference.dialect;
    if (dialect.delimiter == dialect.quote) {
        throw Sift::ConfigurationException("delimiter and quote_char must differ");
    }
    if (dialect.delimiter == '\n' || dialect.delimiter == '\r' || dialect.quote == '\n' || dialect.quote == '\r') {
        throw Sift::ConfigurationException("delimiter and quote_char cannot be line breaks");
    }
    if (limits.maxBytes == 0 || limits.maxRows == 0 || limits.maxColumns == 0) {
        throw Sift::ConfigurationException("max_bytes, max_rows and max_columns must be > 0");
    }
    if (inference.booleanTokens.empty()) {
        throw Sift::ConfigurationException("boolean_tokens must contain at least one pair");
    }

    std::unordered_map<std::string, bool> seen;
    auto registerToken = [&seen](const std::string& token, bool meaning) {
        const auto it = seen.find(token);
        if (it != seen.end() && it->second != meaning) {
            throw Sift::ConfigurationException("boolean token '" + token + "' is both true and false");
        }
        seen[token] = meaning;
    };
    for (const auto& pair : inference.booleanTokens) {
        const std::string truthy = CommonUtils::toLower(pair.first);
        const std::string falsy = CommonUtils::toLower(pair.second);
        if (truthy == falsy) {
            throw Sift::ConfigurationException("boolean token pair has identical sides: " + pair.first);
        }
        registerToken(truthy, true);
        registerToken(falsy, false);
    }

    for (const auto& pattern : inference.datePatterns) {
        if (!TypeInference::isValidDatePattern(pattern)) {
            throw Sift::ConfigurationException("Invalid date pattern (needs %Y or %y, %m or %b, and %d): " + pattern);
        }
    }
    if (outputFormat != "table" && outputFormat != "json") {
        throw Sift::ConfigurationException("output_format must be table or json");
    }
}

std::string SiftConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " <file.csv> [more.csv ...] [options]\n"
           "Options:\n"
           "  --config <path>                 key: value config file (flags override it)\n"
           "  --encoding <name|auto>          utf-8, utf-16[le|be], latin-1, ascii, windows-1252 (default: auto)\n"
           "  --delimiter <char|tab>          Field delimiter (default: ,)\n"
           "  --quote <char>                  Quote character (default: \")\n"
           "  --trim <chars>                  Whitespace trimmed from cells before inference (default: space, \\t)\n"
           "  --max-bytes <n>                 Maximum file size in bytes (default: 10485760)\n"
           "  --max-rows <n>                  Maximum data rows (default: 1000000)\n"
           "  --max-columns <n>               Maximum columns (default: 100)\n"
           "  --preview <n>                   Preview rows and sample values per column (default: 5)\n"
           "  --boolean-tokens <t/f,...>      Boolean token pairs (default: true/false,yes/no,1/0)\n"
           "  --date-patterns <p;p;...>       Date patterns tried in order (default: %Y-%m-%d;...)\n"
           "  --malformed-rows <exclude|reject> Malformed row handling (default: exclude)\n"
           "  --format <table|json>           Output format (default: table)\n"
           "  --output <file>                 Write output to file instead of stdout\n"
           "  --verbose                       Enable detailed logs\n"
           "  --help                          Show this help message\n";
}
