#pragma once
#include "AnalysisEngine.h"

#include <ostream>
#include <string>

class TerminalUI {
public:
    static void printProfileTable(std::ostream& out, const std::string& fileName, const AnalysisReport& report);
    static void printPreview(std::ostream& out, const AnalysisReport& report);
    static void printError(std::ostream& out, const std::string& fileName, const EngineError& error);
};
