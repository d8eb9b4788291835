#include "TerminalUI.h"
#include "TypeInference.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <variant>

namespace {
std::string formatOrdered(const std::optional<OrderedValue>& value) {
    if (!value) return "-";
    if (const auto* iv = std::get_if<int64_t>(&*value)) return std::to_string(*iv);
    if (const auto* dv = std::get_if<double>(&*value)) {
        std::ostringstream os;
        os << std::setprecision(10) << *dv;
        return os.str();
    }
    return TypeInference::formatDate(std::get<DateValue>(*value));
}

std::string clip(const std::string& value, size_t width) {
    std::string flat;
    flat.reserve(value.size());
    for (char ch : value) flat.push_back((ch == '\n' || ch == '\r') ? ' ' : ch);
    if (flat.size() <= width) return flat;
    return flat.substr(0, width - 3) + "...";
}
}

void TerminalUI::printProfileTable(std::ostream& out, const std::string& fileName, const AnalysisReport& report) {
    size_t maxNameLen = 12;
    for (const auto& col : report.columns()) maxNameLen = std::max(maxNameLen, std::min<size_t>(col.name.size(), 32));
    const int w = static_cast<int>(maxNameLen) + 2;

    out << "\n============================================ COLUMN PROFILE ============================================\n";
    out << "File: " << fileName << " | encoding " << report.encoding() << " | " << report.byteSize() << " bytes | "
        << report.rowCount() << " rows x " << report.columnCount() << " columns";
    if (report.malformedRowCount() > 0) out << " | " << report.malformedRowCount() << " malformed";
    out << "\n";
    out << std::left
        << std::setw(w) << "Column"
        << std::setw(10) << "Type"
        << std::setw(10) << "Nulls"
        << std::setw(10) << "Distinct"
        << std::setw(22) << "Min"
        << "Max\n";
    out << std::string(static_cast<size_t>(w) + 10 * 3 + 22 + 22, '-') << "\n";

    for (const auto& col : report.columns()) {
        out << std::left
            << std::setw(w) << clip(col.name, maxNameLen)
            << std::setw(10) << columnTypeName(col.type)
            << std::setw(10) << col.nullCount
            << std::setw(10) << col.distinctCount
            << std::setw(22) << clip(formatOrdered(col.min), 20)
            << clip(formatOrdered(col.max), 20) << "\n";
    }
    for (const auto& note : report.validation().notes) {
        out << "[Note] " << note << "\n";
    }
    out << "========================================================================================================\n";
}

void TerminalUI::printPreview(std::ostream& out, const AnalysisReport& report) {
    out << "\n[Preview] first " << report.preview().size() << " row(s)\n";
    for (const auto& row : report.preview()) {
        out << "  " << std::right << std::setw(6) << row.lineNumber << (row.malformed ? " ! " : " | ");
        for (size_t i = 0; i < row.cells.size(); ++i) {
            if (i > 0) out << " | ";
            out << clip(row.cells[i], 24);
        }
        out << "\n";
    }
}

void TerminalUI::printError(std::ostream& out, const std::string& fileName, const EngineError& error) {
    out << "[Sift Error] " << fileName << ": " << engineErrorKindName(error.kind);
    if (!error.rule.empty() && error.rule != engineErrorKindName(error.kind)) out << " (" << error.rule << ")";
    out << ": " << error.detail << "\n";
}
