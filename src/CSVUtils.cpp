#include "CSVUtils.h"

#include <utility>

namespace CSVUtils {
RecordReader::RecordReader(std::string_view text, Dialect dialect)
    : text_(text), dialect_(dialect) {}

void RecordReader::skipBlankLines() {
    while (pos_ < text_.size()) {
        const char c = text_[pos_];
        if (c == '\r') {
            ++pos_;
            if (pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
        } else if (c == '\n') {
            ++pos_;
        } else {
            return;
        }
        ++line_;
    }
}

template <bool Collect>
bool RecordReader::scan(std::vector<std::string>* cells, bool* unterminated) {
    if (unterminated) *unterminated = false;
    if (Collect) cells->clear();

    skipBlankLines();
    if (pos_ >= text_.size()) return false;
    recordLine_ = line_;

    std::string field;
    bool inQuotes = false;
    bool atFieldStart = true;

    auto pushField = [&]() {
        if (Collect) {
            cells->push_back(std::move(field));
            field.clear();
        }
        atFieldStart = true;
    };

    while (pos_ < text_.size()) {
        const char c = text_[pos_++];

        if (inQuotes) {
            if (c == dialect_.quote) {
                if (pos_ < text_.size() && text_[pos_] == dialect_.quote) {
                    ++pos_;
                    if (Collect) field += dialect_.quote;
                } else {
                    inQuotes = false;
                }
                continue;
            }
            if (c == '\n' || (c == '\r' && !(pos_ < text_.size() && text_[pos_] == '\n'))) {
                ++line_;
            }
            if (Collect) field += c;
            continue;
        }

        if (c == dialect_.delimiter) {
            pushField();
            continue;
        }
        if (c == '\r' || c == '\n') {
            if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
            ++line_;
            pushField();
            return true;
        }
        if (c == dialect_.quote && atFieldStart) {
            inQuotes = true;
            atFieldStart = false;
            continue;
        }
        atFieldStart = false;
        if (Collect) field += c;
    }

    if (inQuotes && unterminated) *unterminated = true;
    pushField();
    return true;
}

bool RecordReader::next(std::vector<std::string>& cells, bool* unterminated) {
    return scan<true>(&cells, unterminated);
}

bool RecordReader::skip(bool* unterminated) {
    return scan<false>(nullptr, unterminated);
}

ParsedTable parseTable(std::string_view text, const Dialect& dialect) {
    ParsedTable table;
    RecordReader reader(text, dialect);
    if (!reader.next(table.header)) return table;

    std::vector<std::string> cells;
    bool unterminated = false;
    while (reader.next(cells, &unterminated)) {
        DataRow row;
        row.lineNumber = reader.recordLine();
        row.malformed = unterminated || cells.size() != table.header.size();
        row.cells = std::move(cells);
        if (row.malformed) ++table.malformedCount;
        table.rows.push_back(std::move(row));
        cells.clear();
    }
    return table;
}
} // namespace CSVUtils
