#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization over already-decoded text.
// This module does not infer semantic types and never trims cells.
struct Dialect {
	char delimiter = ',';
	char quote = '"';
};

struct DataRow {
	std::vector<std::string> cells;
	size_t lineNumber = 0;          // 1-based physical line where the record starts
	bool malformed = false;         // wrong cell count or unterminated quote
};

struct ParsedTable {
	std::vector<std::string> header;
	std::vector<DataRow> rows;
	size_t malformedCount = 0;

	size_t validRowCount() const noexcept { return rows.size() - malformedCount; }
};

class RecordReader {
public:
	RecordReader(std::string_view text, Dialect dialect);

	/**
	 * @brief Parses the next non-blank record into cells.
	 * @param unterminated set when input ended inside a quoted field.
	 * @return false once the input is exhausted.
	 */
	bool next(std::vector<std::string>& cells, bool* unterminated = nullptr);

	/**
	 * @brief Advances past the next non-blank record without materializing its cells.
	 */
	bool skip(bool* unterminated = nullptr);

	size_t recordLine() const noexcept { return recordLine_; }

private:
	template <bool Collect>
	bool scan(std::vector<std::string>* cells, bool* unterminated);
	void skipBlankLines();

	std::string_view text_;
	Dialect dialect_;
	size_t pos_ = 0;
	size_t line_ = 1;
	size_t recordLine_ = 0;
};

/**
 * @brief Splits text into a header and data rows; rows whose width differs from the header are flagged.
 * @pre text is non-empty and its header record is terminated (see StructuralValidator).
 */
ParsedTable parseTable(std::string_view text, const Dialect& dialect);
}
