#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization.
// Column kinds are decided by DatasetLoader, not here.

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @param malformed Set when the record ends inside an open quote.
 * @post Returns an empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

/**
 * @brief Names blank header cells `column_<i>` and suffixes duplicates with `_2`, `_3`, ...
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
