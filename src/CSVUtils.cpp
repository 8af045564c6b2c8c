#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.get();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
    }
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
    };

    char c;
    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field.push_back('\n');
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"' && trimUnquotedField(field).empty() && !fieldQuoted) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            field.push_back(c);
        }
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(field).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        const std::string original = out[i];
        size_t suffix = 2;
        while (seen.count(out[i]) != 0) {
            out[i] = original + "_" + std::to_string(suffix++);
        }
        seen.insert(out[i]);
    }
    return out;
}
} // namespace CSVUtils
