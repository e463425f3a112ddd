#include "CSVUtils.h"
#include "DotmatrixExceptions.h"

#include <fstream>
#include <unordered_set>

namespace CSVUtils {
int CsvTable::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;
    const std::streampos start = is.tellg();
    for (unsigned char expected : bom) {
        const int c = is.peek();
        if (c == EOF || static_cast<unsigned char>(c) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                val += '\n';
            } else {
                val += c;
            }
            continue;
        }
        if (c == '"' && trimUnquotedField(val).empty() && !fieldQuoted) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else if (!fieldQuoted) {
            val += c;
        }
        // Characters after a closing quote are dropped.
    }

    if (inQuotes && malformed) *malformed = true;
    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty() && row.empty()) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);
        const std::string original = out[i];
        for (size_t suffix = 2; seen.count(out[i]); ++suffix) {
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

CsvTable readTable(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Dotmatrix::IOException("could not open '" + path + "'");
    skipBOM(in);

    CsvTable table;
    bool malformed = false;
    size_t record = 0;
    while (in.peek() != EOF) {
        std::vector<std::string> row = parseCSVLine(in, delimiter, &malformed);
        ++record;
        if (malformed) {
            throw Dotmatrix::DatasetException("unterminated quoted field in '" + path + "' at record " +
                                              std::to_string(record));
        }
        if (row.empty()) continue;
        if (table.header.empty()) {
            table.header = normalizeHeader(row);
            continue;
        }
        if (row.size() != table.header.size()) {
            throw Dotmatrix::DatasetException("'" + path + "' record " + std::to_string(record) + " has " +
                                              std::to_string(row.size()) + " fields, expected " +
                                              std::to_string(table.header.size()));
        }
        table.rows.push_back(std::move(row));
    }
    if (table.header.empty()) throw Dotmatrix::DatasetException("'" + path + "' is empty");
    return table;
}
} // namespace CSVUtils
