#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization; cells stay strings, typing is the loader's job.
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    int columnIndex(const std::string& name) const;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one RFC-4180 record; quoted fields may span lines and contain doubled quotes.
 * @post Returns an empty vector at end of input or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

// Empty names become column_<n>, duplicates get a _<k> suffix.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Reads a whole delimited file with a header row.
 * @throws Dotmatrix::IOException when the file cannot be opened.
 * @throws Dotmatrix::DatasetException for an empty file, an unterminated quote or a ragged row.
 */
CsvTable readTable(const std::string& path, char delimiter = ',');
} // namespace CSVUtils
