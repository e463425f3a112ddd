#pragma once
#include "GroupAggregator.h"

#include <ostream>
#include <string>

namespace StatsExport {
// Long-format column names, one row per (group, feature) cell.
extern const char* const kColumns[7];

/**
 * @brief Writes the matrix as CSV with a header row; labels are quoted when needed.
 */
void writeCsv(const StatMatrix& stats, std::ostream& out);

/**
 * @brief Writes basePath + ".csv" and, for format "parquet", basePath + ".parquet" as well.
 * @details Builds without Arrow/Parquet print a warning and keep the CSV.
 * @post Returns the path of the CSV file.
 * @throws Dotmatrix::IOException when the CSV cannot be written.
 * @throws Dotmatrix::InvalidArgumentException for a format other than csv|parquet.
 */
std::string exportStatMatrix(const StatMatrix& stats, const std::string& basePath, const std::string& format);
} // namespace StatsExport
