#pragma once
#include "AnnotatedDataset.h"
#include "CSVUtils.h"

#include <string>
#include <vector>

struct DatasetSource {
    std::string annotationPath;               // per-observation annotations, optional
    std::string expressionPath;               // observation x feature values, optional
    std::string rawExpressionPath;            // optional
    std::string indexColumn;                  // observation id column present in every file, optional
    std::vector<std::string> categoricalColumns; // annotation columns forced to categorical
    char delimiter = ',';
};

class DatasetLoader {
public:
    /**
     * @brief Builds an AnnotatedDataset from the CSV files named in source.
     * @details Annotation columns whose non-empty cells all parse as numbers become numeric
     * annotations (empty cells read as NaN); the rest become categorical with sorted categories.
     * @throws Dotmatrix::IOException when a file cannot be read.
     * @throws Dotmatrix::DatasetException on row count, id or value mismatches.
     */
    static AnnotatedDataset load(const DatasetSource& source);

    static ExpressionMatrix toExpressionMatrix(const CSVUtils::CsvTable& table,
                                               const std::string& indexColumn,
                                               const std::string& what);

    static void addAnnotations(AnnotatedDataset& data,
                               const CSVUtils::CsvTable& table,
                               const std::string& indexColumn,
                               const std::vector<std::string>& categoricalColumns);
};
