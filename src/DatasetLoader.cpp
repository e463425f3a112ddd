#include "DatasetLoader.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <limits>
#include <optional>

namespace {
std::vector<std::string> idsOf(const CSVUtils::CsvTable& table, const std::string& indexColumn, const std::string& what) {
    if (indexColumn.empty()) return {};
    const int idx = table.columnIndex(indexColumn);
    if (idx < 0) {
        throw Dotmatrix::DatasetException(what + " has no index column '" + indexColumn + "'");
    }
    std::vector<std::string> ids;
    ids.reserve(table.rows.size());
    for (const auto& row : table.rows) ids.push_back(row[static_cast<size_t>(idx)]);
    return ids;
}

void checkIds(std::optional<std::vector<std::string>>& reference,
              const std::vector<std::string>& ids,
              const std::string& what) {
    if (ids.empty()) return;
    if (!reference.has_value()) {
        reference = ids;
        return;
    }
    for (size_t i = 0; i < ids.size() && i < reference->size(); ++i) {
        if (ids[i] != (*reference)[i]) {
            throw Dotmatrix::DatasetException(what + " row " + std::to_string(i + 1) + " has id '" + ids[i] +
                                              "', expected '" + (*reference)[i] + "'");
        }
    }
}
} // namespace

ExpressionMatrix DatasetLoader::toExpressionMatrix(const CSVUtils::CsvTable& table,
                                                   const std::string& indexColumn,
                                                   const std::string& what) {
    ExpressionMatrix m;
    for (size_t c = 0; c < table.header.size(); ++c) {
        if (!indexColumn.empty() && table.header[c] == indexColumn) continue;
        std::vector<double> column;
        column.reserve(table.rows.size());
        for (size_t r = 0; r < table.rows.size(); ++r) {
            double v = 0.0;
            if (!CommonUtils::parseDouble(table.rows[r][c], v)) {
                throw Dotmatrix::DatasetException(what + " value '" + table.rows[r][c] + "' at row " +
                                                  std::to_string(r + 1) + ", column '" + table.header[c] +
                                                  "' is not numeric");
            }
            column.push_back(v);
        }
        m.varNames.push_back(table.header[c]);
        m.columns.push_back(std::move(column));
    }
    return m;
}

void DatasetLoader::addAnnotations(AnnotatedDataset& data,
                                   const CSVUtils::CsvTable& table,
                                   const std::string& indexColumn,
                                   const std::vector<std::string>& categoricalColumns) {
    for (size_t c = 0; c < table.header.size(); ++c) {
        const std::string& name = table.header[c];
        if (!indexColumn.empty() && name == indexColumn) continue;

        std::vector<std::string> labels;
        labels.reserve(table.rows.size());
        for (const auto& row : table.rows) labels.push_back(row[c]);

        const bool forcedCategorical =
            std::find(categoricalColumns.begin(), categoricalColumns.end(), name) != categoricalColumns.end();
        bool numeric = !forcedCategorical;
        bool anyValue = false;
        std::vector<double> values(labels.size(), std::numeric_limits<double>::quiet_NaN());
        for (size_t r = 0; r < labels.size() && numeric; ++r) {
            if (CommonUtils::trim(labels[r]).empty()) continue;
            anyValue = true;
            if (!CommonUtils::parseDouble(labels[r], values[r])) numeric = false;
        }

        if (numeric && anyValue) {
            data.addNumericAnnotation(name, std::move(values));
        } else {
            data.addCategoricalAnnotation(name, CategoricalAnnotation::fromLabels(labels));
        }
    }
}

AnnotatedDataset DatasetLoader::load(const DatasetSource& source) {
    if (source.annotationPath.empty() && source.expressionPath.empty()) {
        throw Dotmatrix::DatasetException("at least one of the annotation or expression files is required");
    }

    std::optional<CSVUtils::CsvTable> annotations;
    std::optional<CSVUtils::CsvTable> expression;
    std::optional<CSVUtils::CsvTable> raw;
    if (!source.annotationPath.empty()) annotations = CSVUtils::readTable(source.annotationPath, source.delimiter);
    if (!source.expressionPath.empty()) expression = CSVUtils::readTable(source.expressionPath, source.delimiter);
    if (!source.rawExpressionPath.empty()) raw = CSVUtils::readTable(source.rawExpressionPath, source.delimiter);

    const size_t nObs = annotations ? annotations->rows.size() : expression->rows.size();
    std::optional<std::vector<std::string>> ids;
    auto checkRows = [&](const std::optional<CSVUtils::CsvTable>& t, const std::string& what) {
        if (!t) return;
        if (t->rows.size() != nObs) {
            throw Dotmatrix::DatasetException(what + " has " + std::to_string(t->rows.size()) +
                                              " rows, expected " + std::to_string(nObs));
        }
        checkIds(ids, idsOf(*t, source.indexColumn, what), what);
    };
    checkRows(annotations, "annotation file '" + source.annotationPath + "'");
    checkRows(expression, "expression file '" + source.expressionPath + "'");
    checkRows(raw, "raw expression file '" + source.rawExpressionPath + "'");

    AnnotatedDataset data(nObs);
    if (annotations) addAnnotations(data, *annotations, source.indexColumn, source.categoricalColumns);
    if (expression) data.setExpression(toExpressionMatrix(*expression, source.indexColumn, "expression"));
    if (raw) data.setRawExpression(toExpressionMatrix(*raw, source.indexColumn, "raw expression"));
    return data;
}
