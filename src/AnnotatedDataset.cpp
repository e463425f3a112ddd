#include "AnnotatedDataset.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <sstream>
#include <unordered_set>

namespace {
std::string formatNumericLabel(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}
} // namespace

std::vector<size_t> CategoricalAnnotation::categorySizes() const {
    std::vector<size_t> sizes(categories.size(), 0);
    for (int code : codes) {
        if (code < 0 || static_cast<size_t>(code) >= sizes.size()) continue;
        ++sizes[static_cast<size_t>(code)];
    }
    return sizes;
}

void CategoricalAnnotation::setCategoryLabels(std::vector<std::string> labels) {
    if (labels.size() != categories.size()) {
        throw Dotmatrix::DatasetException("category relabel expects " + std::to_string(categories.size()) +
                                          " labels, got " + std::to_string(labels.size()));
    }
    std::unordered_set<std::string> seen;
    for (const auto& label : labels) {
        if (!seen.insert(label).second) {
            throw Dotmatrix::DatasetException("duplicate category label '" + label + "'");
        }
    }
    categories = std::move(labels);
}

CategoricalAnnotation CategoricalAnnotation::fromLabels(const std::vector<std::string>& labels,
                                                        std::vector<std::string> order) {
    CategoricalAnnotation out;
    if (order.empty()) {
        std::vector<std::string> distinct;
        std::unordered_set<std::string> seen;
        for (const auto& l : labels) {
            if (l.empty()) continue;
            if (seen.insert(l).second) distinct.push_back(l);
        }

        bool allNumeric = !distinct.empty();
        std::vector<std::pair<double, std::string>> numericKeys;
        numericKeys.reserve(distinct.size());
        for (const auto& l : distinct) {
            double v = 0.0;
            if (!CommonUtils::parseDouble(l, v)) {
                allNumeric = false;
                break;
            }
            numericKeys.push_back({v, l});
        }
        if (allNumeric) {
            std::stable_sort(numericKeys.begin(), numericKeys.end(), [](const auto& a, const auto& b) {
                return a.first < b.first;
            });
            for (auto& kv : numericKeys) order.push_back(std::move(kv.second));
        } else {
            std::sort(distinct.begin(), distinct.end());
            order = std::move(distinct);
        }
    }

    std::unordered_map<std::string, int> index;
    index.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        if (!index.emplace(order[i], static_cast<int>(i)).second) {
            throw Dotmatrix::DatasetException("duplicate category '" + order[i] + "' in explicit order");
        }
    }

    out.codes.reserve(labels.size());
    for (const auto& l : labels) {
        if (l.empty()) {
            out.codes.push_back(-1);
            continue;
        }
        auto it = index.find(l);
        if (it == index.end()) {
            throw Dotmatrix::DatasetException("label '" + l + "' is not listed in the category order");
        }
        out.codes.push_back(it->second);
    }
    out.categories = std::move(order);
    return out;
}

CategoricalAnnotation CategoricalAnnotation::fromNumeric(const std::vector<double>& values) {
    std::map<double, int> levels;
    for (double v : values) {
        if (std::isfinite(v)) levels.emplace(v, 0);
    }

    CategoricalAnnotation out;
    out.categories.reserve(levels.size());
    int next = 0;
    for (auto& kv : levels) {
        kv.second = next++;
        out.categories.push_back(formatNumericLabel(kv.first));
    }
    out.codes.reserve(values.size());
    for (double v : values) {
        out.codes.push_back(std::isfinite(v) ? levels.at(v) : -1);
    }
    return out;
}

int ExpressionMatrix::findVar(const std::string& name) const {
    auto it = std::find(varNames.begin(), varNames.end(), name);
    if (it == varNames.end()) return -1;
    return static_cast<int>(std::distance(varNames.begin(), it));
}

AnnotatedDataset::AnnotatedDataset(size_t nObs) : nObs_(nObs) {}

void AnnotatedDataset::checkNewAnnotation(const std::string& name, size_t length) const {
    if (name.empty()) {
        throw Dotmatrix::DatasetException("annotation name must not be empty");
    }
    if (hasAnnotation(name)) {
        throw Dotmatrix::DatasetException("annotation '" + name + "' already exists");
    }
    if (length != nObs_) {
        throw Dotmatrix::DatasetException("annotation '" + name + "' has " + std::to_string(length) +
                                          " values, expected " + std::to_string(nObs_));
    }
}

void AnnotatedDataset::addNumericAnnotation(const std::string& name, std::vector<double> values) {
    checkNewAnnotation(name, values.size());
    numeric_.emplace(name, std::move(values));
    annotationOrder_.push_back(name);
}

void AnnotatedDataset::addCategoricalAnnotation(const std::string& name, CategoricalAnnotation annotation) {
    checkNewAnnotation(name, annotation.codes.size());
    for (int code : annotation.codes) {
        if (code >= static_cast<int>(annotation.categories.size()) || code < -1) {
            throw Dotmatrix::DatasetException("annotation '" + name + "' has an out-of-range category code");
        }
    }
    categorical_.emplace(name, std::move(annotation));
    annotationOrder_.push_back(name);
}

bool AnnotatedDataset::hasAnnotation(const std::string& name) const {
    return hasNumericAnnotation(name) || hasCategoricalAnnotation(name);
}

bool AnnotatedDataset::hasNumericAnnotation(const std::string& name) const {
    return numeric_.find(name) != numeric_.end();
}

bool AnnotatedDataset::hasCategoricalAnnotation(const std::string& name) const {
    return categorical_.find(name) != categorical_.end();
}

const std::vector<double>& AnnotatedDataset::numericAnnotation(const std::string& name) const {
    auto it = numeric_.find(name);
    if (it == numeric_.end()) throw Dotmatrix::MissingKeyException("numeric annotation '" + name + "' not found");
    return it->second;
}

const CategoricalAnnotation& AnnotatedDataset::categoricalAnnotation(const std::string& name) const {
    auto it = categorical_.find(name);
    if (it == categorical_.end()) throw Dotmatrix::MissingKeyException("categorical annotation '" + name + "' not found");
    return it->second;
}

CategoricalAnnotation& AnnotatedDataset::categoricalAnnotation(const std::string& name) {
    auto it = categorical_.find(name);
    if (it == categorical_.end()) throw Dotmatrix::MissingKeyException("categorical annotation '" + name + "' not found");
    return it->second;
}

void AnnotatedDataset::checkMatrix(const ExpressionMatrix& m, const std::string& what) const {
    if (m.varNames.size() != m.columns.size()) {
        throw Dotmatrix::DatasetException(what + " has " + std::to_string(m.varNames.size()) + " names but " +
                                          std::to_string(m.columns.size()) + " columns");
    }
    std::unordered_set<std::string> seen;
    for (size_t j = 0; j < m.columns.size(); ++j) {
        if (!seen.insert(m.varNames[j]).second) {
            throw Dotmatrix::DatasetException(what + " has duplicate feature '" + m.varNames[j] + "'");
        }
        if (m.columns[j].size() != nObs_) {
            throw Dotmatrix::DatasetException(what + " feature '" + m.varNames[j] + "' has " +
                                              std::to_string(m.columns[j].size()) + " values, expected " +
                                              std::to_string(nObs_));
        }
    }
}

void AnnotatedDataset::setExpression(ExpressionMatrix x) {
    checkMatrix(x, "expression matrix");
    x_ = std::move(x);
}

void AnnotatedDataset::setRawExpression(ExpressionMatrix raw) {
    checkMatrix(raw, "raw expression matrix");
    raw_ = std::move(raw);
    hasRaw_ = true;
}
