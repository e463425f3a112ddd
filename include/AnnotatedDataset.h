#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// Ordered categorical annotation. codes[i] indexes categories, -1 marks a missing value.
struct CategoricalAnnotation {
    std::vector<std::string> categories;
    std::vector<int> codes;

    size_t categoryCount() const noexcept { return categories.size(); }

    /**
     * @brief Counts observations per category, in category order.
     */
    std::vector<size_t> categorySizes() const;

    /**
     * @brief Replaces category labels in place, keeping codes untouched.
     * @pre labels.size() == categoryCount() and labels are unique.
     * @throws Dotmatrix::DatasetException when the label set is invalid.
     */
    void setCategoryLabels(std::vector<std::string> labels);

    /**
     * @brief Builds a categorical annotation from raw labels.
     * @details Empty labels become missing values. When order is empty the categories
     * are the sorted distinct labels (numeric order when every label parses as a number).
     * @throws Dotmatrix::DatasetException when a label is absent from an explicit order.
     */
    static CategoricalAnnotation fromLabels(const std::vector<std::string>& labels,
                                            std::vector<std::string> order = {});

    /**
     * @brief Builds a categorical annotation from a numeric column ordered by value.
     */
    static CategoricalAnnotation fromNumeric(const std::vector<double>& values);
};

// Dense observation-by-feature matrix stored column-wise (one vector per feature).
struct ExpressionMatrix {
    std::vector<std::string> varNames;
    std::vector<std::vector<double>> columns;

    size_t varCount() const noexcept { return varNames.size(); }
    int findVar(const std::string& name) const;
};

class AnnotatedDataset {
public:
    explicit AnnotatedDataset(size_t nObs = 0);

    size_t nObs() const noexcept { return nObs_; }

    void addNumericAnnotation(const std::string& name, std::vector<double> values);
    void addCategoricalAnnotation(const std::string& name, CategoricalAnnotation annotation);

    bool hasAnnotation(const std::string& name) const;
    bool hasNumericAnnotation(const std::string& name) const;
    bool hasCategoricalAnnotation(const std::string& name) const;

    /**
     * @throws Dotmatrix::MissingKeyException when the annotation does not exist.
     */
    const std::vector<double>& numericAnnotation(const std::string& name) const;
    const CategoricalAnnotation& categoricalAnnotation(const std::string& name) const;
    CategoricalAnnotation& categoricalAnnotation(const std::string& name);

    // Annotation names in insertion order.
    const std::vector<std::string>& annotationNames() const noexcept { return annotationOrder_; }

    /**
     * @brief Installs the processed expression matrix.
     * @throws Dotmatrix::DatasetException on column length or name mismatch.
     */
    void setExpression(ExpressionMatrix x);
    void setRawExpression(ExpressionMatrix raw);

    bool hasRaw() const noexcept { return hasRaw_; }
    const ExpressionMatrix& expression() const noexcept { return x_; }
    const ExpressionMatrix& rawExpression() const noexcept { return raw_; }

private:
    size_t nObs_ = 0;
    std::unordered_map<std::string, std::vector<double>> numeric_;
    std::unordered_map<std::string, CategoricalAnnotation> categorical_;
    std::vector<std::string> annotationOrder_;
    ExpressionMatrix x_;
    ExpressionMatrix raw_;
    bool hasRaw_ = false;

    void checkNewAnnotation(const std::string& name, size_t length) const;
    void checkMatrix(const ExpressionMatrix& m, const std::string& what) const;
};
