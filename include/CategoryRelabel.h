#pragma once
#include "AnnotatedDataset.h"

#include <string>
#include <vector>

/**
 * @brief Temporarily replaces the labels of a categorical annotation.
 * @details The original labels are restored by release() or, at the latest, by the
 * destructor, so every exit path of the enclosing scope (exceptions included) sees
 * the annotation unchanged.
 */
class ScopedCategoryRelabel {
public:
    /**
     * @throws Dotmatrix::DatasetException when displayLabels does not match the category count.
     */
    ScopedCategoryRelabel(CategoricalAnnotation& annotation, std::vector<std::string> displayLabels);
    ~ScopedCategoryRelabel();

    ScopedCategoryRelabel(const ScopedCategoryRelabel&) = delete;
    ScopedCategoryRelabel& operator=(const ScopedCategoryRelabel&) = delete;

    void release() noexcept;
    bool active() const noexcept { return active_; }

private:
    CategoricalAnnotation& annotation_;
    std::vector<std::string> original_;
    bool active_ = false;
};

/**
 * @brief Display labels of the form "<index>: <label> (n=<size>)".
 */
std::vector<std::string> annotatedCategoryLabels(const CategoricalAnnotation& annotation);
