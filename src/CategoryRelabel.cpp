#include "CategoryRelabel.h"

#include <utility>

ScopedCategoryRelabel::ScopedCategoryRelabel(CategoricalAnnotation& annotation, std::vector<std::string> displayLabels)
    : annotation_(annotation), original_(annotation.categories) {
    annotation_.setCategoryLabels(std::move(displayLabels));
    active_ = true;
}

ScopedCategoryRelabel::~ScopedCategoryRelabel() {
    release();
}

void ScopedCategoryRelabel::release() noexcept {
    if (!active_) return;
    annotation_.categories.swap(original_);
    active_ = false;
}

std::vector<std::string> annotatedCategoryLabels(const CategoricalAnnotation& annotation) {
    const std::vector<size_t> sizes = annotation.categorySizes();
    std::vector<std::string> out;
    out.reserve(annotation.categories.size());
    for (size_t i = 0; i < annotation.categories.size(); ++i) {
        out.push_back(std::to_string(i) + ": " + annotation.categories[i] + " (n=" + std::to_string(sizes[i]) + ")");
    }
    return out;
}
