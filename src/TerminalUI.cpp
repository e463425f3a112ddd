#include "TerminalUI.h"
#include "CommonUtils.h"

#include <algorithm>
#include <iomanip>

namespace {
size_t widest(const std::vector<std::string>& names, size_t floor) {
    size_t w = floor;
    for (const auto& name : names) w = std::max(w, name.length());
    return w;
}

std::string banner(const std::string& title, size_t width) {
    const std::string label = " " + title + " ";
    if (label.size() >= width) return label;
    const size_t left = (width - label.size()) / 2;
    return std::string(left, '=') + label + std::string(width - left - label.size(), '=');
}

// Restores the caller's formatting flags and precision on scope exit.
class StreamStateGuard {
public:
    explicit StreamStateGuard(std::ostream& out)
        : out_(out), flags_(out.flags()), precision_(out.precision()) {}
    ~StreamStateGuard() {
        out_.flags(flags_);
        out_.precision(precision_);
    }
    StreamStateGuard(const StreamStateGuard&) = delete;
    StreamStateGuard& operator=(const StreamStateGuard&) = delete;

private:
    std::ostream& out_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};
} // namespace

void TerminalUI::printStatMatrix(const StatMatrix& stats, bool meanOnlyExpressed, std::ostream& out) {
    const int gw = static_cast<int>(widest(stats.groupLabels(), 12)) + 2;
    const int fw = static_cast<int>(widest(stats.featureLabels(), 12)) + 2;
    const size_t width = static_cast<size_t>(gw + fw) + 12 * 4;
    const StreamStateGuard guard(out);

    out << "\n" << banner("DOT MATRIX SUMMARY", width) << "\n";
    out << std::left
        << std::setw(gw) << "Group"
        << std::setw(fw) << "Feature"
        << std::setw(12) << "Size"
        << std::setw(12) << "Expressed"
        << std::setw(12) << "Fraction"
        << std::setw(12) << (meanOnlyExpressed ? "MeanExpr" : "Mean") << "\n";
    out << std::string(width, '-') << "\n";

    for (size_t g = 0; g < stats.groupCount(); ++g) {
        for (size_t f = 0; f < stats.featureCount(); ++f) {
            const StatCell& cell = stats.at(g, f);
            out << std::left << std::setw(gw) << stats.groupLabels()[g]
                << std::setw(fw) << stats.featureLabels()[f]
                << std::right
                << std::setw(10) << stats.groupSizes()[g] << "  "
                << std::setw(10) << cell.countExpressed << "  "
                << std::setw(10) << CommonUtils::formatPercent(cell.fraction) << "  "
                << std::fixed << std::setprecision(3)
                << std::setw(10) << cell.mean(meanOnlyExpressed) << "\n";
        }
    }
    out << std::string(width, '=') << "\n";
}

void TerminalUI::printCrossTable(const CrossTable& table, const std::string& x, const std::string& y,
                                 bool percentages, std::ostream& out) {
    const int rw = static_cast<int>(widest(table.rowLabels, x.size())) + 2;
    const int cw = static_cast<int>(std::max<size_t>(10, widest(table.columnLabels, 0) + 2));
    const size_t width = static_cast<size_t>(rw) + static_cast<size_t>(cw) * table.columnLabels.size();
    const StreamStateGuard guard(out);

    out << "\n" << banner("CROSS TABLE " + x + " x " + y, std::max<size_t>(width, 40)) << "\n";
    out << std::left << std::setw(rw) << x << std::right;
    for (const auto& label : table.columnLabels) out << std::setw(cw) << label;
    out << "\n" << std::string(std::max<size_t>(width, 40), '-') << "\n";

    for (size_t r = 0; r < table.rowLabels.size(); ++r) {
        out << std::left << std::setw(rw) << table.rowLabels[r] << std::right;
        for (double v : table.values[r]) {
            if (percentages) {
                out << std::setw(cw) << std::fixed << std::setprecision(2) << v;
            } else {
                out << std::setw(cw) << static_cast<long long>(v);
            }
        }
        out << "\n";
    }
    out << std::string(std::max<size_t>(width, 40), '=') << "\n";
}
