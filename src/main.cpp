#include "CrossTable.h"
#include "DatasetLoader.h"
#include "DotmatrixConfig.h"
#include "DotmatrixExceptions.h"
#include "Dotplot.h"
#include "StatsExport.h"
#include "TerminalUI.h"

#include <iostream>

namespace {
int runDotplot(const DotmatrixConfig& config, AnnotatedDataset& data) {
    const DotplotOptions options = config.toDotplotOptions();

    if (config.printTables || !config.statsOutput.empty()) {
        const StatMatrix stats = computeDotplotStatistics(data, config.keys, options);
        if (config.printTables) TerminalUI::printStatMatrix(stats, options.meanOnlyExpressed);
        if (!config.statsOutput.empty()) {
            const std::string path = StatsExport::exportStatMatrix(stats, config.statsOutput, config.statsFormat);
            std::cout << "[Dotmatrix][Export] Statistics written to " << path << "\n";
        }
    }

    if (options.savePath.empty()) return 0;
    const DotplotResult result = dotplot(data, config.keys, options);
    const AxisHandle& handle = std::get<AxisHandle>(result);
    if (config.verbose) {
        std::cout << "[Dotmatrix][Plot] Figure " << handle.layout.width << "x" << handle.layout.height
                  << " in, " << handle.layout.columnCount << " columns x " << handle.layout.rowCount << " rows\n";
    }
    return 0;
}

int runCrossTable(const DotmatrixConfig& config, const AnnotatedDataset& data) {
    const CrossNormalise mode = parseCrossNormalise(config.normalise);
    const CrossTable table = crossTable(data, config.crossX, config.crossY, mode);
    TerminalUI::printCrossTable(table, config.crossX, config.crossY, mode != CrossNormalise::None);
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    DotmatrixConfig config;
    try {
        config = DotmatrixConfig::fromArgs(argc, argv);
    } catch (const Dotmatrix::DotmatrixException& e) {
        std::cerr << "[Dotmatrix][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        if (config.verbose) {
            std::cout << "[Dotmatrix][Data] Loading annotations='" << config.annotationPath
                      << "' expression='" << config.expressionPath << "'\n";
        }
        AnnotatedDataset data = DatasetLoader::load(config.toDatasetSource());
        if (config.verbose) {
            std::cout << "[Dotmatrix][Data] " << data.nObs() << " observations, "
                      << data.annotationNames().size() << " annotations, "
                      << data.expression().varCount() << " features"
                      << (data.hasRaw() ? " (+raw)" : "") << "\n";
        }

        if (config.command == "crosstab") return runCrossTable(config, data);
        return runDotplot(config, data);
    } catch (const Dotmatrix::DotmatrixException& e) {
        std::cerr << "[Dotmatrix][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Dotmatrix][Exception] " << e.what() << "\n";
        return 1;
    }
}
