#include "StatsExport.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#ifdef DOTMATRIX_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace StatsExport {
const char* const kColumns[7] = {
    "group", "feature", "group_size", "count_expressed", "fraction", "mean_all", "mean_expressed"
};

namespace {
std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

#ifdef DOTMATRIX_USE_NATIVE_PARQUET
bool exportParquetNative(const StatMatrix& stats, const std::string& parquetPath, std::string& errorOut) {
    arrow::StringBuilder groupBuilder;
    arrow::StringBuilder featureBuilder;
    arrow::Int64Builder sizeBuilder;
    arrow::Int64Builder countBuilder;
    arrow::DoubleBuilder fractionBuilder;
    arrow::DoubleBuilder meanAllBuilder;
    arrow::DoubleBuilder meanExpressedBuilder;

    for (size_t g = 0; g < stats.groupCount(); ++g) {
        for (size_t f = 0; f < stats.featureCount(); ++f) {
            const StatCell& cell = stats.at(g, f);
            if (!groupBuilder.Append(stats.groupLabels()[g]).ok() ||
                !featureBuilder.Append(stats.featureLabels()[f]).ok() ||
                !sizeBuilder.Append(static_cast<int64_t>(stats.groupSizes()[g])).ok() ||
                !countBuilder.Append(static_cast<int64_t>(cell.countExpressed)).ok() ||
                !fractionBuilder.Append(cell.fraction).ok() ||
                !meanAllBuilder.Append(cell.meanAll).ok() ||
                !meanExpressedBuilder.Append(cell.meanExpressed).ok()) {
                errorOut = "Failed to append row for group '" + stats.groupLabels()[g] + "'";
                return false;
            }
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(7);
    arrow::ArrayBuilder* builders[7] = {
        &groupBuilder, &featureBuilder, &sizeBuilder, &countBuilder,
        &fractionBuilder, &meanAllBuilder, &meanExpressedBuilder
    };
    for (size_t i = 0; i < 7; ++i) {
        auto status = builders[i]->Finish(&arrays[i]);
        if (!status.ok()) {
            errorOut = std::string("Failed to finalize Arrow array for column '") + kColumns[i] + "': " + status.ToString();
            return false;
        }
    }

    auto schema = arrow::schema({
        arrow::field(kColumns[0], arrow::utf8(), false),
        arrow::field(kColumns[1], arrow::utf8(), false),
        arrow::field(kColumns[2], arrow::int64(), false),
        arrow::field(kColumns[3], arrow::int64(), false),
        arrow::field(kColumns[4], arrow::float64(), false),
        arrow::field(kColumns[5], arrow::float64(), false),
        arrow::field(kColumns[6], arrow::float64(), false),
    });
    const int64_t rows = static_cast<int64_t>(stats.cells().size());
    auto table = arrow::Table::Make(schema, arrays, rows);

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, std::max<int64_t>(1, rows));
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
} // namespace

void writeCsv(const StatMatrix& stats, std::ostream& out) {
    for (size_t i = 0; i < 7; ++i) {
        if (i) out << ',';
        out << kColumns[i];
    }
    out << '\n';
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t g = 0; g < stats.groupCount(); ++g) {
        for (size_t f = 0; f < stats.featureCount(); ++f) {
            const StatCell& cell = stats.at(g, f);
            out << csvField(stats.groupLabels()[g]) << ','
                << csvField(stats.featureLabels()[f]) << ','
                << stats.groupSizes()[g] << ','
                << cell.countExpressed << ','
                << cell.fraction << ','
                << cell.meanAll << ','
                << cell.meanExpressed << '\n';
        }
    }
}

std::string exportStatMatrix(const StatMatrix& stats, const std::string& basePath, const std::string& format) {
    const std::string fmt = CommonUtils::toLower(CommonUtils::trim(format));
    if (fmt != "csv" && fmt != "parquet") {
        throw Dotmatrix::InvalidArgumentException("stats format must be csv or parquet (got '" + format + "')");
    }

    const std::string csvPath = basePath + ".csv";
    std::ofstream out(csvPath, std::ios::binary);
    if (!out) throw Dotmatrix::IOException("cannot write statistics to '" + csvPath + "'");
    writeCsv(stats, out);
    out.flush();
    if (!out.good()) throw Dotmatrix::IOException("failed while writing '" + csvPath + "'");

    if (fmt == "parquet") {
#ifdef DOTMATRIX_USE_NATIVE_PARQUET
        const std::string parquetPath = basePath + ".parquet";
        std::string parquetError;
        if (!exportParquetNative(stats, parquetPath, parquetError)) {
            std::cout << "[Dotmatrix][Warning] Native parquet export failed: " << parquetError
                      << ". CSV export is available at " << csvPath << "\n";
        }
#else
        std::cout << "[Dotmatrix][Warning] Parquet export requested, but this build was compiled without native parquet support. "
                  << "Rebuild with Arrow/Parquet libraries enabled. CSV export is available at " << csvPath << "\n";
#endif
    }
    return csvPath;
}
} // namespace StatsExport
