#include "LeaderboardExport.h"
#include "StrataExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#ifdef STRATA_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
ExportColumn numericColumn(std::string name, std::vector<double> values) {
    ExportColumn c;
    c.name = std::move(name);
    c.numeric = true;
    c.numbers = std::move(values);
    return c;
}

ExportColumn stringColumn(std::string name, std::vector<std::string> values) {
    ExportColumn c;
    c.name = std::move(name);
    c.numeric = false;
    c.strings = std::move(values);
    return c;
}

std::string escapeCsv(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos
        || value.find('"') != std::string::npos
        || value.find('\n') != std::string::npos
        || value.find('\r') != std::string::npos;
    if (!needsQuotes) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatNumber(double v) {
    if (!std::isfinite(v)) return "";
    std::ostringstream os;
    os.precision(10);
    os << v;
    return os.str();
}

void appendMatrixColumns(ExportTable& table, const std::string& prefix, const PredictionMatrix& m) {
    const size_t width = m.empty() ? 0 : m.front().size();
    for (size_t j = 0; j < width; ++j) {
        std::vector<double> values;
        values.reserve(m.size());
        for (const auto& row : m) values.push_back(row[j]);
        table.columns.push_back(numericColumn(prefix + "_p" + std::to_string(j), std::move(values)));
    }
}

std::string replaceExtension(const std::string& path, const std::string& ext) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        return path.substr(0, dot) + ext;
    }
    return path + ext;
}
} // namespace

size_t ExportTable::rowCount() const {
    if (columns.empty()) return 0;
    const ExportColumn& c = columns.front();
    return c.numeric ? c.numbers.size() : c.strings.size();
}

namespace LeaderboardExport {

ExportTable leaderboardTable(const Leaderboard& leaderboard, const EnsembleWeights& weights) {
    const std::vector<LeaderboardEntry> ranked = leaderboard.ranked();
    std::vector<std::string> names, families;
    std::vector<double> rank, index, layer, score, fit, predict, memory, weight;
    for (size_t i = 0; i < ranked.size(); ++i) {
        const LeaderboardEntry& e = ranked[i];
        rank.push_back(static_cast<double>(i + 1));
        index.push_back(static_cast<double>(e.modelIndex));
        names.push_back(e.modelName);
        families.push_back(e.family);
        layer.push_back(static_cast<double>(e.layer + 1));
        score.push_back(e.validationScore);
        fit.push_back(e.fitSeconds);
        predict.push_back(e.predictSeconds);
        memory.push_back(static_cast<double>(e.memoryBytes));
        weight.push_back(weights.weightOf(e.modelIndex));
    }

    ExportTable table;
    table.columns.push_back(numericColumn("rank", std::move(rank)));
    table.columns.push_back(numericColumn("model_index", std::move(index)));
    table.columns.push_back(stringColumn("model", std::move(names)));
    table.columns.push_back(stringColumn("family", std::move(families)));
    table.columns.push_back(numericColumn("stack_level", std::move(layer)));
    table.columns.push_back(numericColumn("score_val_" + leaderboard.metricName(), std::move(score)));
    table.columns.push_back(numericColumn("fit_time", std::move(fit)));
    table.columns.push_back(numericColumn("pred_time_val", std::move(predict)));
    table.columns.push_back(numericColumn("memory_bytes", std::move(memory)));
    table.columns.push_back(numericColumn("ensemble_weight", std::move(weight)));
    return table;
}

ExportTable oofTable(const Predictor& predictor) {
    ExportTable table;
    std::vector<double> rows(predictor.ensembleOof().size());
    for (size_t r = 0; r < rows.size(); ++r) rows[r] = static_cast<double>(r);
    table.columns.push_back(numericColumn("row", std::move(rows)));
    appendMatrixColumns(table, "ensemble", predictor.ensembleOof());
    for (size_t idx : predictor.ensembleWeights().support()) {
        const auto model = predictor.registry().get(idx);
        appendMatrixColumns(table, model->name, model->oof);
    }
    return table;
}

ExportTable predictionTable(const Predictor& predictor, const TabularData& data) {
    ExportTable table;
    table.columns.push_back(stringColumn("prediction", predictor.predictLabels(data)));
    const ProblemType type = predictor.summary().problemType;
    if (isClassification(type)) {
        const PredictionMatrix proba = predictor.predictProba(data);
        const auto& labels = predictor.classLabels();
        for (size_t k = 0; k < labels.size(); ++k) {
            std::vector<double> values;
            values.reserve(proba.size());
            for (const auto& row : proba) values.push_back(row[k]);
            table.columns.push_back(numericColumn("proba_" + labels[k], std::move(values)));
        }
    } else if (type == ProblemType::QUANTILE) {
        const PredictionMatrix q = predictor.predictQuantiles(data);
        const auto& levels = predictor.quantileLevels();
        for (size_t j = 0; j < levels.size(); ++j) {
            std::vector<double> values;
            values.reserve(q.size());
            for (const auto& row : q) values.push_back(row[j]);
            table.columns.push_back(numericColumn("q" + formatNumber(levels[j]), std::move(values)));
        }
    }
    return table;
}

void writeCsv(const ExportTable& table, const std::string& path, char delimiter) {
    std::ofstream out(path);
    if (!out) throw Strata::IOException("Cannot open export file: " + path);

    for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c > 0) out << delimiter;
        out << escapeCsv(table.columns[c].name, delimiter);
    }
    out << "\n";
    const size_t rows = table.rowCount();
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) out << delimiter;
            const ExportColumn& col = table.columns[c];
            out << (col.numeric ? formatNumber(col.numbers.at(r)) : escapeCsv(col.strings.at(r), delimiter));
        }
        out << "\n";
    }
    if (!out) throw Strata::IOException("Failed while writing export file: " + path);
}

#ifdef STRATA_USE_NATIVE_PARQUET
bool writeParquet(const ExportTable& table, const std::string& path, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(table.columns.size());
    arrays.reserve(table.columns.size());

    for (const auto& col : table.columns) {
        std::shared_ptr<arrow::Array> arr;
        if (col.numeric) {
            arrow::DoubleBuilder builder;
            for (double v : col.numbers) {
                const arrow::Status st = std::isfinite(v) ? builder.Append(v) : builder.AppendNull();
                if (!st.ok()) {
                    errorOut = "Failed to append value for column '" + col.name + "'";
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::float64(), true));
        } else {
            arrow::StringBuilder builder;
            for (const auto& v : col.strings) {
                if (!builder.Append(v).ok()) {
                    errorOut = "Failed to append value for column '" + col.name + "'";
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::utf8(), false));
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(table.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(table.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows);
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

std::string write(const ExportTable& table, const std::string& path, const std::string& format) {
    if (format != "parquet") {
        writeCsv(table, path);
        return path;
    }
    const std::string csvPath = replaceExtension(path, ".csv");
#ifdef STRATA_USE_NATIVE_PARQUET
    std::string parquetError;
    if (writeParquet(table, path, parquetError)) return path;
    std::cout << "[Strata][Warning] Native parquet export failed: " << parquetError
              << ". Writing CSV to " << csvPath << "\n";
#else
    std::cout << "[Strata][Warning] Parquet export requested, but this build was compiled without native parquet support. "
              << "Writing CSV to " << csvPath << "\n";
#endif
    writeCsv(table, csvPath);
    return csvPath;
}

} // namespace LeaderboardExport
