#pragma once
#include "Predictor.h"
#include "TabularData.h"

#include <string>
#include <vector>

struct ExportColumn {
    std::string name;
    bool numeric = true;
    std::vector<double> numbers;
    std::vector<std::string> strings;
};

// Column-major table handed to the CSV/Parquet writers.
struct ExportTable {
    std::vector<ExportColumn> columns;
    size_t rowCount() const;
};

namespace LeaderboardExport {
// Ranked leaderboard with the final ensemble weight of every model.
ExportTable leaderboardTable(const Leaderboard& leaderboard, const EnsembleWeights& weights);

// Ensemble OOF predictions and those of every model in its support, one row per training row.
ExportTable oofTable(const Predictor& predictor);

// Predicted label plus probability or quantile columns for a scored table.
ExportTable predictionTable(const Predictor& predictor, const TabularData& data);

/**
 * @throws Strata::IOException when the file cannot be written.
 */
void writeCsv(const ExportTable& table, const std::string& path, char delimiter = ',');

/**
 * @brief Writes csv or parquet. Without native Parquet support a parquet request logs a
 *        warning and writes CSV next to the requested path instead.
 * @return the path actually written.
 * @throws Strata::IOException when the output cannot be written.
 */
std::string write(const ExportTable& table, const std::string& path, const std::string& format);

#ifdef STRATA_USE_NATIVE_PARQUET
bool writeParquet(const ExportTable& table, const std::string& path, std::string& errorOut);
#endif
} // namespace LeaderboardExport
