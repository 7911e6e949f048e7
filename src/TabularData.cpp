#include "TabularData.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "StrataExceptions.h"

#include <charconv>
#include <cmath>
#include <iostream>
#include <limits>
#include <unordered_set>

bool TabularData::isMissingToken(const std::string& token) {
    static const std::unordered_set<std::string> missingTokens = {
        "", "na", "n/a", "nan", "null", "none", "?", "-"
    };
    return missingTokens.find(CommonUtils::toLower(CommonUtils::trim(token))) != missingTokens.end();
}

bool TabularData::parseDouble(const std::string& token, double& out) {
    std::string cleaned = CommonUtils::trim(token);
    if (isMissingToken(cleaned)) return false;
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

TabularData TabularData::fromCsv(const std::string& path, char delimiter) {
    CSVUtils::RawTable raw = CSVUtils::readFile(path, delimiter);
    if (raw.rows.empty()) {
        throw Strata::DatasetException("No usable rows in " + path);
    }
    if (raw.skippedRows > 0) {
        std::cout << "[Strata][Warning] Skipped " << raw.skippedRows << " malformed row(s) in " << path << "\n";
    }

    TabularData data;
    const size_t n = raw.rows.size();
    for (size_t c = 0; c < raw.header.size(); ++c) {
        TypedColumn col;
        col.name = raw.header[c];
        col.missing.assign(n, 0);

        bool numeric = true;
        std::vector<double> parsed(n, 0.0);
        for (size_t r = 0; r < n; ++r) {
            const std::string& cell = raw.rows[r][c];
            if (isMissingToken(cell)) {
                col.missing[r] = 1;
                parsed[r] = std::numeric_limits<double>::quiet_NaN();
                continue;
            }
            if (numeric && !parseDouble(cell, parsed[r])) numeric = false;
        }

        if (numeric) {
            col.type = ColumnType::NUMERIC;
            col.values = std::move(parsed);
        } else {
            col.type = ColumnType::CATEGORICAL;
            std::vector<std::string> text(n);
            for (size_t r = 0; r < n; ++r) {
                if (!col.missing[r]) text[r] = CommonUtils::trim(raw.rows[r][c]);
            }
            col.values = std::move(text);
        }
        data.addColumn(std::move(col));
    }
    return data;
}

void TabularData::addNumericColumn(std::string name, std::vector<double> values) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) col.missing[i] = 1;
    }
    col.values = std::move(values);
    addColumn(std::move(col));
}

void TabularData::addCategoricalColumn(std::string name, std::vector<std::string> values) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (isMissingToken(values[i])) col.missing[i] = 1;
    }
    col.values = std::move(values);
    addColumn(std::move(col));
}

void TabularData::addColumn(TypedColumn column) {
    const size_t n = std::visit([](const auto& v) { return v.size(); }, column.values);
    if (!columns_.empty() && n != rowCount_) {
        throw Strata::DatasetException("Column '" + column.name + "' has " + std::to_string(n)
                                       + " rows, expected " + std::to_string(rowCount_));
    }
    if (findColumnIndex(column.name) >= 0) {
        throw Strata::DatasetException("Duplicate column name '" + column.name + "'");
    }
    if (column.missing.size() != n) column.missing.assign(n, 0);
    rowCount_ = n;
    columns_.push_back(std::move(column));
}

int TabularData::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}
