#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;
};

/**
 * Column-typed raw table as handed to the training engine. A column is NUMERIC when
 * every non-missing cell parses as a finite number, CATEGORICAL otherwise.
 */
class TabularData {
public:
    TabularData() = default;

    /**
     * @brief Loads a delimited file and infers per-column types.
     * @throws Strata::IOException when the file cannot be read.
     * @throws Strata::DatasetException when the file has no usable rows.
     */
    static TabularData fromCsv(const std::string& path, char delimiter = ',');

    void addNumericColumn(std::string name, std::vector<double> values);
    void addCategoricalColumn(std::string name, std::vector<std::string> values);
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    static bool isMissingToken(const std::string& token);
    static bool parseDouble(const std::string& token, double& out);

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
