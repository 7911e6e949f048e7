#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization. Semantic typing happens in TabularData.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
};

struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    size_t skippedRows = 0;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Reads a delimited file into header + string rows.
 * @post Rows whose width differs from the header or whose quoting is broken are skipped and counted.
 * @throws Strata::IOException when the file cannot be opened or has no header.
 */
RawTable readFile(const std::string& path, char delimiter, const ParseLimits& limits = ParseLimits{});
}
