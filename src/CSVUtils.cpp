#include "CSVUtils.h"
#include "StrataExceptions.h"

#include <fstream>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) return;

    char bom[3] = {0, 0, 0};
    is.read(bom, 3);
    const bool isBom = is.gcount() == 3
        && static_cast<unsigned char>(bom[1]) == 0xBB
        && static_cast<unsigned char>(bom[2]) == 0xBF;
    if (!isBom) {
        is.clear();
        is.seekg(0);
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool hasRecordData = false;
    char c;

    auto pushField = [&]() {
        row.push_back(currentFieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        currentFieldQuoted = false;
    };

    while (is.get(c)) {
        if (c == '"') {
            if (!inQuotes && CSVUtils::trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                currentFieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
            hasRecordData = true;
        } else if (c == delimiter && !inQuotes) {
            pushField();
            hasRecordData = true;
        } else if ((c == '\n' || c == '\r') && !inQuotes) {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
            hasRecordData = true;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            if (malformed) *malformed = true;
            return row;
        }
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            if (malformed) *malformed = true;
            return row;
        }
    }

    if (inQuotes && malformed) *malformed = true;
    if (hasRecordData) pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }
        const std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

RawTable readFile(const std::string& path, char delimiter, const ParseLimits& limits) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Strata::IOException("Cannot open file: " + path);
    skipBOM(in);

    RawTable table;
    bool malformed = false;
    table.header = normalizeHeader(parseCSVLine(in, delimiter, &malformed, limits));
    if (table.header.empty() || malformed) {
        throw Strata::IOException("Missing or malformed header in " + path);
    }

    while (in.peek() != EOF) {
        auto row = parseCSVLine(in, delimiter, &malformed, limits);
        if (row.empty()) continue;
        if (malformed || row.size() != table.header.size()) {
            ++table.skippedRows;
            continue;
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}
} // namespace CSVUtils
