#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record splitting for TypedDataset::loadCsv. Cells stay raw strings here.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxPhysicalLinesPerRecord = 10000;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @post *malformed is set when a quote is left open or a limit is hit.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  const ParseLimits& limits = ParseLimits{});

/**
 * @brief Fills empty names with column_N and suffixes repeats with _2, _3...
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
