#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    static TypedColumn numeric(std::string name, std::vector<double> values, MissingMask missing = {});
    static TypedColumn categorical(std::string name, std::vector<std::string> values, MissingMask missing = {});
    static TypedColumn datetime(std::string name, std::vector<int64_t> unixSeconds, MissingMask missing = {});

    size_t size() const noexcept;
    bool isMissing(size_t row) const noexcept { return row < missing.size() && missing[row] != 0; }

    /**
     * @brief Renders one cell the way a text export would (missing -> "nan").
     */
    std::string cellAsString(size_t row) const;
};

class TypedDataset {
public:
    enum class NumericSeparatorPolicy {
        AUTO,
        US_THOUSANDS,
        EUROPEAN
    };

    enum class DateLocaleHint {
        AUTO,
        DMY,
        MDY
    };

    TypedDataset() = default;

    /**
     * @brief Builds a typed dataset from raw text records, inferring column types.
     * @details Header names are trimmed and de-duplicated. Short rows are padded
     * with missing cells; longer rows are truncated.
     * @post every column has rowCount() values and a matching missing mask.
     */
    static TypedDataset fromRecords(const std::vector<std::string>& header,
                                    const std::vector<std::vector<std::string>>& rows,
                                    NumericSeparatorPolicy numericPolicy = NumericSeparatorPolicy::AUTO,
                                    DateLocaleHint dateHint = DateLocaleHint::AUTO);

    /**
     * @brief Loads CSV content and infers per-column types.
     * @details CSV tokenization is delegated to CSVUtils; this class owns type
     * inference and typed storage.
     * @throws Augur::IOException / Augur::DatasetException on IO or parse failure.
     */
    static TypedDataset loadCsv(const std::string& filename,
                                char delimiter = ',',
                                NumericSeparatorPolicy numericPolicy = NumericSeparatorPolicy::AUTO,
                                DateLocaleHint dateHint = DateLocaleHint::AUTO);

    /**
     * @brief Appends a column.
     * @throws Augur::DatasetException on duplicate name or row count mismatch.
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;
    std::vector<size_t> datetimeColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Removes rows where keepMask is false across all columns.
     * @pre keepMask.size() == rowCount().
     * @throws Augur::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    static bool parseNumericToken(const std::string& v,
                                  double& out,
                                  NumericSeparatorPolicy policy = NumericSeparatorPolicy::AUTO);
    static bool parseDateTimeToken(const std::string& v,
                                   int64_t& outUnixSeconds,
                                   DateLocaleHint hint = DateLocaleHint::AUTO);
    static bool isMissingToken(const std::string& raw);

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};

/**
 * @brief Formats Unix seconds as ISO-8601 "YYYY-MM-DDTHH:MM:SS".
 */
std::string formatIsoDateTime(int64_t unixSeconds);

int64_t unixSecondsFromCivil(int year, int month, int day);

/**
 * @brief Splits Unix seconds into calendar parts; weekday is Monday=0.
 */
void civilFromUnixSeconds(int64_t unixSeconds, int& year, int& month, int& day, int& weekday);
