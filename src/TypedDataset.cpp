#include "TypedDataset.h"
#include "AugurExceptions.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <unordered_set>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    if (timePart.empty()) {
        hour = minute = second = 0;
        return true;
    }
    std::string t = timePart;
    if (!t.empty() && t.back() == 'Z') t.pop_back();
    if (t.size() == 5) t += ":00";
    if (t.size() < 8) return false;
    if (!parseFixedInt(t, 0, 2, hour) || t[2] != ':' ||
        !parseFixedInt(t, 3, 2, minute) || t[5] != ':' ||
        !parseFixedInt(t, 6, 2, second)) {
        return false;
    }
    // Fractional seconds are accepted and dropped.
    return t.size() == 8 || t[8] == '.';
}

bool parseDatePart(const std::string& datePart, TypedDataset::DateLocaleHint localeHint, int& year, int& month, int& day) {
    // ISO: YYYY-MM-DD or YYYY/MM/DD
    if (datePart.size() == 10 && (datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    // Slash format: dd/mm/yyyy or mm/dd/yyyy based on locale hint.
    if (datePart.size() == 10 && datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        int y = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, y)) {
            return false;
        }

        if (localeHint == TypedDataset::DateLocaleHint::DMY) {
            day = a;
            month = b;
        } else if (localeHint == TypedDataset::DateLocaleHint::MDY) {
            month = a;
            day = b;
        } else {
            if (a > 12 && b <= 12) {
                day = a;
                month = b;
            } else {
                month = a;
                day = b;
            }
        }
        year = y;
        return true;
    }

    // DMY: DD-MM-YYYY
    if (datePart.size() == 10 && datePart[2] == '-' && datePart[5] == '-') {
        return parseFixedInt(datePart, 0, 2, day) &&
               parseFixedInt(datePart, 3, 2, month) &&
               parseFixedInt(datePart, 6, 4, year);
    }

    return false;
}

std::string normalizeNumericToken(const std::string& input, TypedDataset::NumericSeparatorPolicy policy) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char ch : input) {
        if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '_' && ch != '$') {
            cleaned.push_back(ch);
        }
    }

    const auto toUS = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch != ',') out.push_back(ch);
        }
        return out;
    };

    const auto toEuropean = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch == '.') {
                continue;
            }
            out.push_back(ch == ',' ? '.' : ch);
        }
        return out;
    };

    if (policy == TypedDataset::NumericSeparatorPolicy::US_THOUSANDS) {
        return toUS(cleaned);
    }
    if (policy == TypedDataset::NumericSeparatorPolicy::EUROPEAN) {
        return toEuropean(cleaned);
    }

    const size_t dotPos = cleaned.find('.');
    const size_t commaPos = cleaned.find(',');
    if (dotPos != std::string::npos && commaPos != std::string::npos) {
        const size_t lastDot = cleaned.find_last_of('.');
        const size_t lastComma = cleaned.find_last_of(',');
        if (lastComma > lastDot) {
            return toEuropean(cleaned);
        }
        return toUS(cleaned);
    }

    if (commaPos != std::string::npos) {
        const size_t commaCount = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
        const size_t digitsAfter = cleaned.size() - commaPos - 1;
        if (commaCount == 1 && digitsAfter >= 1 && digitsAfter <= 4) {
            const bool likelyThousands = (digitsAfter == 3 && commaPos > 0 &&
                                          std::isdigit(static_cast<unsigned char>(cleaned[commaPos - 1])));
            if (!likelyThousands) {
                std::string out = cleaned;
                out[commaPos] = '.';
                return out;
            }
        }
        return toUS(cleaned);
    }

    return cleaned;
}

bool looksDateLikeHeader(const std::string& name) {
    const std::string lower = CommonUtils::toLower(name);
    return lower.find("date") != std::string::npos ||
           lower.find("time") != std::string::npos ||
           lower.find("week") != std::string::npos ||
           lower.find("month") != std::string::npos ||
           lower.find("day") != std::string::npos;
}

std::vector<std::string> normalizeHeaderNames(const std::vector<std::string>& header) {
    std::vector<std::string> trimmed;
    trimmed.reserve(header.size());
    for (const auto& h : header) trimmed.push_back(CommonUtils::trim(h));
    return CSVUtils::normalizeHeader(trimmed);
}

template <typename T>
void filterByMask(std::vector<T>& values, const MissingMask& keepMask) {
    std::vector<T> next;
    next.reserve(values.size());
    for (size_t i = 0; i < values.size() && i < keepMask.size(); ++i) {
        if (keepMask[i]) next.push_back(std::move(values[i]));
    }
    values = std::move(next);
}
} // namespace

TypedColumn TypedColumn::numeric(std::string name, std::vector<double> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    if (missing.empty()) {
        missing.assign(values.size(), static_cast<uint8_t>(0));
        for (size_t i = 0; i < values.size(); ++i) {
            if (std::isnan(values[i])) missing[i] = static_cast<uint8_t>(1);
        }
    }
    col.missing = std::move(missing);
    col.values = std::move(values);
    return col;
}

TypedColumn TypedColumn::categorical(std::string name, std::vector<std::string> values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    if (missing.empty()) missing.assign(values.size(), static_cast<uint8_t>(0));
    col.missing = std::move(missing);
    col.values = std::move(values);
    return col;
}

TypedColumn TypedColumn::datetime(std::string name, std::vector<int64_t> unixSeconds, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::DATETIME;
    if (missing.empty()) missing.assign(unixSeconds.size(), static_cast<uint8_t>(0));
    col.missing = std::move(missing);
    col.values = std::move(unixSeconds);
    return col;
}

size_t TypedColumn::size() const noexcept {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

std::string TypedColumn::cellAsString(size_t row) const {
    if (isMissing(row)) return "nan";
    if (type == ColumnType::NUMERIC) {
        const double v = std::get<std::vector<double>>(values)[row];
        if (std::isnan(v)) return "nan";
        if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
        char buf[64];
        if (std::abs(v - std::round(v)) < 1e-12 && std::abs(v) < 1e15) {
            std::snprintf(buf, sizeof(buf), "%.1f", v);
        } else {
            std::snprintf(buf, sizeof(buf), "%.15g", v);
        }
        return buf;
    }
    if (type == ColumnType::DATETIME) {
        return formatIsoDateTime(std::get<std::vector<int64_t>>(values)[row]);
    }
    return std::get<std::vector<std::string>>(values)[row];
}

bool TypedDataset::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool TypedDataset::parseNumericToken(const std::string& v, double& out, NumericSeparatorPolicy policy) {
    const std::string sv = CommonUtils::trim(v);
    if (isMissingToken(sv)) return false;

    std::string cleaned = normalizeNumericToken(sv, policy);
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (!cleaned.empty() && cleaned.back() == '%') {
        cleaned.pop_back();
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

bool TypedDataset::parseDateTimeToken(const std::string& v, int64_t& outUnixSeconds, DateLocaleHint hint) {
    std::string s = CommonUtils::trim(v);
    if (s.empty() || isMissingToken(s)) return false;

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    std::string datePart = s;
    std::string timePart;
    const size_t sep = s.find_first_of(" T");
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = CommonUtils::trim(s.substr(sep + 1));
    }

    if (!parseDatePart(datePart, hint, year, month, day)) {
        return false;
    }
    if (!parseTimePart(timePart, hour, minute, second)) {
        return false;
    }

    if (month < 1 || month > 12) return false;
    const int dim = daysInMonth(year, month);
    if (day < 1 || day > dim) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

int64_t unixSecondsFromCivil(int year, int month, int day) {
    return daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400;
}

void civilFromUnixSeconds(int64_t unixSeconds, int& year, int& month, int& day, int& weekday) {
    int64_t days = unixSeconds / 86400;
    if (unixSeconds % 86400 < 0) --days;

    // 1970-01-01 was a Thursday (Monday=0 -> 3).
    weekday = static_cast<int>(((days % 7) + 7 + 3) % 7);

    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (month <= 2 ? 1 : 0);
}

std::string formatIsoDateTime(int64_t unixSeconds) {
    int year = 0;
    int month = 0;
    int day = 0;
    int weekday = 0;
    civilFromUnixSeconds(unixSeconds, year, month, day, weekday);
    int64_t secs = unixSeconds % 86400;
    if (secs < 0) secs += 86400;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  year, month, day,
                  static_cast<int>(secs / 3600), static_cast<int>((secs % 3600) / 60), static_cast<int>(secs % 60));
    return buf;
}

TypedDataset TypedDataset::fromRecords(const std::vector<std::string>& rawHeader,
                                       const std::vector<std::vector<std::string>>& rows,
                                       NumericSeparatorPolicy numericPolicy,
                                       DateLocaleHint dateHint) {
    const std::vector<std::string> header = normalizeHeaderNames(rawHeader);
    const size_t cols = header.size();
    const size_t n = rows.size();

    std::vector<size_t> numericHits(cols, 0);
    std::vector<size_t> datetimeHits(cols, 0);
    std::vector<size_t> nonMissing(cols, 0);

    auto cell = [&](size_t r, size_t c) -> const std::string& {
        static const std::string kEmpty;
        return c < rows[r].size() ? rows[r][c] : kEmpty;
    };

    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            const std::string& s = cell(r, c);
            if (isMissingToken(s)) continue;
            ++nonMissing[c];
            double dv = 0.0;
            int64_t tv = 0;
            if (parseDateTimeToken(s, tv, dateHint)) {
                ++datetimeHits[c];
            } else if (parseNumericToken(s, dv, numericPolicy)) {
                ++numericHits[c];
            }
        }
    }

    TypedDataset out;
    out.rowCount_ = n;
    out.columns_.reserve(cols);

    for (size_t c = 0; c < cols; ++c) {
        const size_t seen = nonMissing[c];
        const size_t datetimeThreshold = looksDateLikeHeader(header[c])
            ? std::max<size_t>(1, (seen * 6) / 10)
            : std::max<size_t>(1, (seen * 8) / 10);
        const bool strongDatetime = seen > 0 && datetimeHits[c] >= datetimeThreshold;
        const bool strongNumeric = seen > 0 && numericHits[c] >= std::max<size_t>(1, (seen * 8) / 10);

        MissingMask missing(n, static_cast<uint8_t>(0));
        if (strongDatetime) {
            std::vector<int64_t> values(n, 0);
            for (size_t r = 0; r < n; ++r) {
                int64_t ts = 0;
                if (parseDateTimeToken(cell(r, c), ts, dateHint)) {
                    values[r] = ts;
                } else {
                    missing[r] = static_cast<uint8_t>(1);
                }
            }
            out.columns_.push_back(TypedColumn::datetime(header[c], std::move(values), std::move(missing)));
        } else if (strongNumeric) {
            std::vector<double> values(n, std::numeric_limits<double>::quiet_NaN());
            for (size_t r = 0; r < n; ++r) {
                double dv = 0.0;
                if (parseNumericToken(cell(r, c), dv, numericPolicy)) {
                    values[r] = dv;
                } else {
                    missing[r] = static_cast<uint8_t>(1);
                }
            }
            out.columns_.push_back(TypedColumn::numeric(header[c], std::move(values), std::move(missing)));
        } else {
            std::vector<std::string> values(n);
            for (size_t r = 0; r < n; ++r) {
                const std::string& s = cell(r, c);
                if (isMissingToken(s)) {
                    missing[r] = static_cast<uint8_t>(1);
                } else {
                    values[r] = CommonUtils::trim(s);
                }
            }
            out.columns_.push_back(TypedColumn::categorical(header[c], std::move(values), std::move(missing)));
        }
    }
    return out;
}

TypedDataset TypedDataset::loadCsv(const std::string& filename,
                                   char delimiter,
                                   NumericSeparatorPolicy numericPolicy,
                                   DateLocaleHint dateHint) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Augur::IOException("Could not open file: " + filename);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || header.empty()) throw Augur::DatasetException("Malformed or empty CSV header");

    std::vector<std::vector<std::string>> rows;
    size_t skipped = 0;
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed);
        if (malformed) {
            ++skipped;
            continue;
        }
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            ++skipped;
            continue;
        }
        rows.push_back(std::move(row));
    }
    if (skipped > 0) {
        std::cerr << "[Augur][Dataset] Skipped " << skipped << " malformed row(s) in " << filename << "\n";
    }

    return fromRecords(header, rows, numericPolicy, dateHint);
}

void TypedDataset::addColumn(TypedColumn column) {
    if (findColumnIndex(column.name) >= 0) {
        throw Augur::DatasetException("Duplicate column name: " + column.name);
    }
    const size_t size = column.size();
    if (!columns_.empty() && size != rowCount_) {
        throw Augur::DatasetException("Column '" + column.name + "' has " + std::to_string(size) +
                                      " rows, expected " + std::to_string(rowCount_));
    }
    if (column.missing.size() != size) {
        throw Augur::DatasetException("Missing mask size mismatch for column '" + column.name + "'");
    }
    if (columns_.empty()) rowCount_ = size;
    columns_.push_back(std::move(column));
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::datetimeColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::DATETIME) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

void TypedDataset::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Augur::DatasetException("Row mask size mismatch");

    for (auto& col : columns_) {
        std::visit([&](auto& values) { filterByMask(values, keepMask); }, col.values);
        filterByMask(col.missing, keepMask);
    }

    rowCount_ = static_cast<size_t>(std::count(keepMask.begin(), keepMask.end(), static_cast<uint8_t>(1)));
}
