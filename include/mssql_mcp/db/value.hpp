#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// SqlTimestamp: broken-down date/time as delivered by the driver.
// fraction_ns is the sub-second part in nanoseconds (ODBC convention).
// ---------------------------------------------------------------------------
struct SqlTimestamp {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::uint32_t fraction_ns = 0;

    bool operator==(const SqlTimestamp& other) const {
        return year == other.year && month == other.month &&
               day == other.day && hour == other.hour &&
               minute == other.minute && second == other.second &&
               fraction_ns == other.fraction_ns;
    }
    bool operator!=(const SqlTimestamp& other) const { return !(*this == other); }
};

/// "YYYY-MM-DDTHH:MM:SS", plus ".fffffff" (trailing zeros trimmed) when the
/// fraction is non-zero. Seven digits is the datetime2 resolution.
std::string FormatIso8601(const SqlTimestamp& ts);

using SqlBinary = std::vector<std::uint8_t>;

enum class SqlValueKind {
    Null,
    Text,
    Integer,
    Floating,
    Boolean,
    Timestamp,
    Binary,
};

// ---------------------------------------------------------------------------
// SqlValue: one cell of a result set. The set of alternatives is closed;
// column types are only known once a statement has been executed.
// ---------------------------------------------------------------------------
class SqlValue {
public:
    SqlValue() = default;

    static SqlValue Null() { return SqlValue(); }
    static SqlValue Text(std::string value) { return SqlValue(Storage(std::move(value))); }
    static SqlValue Integer(std::int64_t value) { return SqlValue(Storage(value)); }
    static SqlValue Floating(double value) { return SqlValue(Storage(value)); }
    static SqlValue Boolean(bool value) { return SqlValue(Storage(value)); }
    static SqlValue Timestamp(const SqlTimestamp& value) { return SqlValue(Storage(value)); }
    static SqlValue Binary(SqlBinary value) { return SqlValue(Storage(std::move(value))); }

    [[nodiscard]] SqlValueKind Kind() const noexcept {
        return static_cast<SqlValueKind>(storage_.index());
    }
    [[nodiscard]] bool IsNull() const noexcept { return Kind() == SqlValueKind::Null; }

    [[nodiscard]] const std::string& AsText() const { return std::get<std::string>(storage_); }
    [[nodiscard]] std::int64_t AsInteger() const { return std::get<std::int64_t>(storage_); }
    [[nodiscard]] double AsFloating() const { return std::get<double>(storage_); }
    [[nodiscard]] bool AsBoolean() const { return std::get<bool>(storage_); }
    [[nodiscard]] const SqlTimestamp& AsTimestamp() const { return std::get<SqlTimestamp>(storage_); }
    [[nodiscard]] const SqlBinary& AsBinary() const { return std::get<SqlBinary>(storage_); }

    bool operator==(const SqlValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const SqlValue& other) const { return !(*this == other); }

private:
    // Alternative order must match SqlValueKind.
    using Storage = std::variant<std::monostate, std::string, std::int64_t,
                                 double, bool, SqlTimestamp, SqlBinary>;

    explicit SqlValue(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

/// Cell for a decimal/numeric/money column delivered as its exact character
/// form (e.g. "-1234.50", ".5"). Scale 0 values that fit become Integer;
/// values with at most 15 significant digits become Floating, which a double
/// holds without loss. Anything wider is kept as Text with the exact digits.
[[nodiscard]] SqlValue DecimalFromText(std::string_view text);

// ---------------------------------------------------------------------------
// Row: ordered (column name, value) pairs in result-set column order.
// ---------------------------------------------------------------------------
class Row {
public:
    Row() = default;

    void Add(std::string name, SqlValue value) {
        fields_.emplace_back(std::move(name), std::move(value));
    }

    [[nodiscard]] std::size_t Size() const noexcept { return fields_.size(); }
    [[nodiscard]] const std::vector<std::pair<std::string, SqlValue>>& Fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] const std::string& NameAt(std::size_t index) const {
        return fields_.at(index).first;
    }
    [[nodiscard]] const SqlValue& At(std::size_t index) const {
        return fields_.at(index).second;
    }

    // Typed accessors for catalog rows. A null cell, or a cell of another
    // kind, yields nullopt; integers are widened from whatever integer type
    // the catalog view declares.
    [[nodiscard]] std::optional<std::string> TextAt(std::size_t index) const;
    [[nodiscard]] std::optional<std::int64_t> IntegerAt(std::size_t index) const;
    [[nodiscard]] std::optional<SqlTimestamp> TimestampAt(std::size_t index) const;

private:
    std::vector<std::pair<std::string, SqlValue>> fields_;
};

} // namespace mssql_mcp
