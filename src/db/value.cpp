#include <mssql_mcp/db/value.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>

namespace mssql_mcp {

std::string FormatIso8601(const SqlTimestamp& ts) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << ts.year << '-'
        << std::setw(2) << ts.month << '-'
        << std::setw(2) << ts.day << 'T'
        << std::setw(2) << ts.hour << ':'
        << std::setw(2) << ts.minute << ':'
        << std::setw(2) << ts.second;

    // 100ns ticks; anything finer is below datetime2 resolution.
    auto ticks = ts.fraction_ns / 100;
    if (ticks != 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(7) << ticks;
        auto digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << '.' << digits;
    }
    return oss.str();
}

namespace {

// Largest number of significant decimal digits a double always round-trips.
constexpr std::size_t kExactDoubleDigits = 15;

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

SqlValue DecimalFromText(std::string_view text) {
    text = Trim(text);

    std::string sign;
    std::string_view magnitude = text;
    if (!magnitude.empty() && (magnitude.front() == '-' || magnitude.front() == '+')) {
        if (magnitude.front() == '-') sign = "-";
        magnitude.remove_prefix(1);
    }

    const auto point = magnitude.find('.');
    std::string_view whole = magnitude.substr(0, point);
    std::string_view fraction = point == std::string_view::npos
        ? std::string_view() : magnitude.substr(point + 1);

    const auto is_digits = [](std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    };
    if ((whole.empty() && fraction.empty()) || !is_digits(whole) || !is_digits(fraction)) {
        return SqlValue::Text(std::string(text));
    }

    // Drivers may omit the leading zero (".50"); restore it.
    std::string normalized = sign + (whole.empty() ? std::string("0") : std::string(whole));
    if (point != std::string_view::npos) {
        normalized += '.';
        normalized += fraction.empty() ? std::string("0") : std::string(fraction);
    }

    if (point == std::string_view::npos) {
        std::int64_t value = 0;
        const auto* first = normalized.data();
        const auto* last = normalized.data() + normalized.size();
        auto [end, ec] = std::from_chars(first, last, value);
        if (ec == std::errc() && end == last) {
            return SqlValue::Integer(value);
        }
        return SqlValue::Text(std::move(normalized));
    }

    std::string digits = std::string(whole) + std::string(fraction);
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    const auto last_nonzero = digits.find_last_not_of('0');
    digits.erase(last_nonzero == std::string::npos ? 0 : last_nonzero + 1);
    if (digits.size() > kExactDoubleDigits) {
        return SqlValue::Text(std::move(normalized));
    }

    std::istringstream in(normalized);
    in.imbue(std::locale::classic());
    double value = 0;
    in >> value;
    return SqlValue::Floating(value);
}

std::optional<std::string> Row::TextAt(std::size_t index) const {
    const auto& value = At(index);
    if (value.Kind() != SqlValueKind::Text) return std::nullopt;
    return value.AsText();
}

std::optional<std::int64_t> Row::IntegerAt(std::size_t index) const {
    const auto& value = At(index);
    switch (value.Kind()) {
        case SqlValueKind::Integer:
            return value.AsInteger();
        case SqlValueKind::Boolean:
            return value.AsBoolean() ? 1 : 0;
        default:
            return std::nullopt;
    }
}

std::optional<SqlTimestamp> Row::TimestampAt(std::size_t index) const {
    const auto& value = At(index);
    if (value.Kind() != SqlValueKind::Timestamp) return std::nullopt;
    return value.AsTimestamp();
}

} // namespace mssql_mcp
