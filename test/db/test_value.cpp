#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/db/value.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace mssql_mcp;

// ===========================================================================
// FormatIso8601
// ===========================================================================

TEST_CASE("FormatIso8601: whole seconds have no fraction", "[db][value]") {
    SqlTimestamp ts{2024, 3, 7, 9, 5, 0, 0};
    CHECK(FormatIso8601(ts) == "2024-03-07T09:05:00");
}

TEST_CASE("FormatIso8601: fraction is trimmed of trailing zeros", "[db][value]") {
    SqlTimestamp ts{2023, 12, 31, 23, 59, 59, 123000000};
    CHECK(FormatIso8601(ts) == "2023-12-31T23:59:59.123");
}

TEST_CASE("FormatIso8601: datetime2 keeps seven digits", "[db][value]") {
    SqlTimestamp ts{2020, 1, 1, 0, 0, 0, 123456700};
    CHECK(FormatIso8601(ts) == "2020-01-01T00:00:00.1234567");
}

TEST_CASE("FormatIso8601: sub-100ns fraction is dropped", "[db][value]") {
    SqlTimestamp ts{2020, 1, 1, 0, 0, 0, 50};
    CHECK(FormatIso8601(ts) == "2020-01-01T00:00:00");
}

// ===========================================================================
// SqlValue
// ===========================================================================

TEST_CASE("SqlValue: kinds match factories", "[db][value]") {
    CHECK(SqlValue::Null().IsNull());
    CHECK(SqlValue().Kind() == SqlValueKind::Null);
    CHECK(SqlValue::Text("abc").Kind() == SqlValueKind::Text);
    CHECK(SqlValue::Integer(-5).Kind() == SqlValueKind::Integer);
    CHECK(SqlValue::Floating(2.5).Kind() == SqlValueKind::Floating);
    CHECK(SqlValue::Boolean(true).Kind() == SqlValueKind::Boolean);
    CHECK(SqlValue::Timestamp(SqlTimestamp{}).Kind() == SqlValueKind::Timestamp);
    CHECK(SqlValue::Binary({0x01, 0x02}).Kind() == SqlValueKind::Binary);
}

TEST_CASE("SqlValue: accessors return stored values", "[db][value]") {
    CHECK(SqlValue::Text("nvarchar").AsText() == "nvarchar");
    CHECK(SqlValue::Integer(9007199254740993LL).AsInteger() == 9007199254740993LL);
    CHECK(SqlValue::Boolean(false).AsBoolean() == false);
    CHECK(SqlValue::Binary({0xFF}).AsBinary() == SqlBinary{0xFF});
}

TEST_CASE("SqlValue: equality compares kind and value", "[db][value]") {
    CHECK(SqlValue::Integer(1) == SqlValue::Integer(1));
    CHECK(SqlValue::Integer(1) != SqlValue::Boolean(true));
    CHECK(SqlValue::Text("1") != SqlValue::Integer(1));
}

// ===========================================================================
// Row
// ===========================================================================

TEST_CASE("Row: keeps column order", "[db][value]") {
    Row row;
    row.Add("Id", SqlValue::Integer(1));
    row.Add("Name", SqlValue::Text("Widget"));
    row.Add("Price", SqlValue::Null());

    REQUIRE(row.Size() == 3);
    CHECK(row.NameAt(0) == "Id");
    CHECK(row.NameAt(1) == "Name");
    CHECK(row.NameAt(2) == "Price");
    CHECK(row.At(2).IsNull());
}

TEST_CASE("Row: typed accessors return nullopt on null or other kind",
          "[db][value]") {
    Row row;
    row.Add("CHARACTER_MAXIMUM_LENGTH", SqlValue::Null());
    row.Add("NUMERIC_PRECISION", SqlValue::Integer(10));
    row.Add("IS_NULLABLE", SqlValue::Text("YES"));
    row.Add("CREATED", SqlValue::Timestamp(SqlTimestamp{2024, 1, 2, 3, 4, 5, 0}));
    row.Add("is_flag", SqlValue::Boolean(true));

    CHECK_FALSE(row.IntegerAt(0).has_value());
    CHECK(row.IntegerAt(1) == std::optional<std::int64_t>(10));
    CHECK_FALSE(row.IntegerAt(2).has_value());
    CHECK(row.TextAt(2) == std::optional<std::string>("YES"));
    CHECK_FALSE(row.TextAt(1).has_value());
    REQUIRE(row.TimestampAt(3).has_value());
    CHECK(row.TimestampAt(3)->year == 2024);
    CHECK(row.IntegerAt(4) == std::optional<std::int64_t>(1));
}

TEST_CASE("Row: out-of-range index throws", "[db][value]") {
    Row row;
    CHECK_THROWS_AS((void)row.At(0), std::out_of_range);
}

// ===========================================================================
// DecimalFromText
// ===========================================================================

TEST_CASE("DecimalFromText: scale 0 fits an integer", "[db][value][decimal]") {
    CHECK(DecimalFromText("42") == SqlValue::Integer(42));
    CHECK(DecimalFromText("-9223372036854775808") ==
          SqlValue::Integer(std::numeric_limits<std::int64_t>::min()));
    CHECK(DecimalFromText(" 7 ") == SqlValue::Integer(7));
}

TEST_CASE("DecimalFromText: wide integers keep every digit", "[db][value][decimal]") {
    auto v = DecimalFromText("12345678901234567890123");
    REQUIRE(v.Kind() == SqlValueKind::Text);
    CHECK(v.AsText() == "12345678901234567890123");
}

TEST_CASE("DecimalFromText: short fractions become doubles", "[db][value][decimal]") {
    auto price = DecimalFromText("19.99");
    REQUIRE(price.Kind() == SqlValueKind::Floating);
    CHECK(price.AsFloating() == 19.99);

    auto half = DecimalFromText("-.50");
    REQUIRE(half.Kind() == SqlValueKind::Floating);
    CHECK(half.AsFloating() == -0.5);

    // money arrives with four decimals; trailing zeros do not count.
    auto money = DecimalFromText("123456789012.3400");
    REQUIRE(money.Kind() == SqlValueKind::Floating);
    CHECK(money.AsFloating() == 123456789012.34);
}

TEST_CASE("DecimalFromText: long fractions stay exact text", "[db][value][decimal]") {
    auto v = DecimalFromText("1234567890123456.78");
    REQUIRE(v.Kind() == SqlValueKind::Text);
    CHECK(v.AsText() == "1234567890123456.78");

    auto small = DecimalFromText("-.12345678901234567");
    REQUIRE(small.Kind() == SqlValueKind::Text);
    CHECK(small.AsText() == "-0.12345678901234567");
}

TEST_CASE("DecimalFromText: non-numeric text is passed through", "[db][value][decimal]") {
    CHECK(DecimalFromText("") == SqlValue::Text(""));
    CHECK(DecimalFromText("abc") == SqlValue::Text("abc"));
    CHECK(DecimalFromText("1.2.3") == SqlValue::Text("1.2.3"));
    CHECK(DecimalFromText("-") == SqlValue::Text("-"));
}
