#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/db/text_encoding.hpp>

#include <string>

using namespace mssql_mcp;

TEST_CASE("Utf8ToUtf16: ASCII maps one to one", "[db][encoding]") {
    CHECK(Utf8ToUtf16("dbo.Orders") == u"dbo.Orders");
    CHECK(Utf8ToUtf16("").empty());
}

TEST_CASE("Utf8ToUtf16: multi-byte and supplementary characters", "[db][encoding]") {
    // "Produkt" in Cyrillic, two bytes per character.
    CHECK(Utf8ToUtf16("\xD0\x9F\xD1\x80\xD0\xBE\xD0\xB4") == u"\u041F\u0440\u043E\u0434");
    // Euro sign, three bytes.
    CHECK(Utf8ToUtf16("\xE2\x82\xAC") == u"\u20AC");
    // U+1F4E6 becomes a surrogate pair.
    CHECK(Utf8ToUtf16("\xF0\x9F\x93\xA6") == std::u16string{0xD83D, 0xDCE6});
}

TEST_CASE("Utf8ToUtf16: invalid bytes become U+FFFD", "[db][encoding]") {
    CHECK(Utf8ToUtf16("a\xFFb") == u"a\uFFFDb");
    // Truncated sequence at the end.
    CHECK(Utf8ToUtf16("x\xE2\x82") == u"x\uFFFD\uFFFD");
    // Overlong encoding of '/'.
    CHECK(Utf8ToUtf16("\xC0\xAF") == u"\uFFFD\uFFFD");
    // Encoded surrogate.
    CHECK(Utf8ToUtf16("\xED\xA0\x80").front() == u'\uFFFD');
}

TEST_CASE("Utf16ToUtf8: decodes pairs and replaces lone surrogates", "[db][encoding]") {
    CHECK(Utf16ToUtf8(u"\u041F\u0440\u043E\u0434") == "\xD0\x9F\xD1\x80\xD0\xBE\xD0\xB4");
    CHECK(Utf16ToUtf8(std::u16string{0xD83D, 0xDCE6}) == "\xF0\x9F\x93\xA6");
    CHECK(Utf16ToUtf8(std::u16string{u'a', 0xD83D, u'b'}) == "a\xEF\xBF\xBD" "b");
    CHECK(Utf16ToUtf8(std::u16string{0xDCE6}) == "\xEF\xBF\xBD");
}

TEST_CASE("Utf16ToUtf8: round trip of mixed text", "[db][encoding]") {
    const std::string text = "Caf\xC3\xA9 \xE2\x82\xAC" "5 \xF0\x9F\x93\xA6 \xD0\x94";
    CHECK(Utf16ToUtf8(Utf8ToUtf16(text)) == text);
}
