#pragma once

#include <string>
#include <string_view>

namespace mssql_mcp {

// UTF-8 <-> UTF-16 conversion for the ODBC wide-character API (SQLWCHAR is
// 16 bits on both unixODBC and Windows). Malformed input never fails: each
// invalid UTF-8 sequence and each unpaired surrogate becomes U+FFFD.

[[nodiscard]] std::u16string Utf8ToUtf16(std::string_view utf8);

[[nodiscard]] std::string Utf16ToUtf8(std::u16string_view utf16);

} // namespace mssql_mcp
