#pragma once

#include <mssql_mcp/core/result.hpp>
#include <mssql_mcp/db/value.hpp>
#include <mssql_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mssql_mcp {

// Envelopes keep fields in insertion order so callers see success first.
using Envelope = nlohmann::ordered_json;

/// Standard base64 (RFC 4648) with padding.
std::string Base64Encode(const SqlBinary& bytes);

/// JSON form of one cell: null, string, integer, number, boolean,
/// ISO-8601 string for timestamps, base64 string for binary.
Envelope ValueToJson(const SqlValue& value);

/// Object keyed by column name in column order. When a name repeats, the
/// key keeps its first position and takes the last value.
Envelope RowToJson(const Row& row);

Envelope TimestampToJson(const std::optional<SqlTimestamp>& ts);
Envelope OptionalText(const std::optional<std::string>& text);

/// {"success": true}, ready for the tool's fields to be appended.
Envelope SuccessEnvelope();

/// {"success": false, "error": <message>, "type": <category>}.
Envelope ErrorEnvelope(const Error& error);

/// Wrap an envelope as a single pretty-printed text block. Failure
/// envelopes are not flagged isError; callers inspect "success".
ToolResult EnvelopeResult(const Envelope& envelope);

} // namespace mssql_mcp
