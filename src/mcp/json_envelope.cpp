#include <mssql_mcp/mcp/json_envelope.hpp>

namespace mssql_mcp {

namespace {
constexpr const char* kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
} // anonymous namespace

std::string Base64Encode(const SqlBinary& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                    (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                                    static_cast<std::uint32_t>(bytes[i + 2]);
        out += kBase64Alphabet[(chunk >> 18) & 0x3F];
        out += kBase64Alphabet[(chunk >> 12) & 0x3F];
        out += kBase64Alphabet[(chunk >> 6) & 0x3F];
        out += kBase64Alphabet[chunk & 0x3F];
    }

    const auto rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t chunk = static_cast<std::uint32_t>(bytes[i]) << 16;
        out += kBase64Alphabet[(chunk >> 18) & 0x3F];
        out += kBase64Alphabet[(chunk >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                    (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out += kBase64Alphabet[(chunk >> 18) & 0x3F];
        out += kBase64Alphabet[(chunk >> 12) & 0x3F];
        out += kBase64Alphabet[(chunk >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Envelope ValueToJson(const SqlValue& value) {
    switch (value.Kind()) {
        case SqlValueKind::Null:      return nullptr;
        case SqlValueKind::Text:      return value.AsText();
        case SqlValueKind::Integer:   return value.AsInteger();
        case SqlValueKind::Floating:  return value.AsFloating();
        case SqlValueKind::Boolean:   return value.AsBoolean();
        case SqlValueKind::Timestamp: return FormatIso8601(value.AsTimestamp());
        case SqlValueKind::Binary:    return Base64Encode(value.AsBinary());
    }
    return nullptr;
}

Envelope RowToJson(const Row& row) {
    Envelope j = Envelope::object();
    for (const auto& [name, value] : row.Fields()) {
        j[name] = ValueToJson(value);
    }
    return j;
}

Envelope TimestampToJson(const std::optional<SqlTimestamp>& ts) {
    if (!ts.has_value()) {
        return nullptr;
    }
    return FormatIso8601(*ts);
}

Envelope OptionalText(const std::optional<std::string>& text) {
    if (!text.has_value()) {
        return nullptr;
    }
    return *text;
}

Envelope SuccessEnvelope() {
    Envelope j = Envelope::object();
    j["success"] = true;
    return j;
}

Envelope ErrorEnvelope(const Error& error) {
    Envelope j = Envelope::object();
    j["success"] = false;
    j["error"] = error.message;
    j["type"] = error.CategoryName();
    return j;
}

ToolResult EnvelopeResult(const Envelope& envelope) {
    // Driver text is not guaranteed to be valid UTF-8.
    return MakeTextResult(
        envelope.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace mssql_mcp
