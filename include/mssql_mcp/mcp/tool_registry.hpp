#pragma once

#include <mssql_mcp/core/cancellation.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema of one MCP tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
//
// is_error is reserved for protocol-level failures (unknown tool, missing
// parameter, handler exception). Database failures are reported inside the
// content as a {success: false} envelope.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

/// A single text content block.
ToolResult MakeTextResult(const std::string& text, bool is_error = false);

// A tool handler takes the JSON arguments object and the request's
// cancellation token, and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params,
                                             const CancellationToken& cancel)>;

// Handler for a tool that finishes quickly and ignores cancellation.
using SimpleToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry: tools in registration order plus their handlers.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  SimpleToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Run a tool. Exceptions escaping the handler become an error result.
    [[nodiscard]] ToolResult Execute(
        const std::string& name,
        const nlohmann::json& params,
        const CancellationToken& cancel = CancellationToken()) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mssql_mcp
