#include <mssql_mcp/mcp/tool_registry.hpp>

#include <mssql_mcp/core/log.hpp>

#include <chrono>

namespace mssql_mcp {

namespace {
constexpr const char* kLogComponent = "tools";
} // anonymous namespace

ToolResult MakeTextResult(const std::string& text, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) == 0) {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            SimpleToolHandler handler) {
    Register(name, description, input_schema,
             ToolHandler([handler = std::move(handler)](
                             const nlohmann::json& params, const CancellationToken&) {
                 return handler(params);
             }));
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params,
                                 const CancellationToken& cancel) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return MakeTextResult("Unknown tool: " + name, true);
    }

    const auto start = std::chrono::steady_clock::now();
    ToolResult result;
    try {
        result = it->second(params, cancel);
    } catch (const std::exception& e) {
        LogError(kLogComponent, name + " threw: " + e.what());
        result = MakeTextResult(std::string("Tool error: ") + e.what(), true);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LogDebug(kLogComponent, name + " finished in " +
                                std::to_string(elapsed.count()) + " ms");
    return result;
}

} // namespace mssql_mcp
