#include <mssql_mcp/mcp/mcp_server.hpp>

#include <mssql_mcp/core/log.hpp>
#include <mssql_mcp/core/version.hpp>

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace mssql_mcp {

namespace {

constexpr const char* kLogComponent = "mcp";
constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kInstructions =
    "Tools for inspecting and querying Microsoft SQL Server. Every tool takes "
    "an ODBC connection string (connectionString) and opens its own "
    "connection for the duration of the call. Results come back as a JSON "
    "object with success=true, or success=false with error and type "
    "(ConnectionFailed, ExecutionFailed, NotFound, Timeout). The query tool "
    "returns at most maxRows rows (default 100, max 1000) and sets truncated "
    "when more were available. A call cancelled with notifications/cancelled "
    "stops its statement and returns success=false.";

std::string RequestKey(const nlohmann::json& id) { return id.dump(); }

bool IsToolsCall(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") &&
           message.value("jsonrpc", nlohmann::json()) == "2.0" &&
           message.value("method", nlohmann::json()) == "tools/call";
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

McpServer::~McpServer() {
    ReapWorkers(true);
}

void McpServer::Run() {
    LogInfo(kLogComponent, "Serving " + std::to_string(registry_.Tools().size()) +
                               " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kLogComponent, std::string("Unparseable message: ") + e.what());
            Send(MakeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        ReapWorkers(false);
        if (IsToolsCall(message)) {
            DispatchToolsCall(message);
            continue;
        }

        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(message);
        } catch (const nlohmann::json::exception& e) {
            LogError(kLogComponent, std::string("Request failed: ") + e.what());
            auto id = message.is_object() && message.contains("id")
                          ? message["id"]
                          : nlohmann::json(nullptr);
            response = MakeError(id, kInternalError, e.what());
        }
        if (response) {
            Send(*response);
        }
    }
    if (!workers_.empty()) {
        LogInfo(kLogComponent, "Input closed, waiting for " +
                                   std::to_string(workers_.size()) + " running call(s)");
    }
    ReapWorkers(true);
    LogInfo(kLogComponent, "Input closed, shutting down");
}

void McpServer::DispatchToolsCall(const nlohmann::json& message) {
    // Registered here, before the reader moves on, so a cancel on the next
    // line always finds the request.
    const auto id = message["id"];
    auto cancel = RegisterRequest(id);
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread thread([this, message, id, cancel, done] {
        nlohmann::json response;
        try {
            response = HandleToolsCall(
                message.value("params", nlohmann::json::object()), id, cancel);
        } catch (const std::exception& e) {
            LogError(kLogComponent, std::string("Request failed: ") + e.what());
            response = MakeError(id, kInternalError, e.what());
        }
        FinishRequest(id);
        Send(response);
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void McpServer::ReapWorkers(bool wait_for_all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (wait_for_all || it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

CancellationToken McpServer::RegisterRequest(const nlohmann::json& id) {
    CancellationToken token;
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_[RequestKey(id)] = token;
    return token;
}

void McpServer::FinishRequest(const nlohmann::json& id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(RequestKey(id));
}

void McpServer::CancelRequest(const nlohmann::json& id) {
    std::optional<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(RequestKey(id));
        if (it != in_flight_.end()) {
            token = it->second;
        }
    }
    if (!token) {
        LogDebug(kLogComponent, "Cancel for unknown or finished request " + RequestKey(id));
        return;
    }
    LogInfo(kLogComponent, "Cancelling request " + RequestKey(id));
    token->Cancel();
}

void McpServer::HandleNotification(const nlohmann::json& message) {
    const auto method = message.value("method", nlohmann::json()).is_string()
        ? message["method"].get<std::string>()
        : std::string();
    if (method != "notifications/cancelled") {
        LogDebug(kLogComponent, "Notification: " + method);
        return;
    }

    const auto params = message.value("params", nlohmann::json::object());
    if (!params.is_object() || !params.contains("requestId")) {
        LogWarn(kLogComponent, "notifications/cancelled without requestId");
        return;
    }
    if (params.contains("reason") && params["reason"].is_string()) {
        LogDebug(kLogComponent, "Cancel reason: " + params["reason"].get<std::string>());
    }
    CancelRequest(params["requestId"]);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Request must be a JSON object");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id" and get no response.
    if (!message.contains("id")) {
        HandleNotification(message);
        return std::nullopt;
    }

    auto id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, kInvalidRequest, "Missing 'method'");
    }
    auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        auto cancel = RegisterRequest(id);
        auto response = HandleToolsCall(params, id, cancel);
        FinishRequest(id);
        return response;
    } else {
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;
    if (params.is_object() && params.contains("clientInfo")) {
        LogInfo(kLogComponent, "Client connected: " +
                                   params["clientInfo"].value("name", "unknown"));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "mssql-mcp"},
        {"version", kVersion}
    };
    result["instructions"] = kInstructions;

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id,
    const CancellationToken& cancel) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, kInvalidParams, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments, cancel);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

void McpServer::Send(const nlohmann::json& message) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
}

} // namespace mssql_mcp
