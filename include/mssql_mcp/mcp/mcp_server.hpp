#pragma once

#include <mssql_mcp/core/cancellation.hpp>
#include <mssql_mcp/mcp/tool_registry.hpp>

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mssql_mcp {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/cancelled (cancels an in-flight tools/call)
//   - other notifications/* (no response)
//
// One message per line in, one response per line out; stdout carries nothing
// but protocol traffic. Under Run(), each tools/call executes on its own
// thread so the reader keeps consuming stdin and can deliver a cancellation
// while the call is running. Its response is written when it finishes, so
// responses to calls may arrive out of request order. Everything else is
// answered inline, in arrival order.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop. Blocks until EOF on the input, then waits for the
    // tool calls still running.
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. A tools/call runs on the calling
    // thread.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    // Cancel the in-flight request with this id. Unknown ids are ignored,
    // since the call may already have finished.
    void CancelRequest(const nlohmann::json& id);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id,
                                   const CancellationToken& cancel);
    void HandleNotification(const nlohmann::json& message);
    void DispatchToolsCall(const nlohmann::json& message);
    void ReapWorkers(bool wait_for_all);
    CancellationToken RegisterRequest(const nlohmann::json& id);
    void FinishRequest(const nlohmann::json& id);
    nlohmann::json MakeError(const nlohmann::json& id,
                             int code, const std::string& message);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);
    void Send(const nlohmann::json& message);

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
    bool initialized_ = false;

    // In-flight requests by serialized id; guarded by in_flight_mutex_.
    std::mutex in_flight_mutex_;
    std::map<std::string, CancellationToken> in_flight_;

    std::vector<Worker> workers_;  // reader thread only
};

} // namespace mssql_mcp
