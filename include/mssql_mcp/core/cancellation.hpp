#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace mssql_mcp {

class CancelCallback;

// ---------------------------------------------------------------------------
// CancellationToken: cooperative cancellation flag for one request.
//
// Copies share state, so the thread that receives a cancel request and the
// thread running the call can each hold one. A default-constructed token is
// live but nobody else holds it, so it is never cancelled.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken();

    /// Set the flag and run every registered callback. Later calls do nothing.
    void Cancel() const;

    [[nodiscard]] bool IsCancelled() const;

private:
    friend class CancelCallback;
    struct State;
    std::shared_ptr<State> state_;
};

// ---------------------------------------------------------------------------
// CancelCallback: runs a function when its token is cancelled, for as long
// as this object is alive.
//
// If the token is already cancelled the function runs in the constructor.
// Callbacks run with the token's lock held; the destructor therefore waits
// for a callback still running on another thread, and the function must not
// touch the same token.
// ---------------------------------------------------------------------------
class CancelCallback {
public:
    CancelCallback(const CancellationToken& token, std::function<void()> fn);
    ~CancelCallback();

    CancelCallback(const CancelCallback&) = delete;
    CancelCallback& operator=(const CancelCallback&) = delete;
    CancelCallback(CancelCallback&&) = delete;
    CancelCallback& operator=(CancelCallback&&) = delete;

private:
    std::shared_ptr<CancellationToken::State> state_;
    std::uint64_t id_ = 0;
};

} // namespace mssql_mcp
