#include <mssql_mcp/core/cancellation.hpp>

#include <map>
#include <mutex>
#include <utility>

namespace mssql_mcp {

struct CancellationToken::State {
    std::mutex mutex;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    for (auto& [id, fn] : state_->callbacks) {
        (void)id;
        fn();
    }
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancelCallback::CancelCallback(const CancellationToken& token,
                               std::function<void()> fn)
    : state_(token.state_) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        fn();
        return;
    }
    id_ = state_->next_id++;
    state_->callbacks.emplace(id_, std::move(fn));
}

CancelCallback::~CancelCallback() {
    if (id_ == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id_);
}

} // namespace mssql_mcp
