#include <catch2/catch_test_macros.hpp>

#include <mssql_mcp/core/cancellation.hpp>

#include <atomic>
#include <thread>

using namespace mssql_mcp;

TEST_CASE("CancellationToken: starts live", "[core][cancel]") {
    CancellationToken token;
    CHECK_FALSE(token.IsCancelled());
}

TEST_CASE("CancellationToken: copies share the flag", "[core][cancel]") {
    CancellationToken token;
    const CancellationToken copy = token;
    copy.Cancel();
    CHECK(token.IsCancelled());
    CHECK(copy.IsCancelled());

    CancellationToken other;
    CHECK_FALSE(other.IsCancelled());
}

TEST_CASE("CancelCallback: runs once on cancel", "[core][cancel]") {
    CancellationToken token;
    int calls = 0;
    CancelCallback on_cancel(token, [&calls] { ++calls; });
    CHECK(calls == 0);

    token.Cancel();
    token.Cancel();
    CHECK(calls == 1);
}

TEST_CASE("CancelCallback: runs at once if already cancelled", "[core][cancel]") {
    CancellationToken token;
    token.Cancel();
    int calls = 0;
    CancelCallback on_cancel(token, [&calls] { ++calls; });
    CHECK(calls == 1);
}

TEST_CASE("CancelCallback: unregistered when destroyed", "[core][cancel]") {
    CancellationToken token;
    int calls = 0;
    {
        CancelCallback on_cancel(token, [&calls] { ++calls; });
    }
    token.Cancel();
    CHECK(calls == 0);
    CHECK(token.IsCancelled());
}

TEST_CASE("CancellationToken: cancel from another thread", "[core][cancel]") {
    CancellationToken token;
    std::atomic<int> calls{0};
    CancelCallback on_cancel(token, [&calls] { ++calls; });

    std::thread canceller([token] { token.Cancel(); });
    canceller.join();

    CHECK(token.IsCancelled());
    CHECK(calls.load() == 1);
}
