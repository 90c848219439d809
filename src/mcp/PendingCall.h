#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include "mcp/BoundedBodyReader.h"

/**
 * @brief One in-flight request on the server.
 *
 * Created when the headers arrived; owns the body reader and the deadline.
 * The terminal state moves away from Open at most once: either the handler
 * resolves it with a result, or the deadline (or shutdown) rejects it. The
 * loser of that race discards its outcome.
 */
class PendingCall {
public:
    enum class Terminal {
        Open,
        Resolved,
        Rejected
    };

    PendingCall(size_t maxBytes, std::chrono::steady_clock::time_point deadline)
        : body(maxBytes), deadline(deadline) {}

    BoundedBodyReader& reader() { return body; }
    std::chrono::steady_clock::time_point expiresAt() const { return deadline; }

    bool expired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
        return now >= deadline;
    }

    size_t receivedBytes() const { return body.received(); }

    /** @return true if this call made the transition. */
    bool resolve() { return transition(Terminal::Resolved); }
    bool reject() { return transition(Terminal::Rejected); }

    Terminal terminal() const { return state.load(); }

private:
    BoundedBodyReader body;
    std::chrono::steady_clock::time_point deadline;
    std::atomic<Terminal> state{Terminal::Open};

    bool transition(Terminal to) {
        Terminal expected = Terminal::Open;
        return state.compare_exchange_strong(expected, to);
    }
};
