#pragma once
#include <cstddef>
#include <mutex>
#include <string>

/**
 * @brief Accumulates a request body in chunks up to a byte limit.
 *
 * Exactly one terminal outcome is ever recorded. The first of onEnd,
 * onError, onClose or the chunk that crosses the limit settles the reader;
 * every later event is ignored (and logged at debug level). Bytes beyond the
 * limit are never buffered.
 */
class BoundedBodyReader {
public:
    enum class Outcome {
        Pending,
        Complete,
        SizeExceeded,
        TransportError,
        ClientClosed
    };

    explicit BoundedBodyReader(size_t maxBytes);

    /** @return false once the reader is settled; the caller should stop feeding. */
    bool onData(const char* data, size_t length);
    void onEnd();
    void onError(const std::string& reason);
    void onClose();

    Outcome outcome() const;
    bool settled() const;
    size_t received() const;
    size_t limit() const { return maxBytes; }

    /** The payload; only meaningful after Complete. */
    std::string take();

    std::string errorReason() const;

    static const char* outcomeName(Outcome outcome);

private:
    const size_t maxBytes;
    mutable std::mutex mtx;
    Outcome state = Outcome::Pending;
    size_t receivedBytes = 0;
    std::string buffer;
    std::string reason;

    bool settle(Outcome outcome, const char* event);
};
