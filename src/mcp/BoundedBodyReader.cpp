#include "mcp/BoundedBodyReader.h"
#include "utils/Logger.h"

BoundedBodyReader::BoundedBodyReader(size_t maxBytes) : maxBytes(maxBytes) {}

const char* BoundedBodyReader::outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Pending: return "pending";
        case Outcome::Complete: return "complete";
        case Outcome::SizeExceeded: return "size_exceeded";
        case Outcome::TransportError: return "transport_error";
        case Outcome::ClientClosed: return "client_closed";
    }
    return "unknown";
}

// Caller holds mtx.
bool BoundedBodyReader::settle(Outcome outcome, const char* event) {
    if (state != Outcome::Pending) {
        Logger::getInstance().debug(std::string("Ignoring body event after settlement: ") + event,
                                    {{"outcome", outcomeName(state)}});
        return false;
    }
    state = outcome;
    return true;
}

bool BoundedBodyReader::onData(const char* data, size_t length) {
    std::lock_guard<std::mutex> lock(mtx);
    if (state != Outcome::Pending) {
        Logger::getInstance().debug("Ignoring body chunk after settlement",
                                    {{"outcome", outcomeName(state)}, {"bytes", length}});
        return false;
    }

    receivedBytes += length;
    if (receivedBytes > maxBytes) {
        settle(Outcome::SizeExceeded, "data");
        buffer.clear();
        buffer.shrink_to_fit();
        Logger::getInstance().warn("Request body exceeds size limit",
                                   {{"receivedBytes", receivedBytes}, {"maxBytes", maxBytes}});
        return false;
    }

    buffer.append(data, length);
    return true;
}

void BoundedBodyReader::onEnd() {
    std::lock_guard<std::mutex> lock(mtx);
    settle(Outcome::Complete, "end");
}

void BoundedBodyReader::onError(const std::string& what) {
    std::lock_guard<std::mutex> lock(mtx);
    if (settle(Outcome::TransportError, "error")) {
        reason = what;
        buffer.clear();
    }
}

void BoundedBodyReader::onClose() {
    std::lock_guard<std::mutex> lock(mtx);
    if (settle(Outcome::ClientClosed, "close")) {
        reason = "Client closed the connection before the body was complete";
        buffer.clear();
    }
}

BoundedBodyReader::Outcome BoundedBodyReader::outcome() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

bool BoundedBodyReader::settled() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state != Outcome::Pending;
}

size_t BoundedBodyReader::received() const {
    std::lock_guard<std::mutex> lock(mtx);
    return receivedBytes;
}

std::string BoundedBodyReader::take() {
    std::lock_guard<std::mutex> lock(mtx);
    return std::move(buffer);
}

std::string BoundedBodyReader::errorReason() const {
    std::lock_guard<std::mutex> lock(mtx);
    return reason;
}
