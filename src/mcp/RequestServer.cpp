#include "mcp/RequestServer.h"
#include "mcp/McpDispatcher.h"
#include "mcp/PendingCall.h"
#include "core/GatewayError.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <cstdint>
#include <future>
#include <system_error>

using json = nlohmann::json;

namespace {
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

std::string contentLengthOf(const httplib::Request& req) {
    return req.get_header_value("Content-Length");
}
} // namespace

// ============================================================================
// ServerHandle
// ============================================================================

ServerHandle::ServerHandle(Key) {}

ServerHandle::~ServerHandle() {
    shutdown();
}

std::string ServerHandle::endpoint() const {
    return "http://" + boundHost + ":" + std::to_string(boundPort) + RequestServer::kEndpointPath;
}

bool ServerHandle::running() const {
    return server && server->is_running();
}

void ServerHandle::Shared::workerStarted() {
    std::lock_guard<std::mutex> lock(mtx);
    workers++;
}

void ServerHandle::Shared::workerFinished() {
    std::lock_guard<std::mutex> lock(mtx);
    if (--workers == 0) {
        idle.notify_all();
    }
}

bool ServerHandle::Shared::waitForWorkers(std::chrono::milliseconds bound) {
    std::unique_lock<std::mutex> lock(mtx);
    return idle.wait_for(lock, bound, [this] { return workers == 0; });
}

int ServerHandle::Shared::activeWorkers() {
    std::lock_guard<std::mutex> lock(mtx);
    return workers;
}

void ServerHandle::shutdown() {
    if (!server) return;
    shared->stopping = true;
    server->stop();
    if (listener.joinable()) {
        listener.join();
    }
    server.reset();

    // requests already answered (408/503) may still have a worker on the host
    if (!shared->waitForWorkers(drainTimeout)) {
        Logger::getInstance().warn("Dispatch workers still running after shutdown",
                                   {{"port", boundPort}, {"workers", shared->activeWorkers()},
                                    {"drainTimeoutMs", drainTimeout.count()}});
    }
    Logger::getInstance().info("MCP server stopped", {{"port", boundPort}});
}

// ============================================================================
// RequestServer
// ============================================================================

RequestServer::RequestServer(std::shared_ptr<McpDispatcher> dispatcher, Options options)
    : dispatcher(std::move(dispatcher)), opts(std::move(options)) {}

void RequestServer::writeJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

std::unique_ptr<ServerHandle> RequestServer::start() const {
    auto handle = std::make_unique<ServerHandle>(ServerHandle::Key());
    handle->server = std::make_unique<httplib::Server>();
    handle->shared = std::make_shared<ServerHandle::Shared>();
    handle->boundHost = opts.host;
    handle->drainTimeout = opts.drainTimeout;

    httplib::Server& svr = *handle->server;
    auto shared = handle->shared;
    const size_t maxBytes = opts.maxRequestBytes;

    svr.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Mcp-Session-Id"}
    });

    // the body reader enforces the limit itself
    svr.set_payload_max_length(SIZE_MAX);
    svr.set_read_timeout(static_cast<time_t>(opts.requestTimeout.count()), 0);
    svr.set_write_timeout(30, 0);
    // a rejected request leaves its body unread on the socket
    svr.set_keep_alive_max_count(1);

    svr.set_pre_routing_handler([maxBytes](const httplib::Request& req, httplib::Response& res) {
        if (req.method == "OPTIONS") {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        if (req.path != kEndpointPath) {
            writeJson(res, 404, McpDispatcher::createErrorResponse(nullptr, -32600, "Not found: " + req.path));
            return httplib::Server::HandlerResponse::Handled;
        }
        if (req.method != "POST") {
            res.set_header("Allow", "POST, OPTIONS");
            writeJson(res, 405, McpDispatcher::createErrorResponse(nullptr, -32600, "Method not allowed"));
            return httplib::Server::HandlerResponse::Handled;
        }

        std::string declared = contentLengthOf(req);
        if (!declared.empty()) {
            unsigned long long length = 0;
            try {
                length = std::stoull(declared);
            } catch (const std::exception&) {
                writeJson(res, 400, McpDispatcher::createErrorResponse(nullptr, -32700, "Invalid Content-Length"));
                return httplib::Server::HandlerResponse::Handled;
            }
            if (length > maxBytes) {
                Logger::getInstance().warn("Rejected request with oversized Content-Length",
                                           {{"contentLength", length}, {"maxBytes", maxBytes}});
                writeJson(res, 413, McpDispatcher::createErrorResponse(nullptr, -32600, "Request body too large"));
                return httplib::Server::HandlerResponse::Handled;
            }
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Post(kEndpointPath, [dispatcher = this->dispatcher, options = opts, shared](
                                const httplib::Request& req, httplib::Response& res,
                                const httplib::ContentReader& content) {
        try {
            handlePost(dispatcher, options, req, res, content, shared);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Unhandled error while serving request", {{"reason", e.what()}});
            writeJson(res, 500, McpDispatcher::createErrorResponse(nullptr, -32603, "Internal error"));
        }
    });

    svr.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown exception";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        Logger::getInstance().error("Request handler raised", {{"reason", message}});
        writeJson(res, 500, McpDispatcher::createErrorResponse(nullptr, -32603, "Internal error"));
    });

    int port = -1;
    if (opts.port == 0) {
        port = svr.bind_to_any_port(opts.host);
    } else if (svr.bind_to_port(opts.host, opts.port)) {
        port = opts.port;
    }
    if (port < 0) {
        throw Errors::serverError("Failed to bind " + opts.host + ":" + std::to_string(opts.port), opts.port);
    }
    handle->boundPort = port;

    httplib::Server* raw = handle->server.get();
    handle->listener = std::thread([raw, port]() {
        if (!raw->listen_after_bind()) {
            Logger::getInstance().error("MCP server listener exited with an error", {{"port", port}});
        }
    });
    svr.wait_until_ready();

    Logger::getInstance().info("MCP server listening",
                               {{"endpoint", handle->endpoint()},
                                {"requestTimeoutSeconds", opts.requestTimeout.count()},
                                {"maxRequestBytes", maxBytes}});
    return handle;
}

void RequestServer::stop(std::unique_ptr<ServerHandle> handle) {
    if (handle) {
        handle->shutdown();
    }
}

void RequestServer::handlePost(const std::shared_ptr<McpDispatcher>& dispatcher, const Options& options,
                               const httplib::Request& req, httplib::Response& res,
                               const httplib::ContentReader& content,
                               const std::shared_ptr<ServerHandle::Shared>& shared) {
    auto call = std::make_shared<PendingCall>(options.maxRequestBytes,
                                              std::chrono::steady_clock::now() + options.requestTimeout);
    BoundedBodyReader& reader = call->reader();

    bool read = content([&reader](const char* data, size_t length) { return reader.onData(data, length); });
    if (read) {
        reader.onEnd();
    } else if (!reader.settled()) {
        std::string declared = contentLengthOf(req);
        if (!declared.empty() && reader.received() < std::stoull(declared)) {
            reader.onClose();
        } else {
            reader.onError("Failed to read request body");
        }
    }

    switch (reader.outcome()) {
        case BoundedBodyReader::Outcome::Complete:
            break;
        case BoundedBodyReader::Outcome::SizeExceeded:
            call->reject();
            writeJson(res, 413, McpDispatcher::createErrorResponse(nullptr, -32600, "Request body too large"));
            return;
        case BoundedBodyReader::Outcome::ClientClosed:
        case BoundedBodyReader::Outcome::TransportError:
        case BoundedBodyReader::Outcome::Pending:
            call->reject();
            Logger::getInstance().warn("Request body could not be read",
                                       {{"outcome", BoundedBodyReader::outcomeName(reader.outcome())},
                                        {"reason", reader.errorReason()},
                                        {"receivedBytes", reader.received()}});
            writeJson(res, 400, McpDispatcher::createErrorResponse(nullptr, -32700, "Parse error"));
            return;
    }

    auto promise = std::make_shared<std::promise<DispatchResult>>();
    std::future<DispatchResult> future = promise->get_future();
    std::string body = reader.take();

    // the worker may outlive this request if the deadline fires first;
    // ServerHandle::shutdown waits for it through `shared`
    shared->workerStarted();
    std::thread worker;
    try {
        worker = std::thread([dispatcher, call, promise, shared, body = std::move(body)]() {
            try {
                DispatchResult result = dispatcher->dispatch(body);
                if (!call->resolve()) {
                    Logger::getInstance().warn("Discarding result of a request that already timed out");
                }
                promise->set_value(std::move(result));
            } catch (const std::exception& e) {
                call->resolve();
                Logger::getInstance().error("Dispatcher raised", {{"reason", e.what()}});
                promise->set_value({500, McpDispatcher::createErrorResponse(nullptr, -32603, "Internal error")});
            }
            shared->workerFinished();
        });
    } catch (const std::system_error&) {
        shared->workerFinished();
        throw;
    }
    worker.detach();

    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
        if (call->expired() && call->reject()) {
            Logger::getInstance().warn("Request timed out",
                                       {{"timeoutSeconds", options.requestTimeout.count()}});
            writeJson(res, 408, McpDispatcher::createErrorResponse(nullptr, -32603, "Request timed out"));
            return;
        }
        if (shared->stopping && call->reject()) {
            writeJson(res, 503, McpDispatcher::createErrorResponse(nullptr, -32603, "Server is shutting down"));
            return;
        }
    }

    DispatchResult result = future.get();
    if (result.body) {
        writeJson(res, result.status, *result.body);
    } else {
        res.status = result.status;
    }
}
