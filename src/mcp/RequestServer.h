#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
struct Request;
struct Response;
class ContentReader;
}

class McpDispatcher;

/**
 * @brief A running listener, returned by RequestServer::start.
 *
 * Destroying the handle (or passing it to RequestServer::stop) shuts the
 * listener down, joins its thread and waits, up to the drain timeout, for
 * dispatch workers that are still running.
 */
class ServerHandle {
    class Key {
        friend class RequestServer;
        Key() = default;
    };

public:
    explicit ServerHandle(Key);
    ~ServerHandle();

    ServerHandle(const ServerHandle&) = delete;
    ServerHandle& operator=(const ServerHandle&) = delete;

    int port() const { return boundPort; }
    const std::string& host() const { return boundHost; }

    /** `http://<host>:<port>/mcp` */
    std::string endpoint() const;

    bool running() const;

private:
    friend class RequestServer;

    /** State shared with request handlers and their dispatch workers. */
    struct Shared {
        std::atomic<bool> stopping{false};

        void workerStarted();
        void workerFinished();
        /** False if workers are still running when `bound` elapses. */
        bool waitForWorkers(std::chrono::milliseconds bound);
        int activeWorkers();

    private:
        std::mutex mtx;
        std::condition_variable idle;
        int workers = 0;
    };

    void shutdown();

    std::unique_ptr<httplib::Server> server;
    std::thread listener;
    std::shared_ptr<Shared> shared;
    std::string boundHost;
    int boundPort = 0;
    std::chrono::milliseconds drainTimeout{0};
};

/**
 * @brief HTTP front of the gateway: `POST /mcp` only.
 *
 * Ill-formed traffic (OPTIONS preflight, other paths, other methods, a
 * declared body above the limit) is answered before any body byte is read.
 * Every accepted request gets exactly one response: the dispatcher's, a
 * 408 once the request deadline passes, or a 500 if anything throws.
 *
 * Handlers hold copies of the dispatcher and options, so a handle may
 * outlive the RequestServer that started it.
 */
class RequestServer {
public:
    static constexpr const char* kEndpointPath = "/mcp";

    struct Options {
        std::string host = "127.0.0.1";
        int port = 0;                                  // 0 = OS-assigned
        std::chrono::seconds requestTimeout{600};
        size_t maxRequestBytes = 10 * 1024 * 1024;
        std::chrono::milliseconds drainTimeout{5000};  // wait for workers on stop
    };

    RequestServer(std::shared_ptr<McpDispatcher> dispatcher, Options options);

    /** Binds and starts listening; throws MCP_SERVER_START_FAILED. */
    std::unique_ptr<ServerHandle> start() const;

    /** Bounded: in-flight calls are answered with 503 and abandoned. */
    static void stop(std::unique_ptr<ServerHandle> handle);

    const Options& options() const { return opts; }

private:
    std::shared_ptr<McpDispatcher> dispatcher;
    Options opts;

    static void handlePost(const std::shared_ptr<McpDispatcher>& dispatcher, const Options& options,
                           const httplib::Request& req, httplib::Response& res,
                           const httplib::ContentReader& content,
                           const std::shared_ptr<ServerHandle::Shared>& shared);

    static void writeJson(httplib::Response& res, int status, const nlohmann::json& body);
};
