#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "notebook/INotebookHost.h"

/**
 * @brief INotebookHost backed by a child process (the editor bridge).
 *
 * The child is started with `sh -c <command>` and speaks line-delimited
 * JSON-RPC 2.0 on stdin/stdout:
 *
 *   notebook/info          -> {uri, notebookType, isDirty, cellCount, kernel?}
 *   notebook/cells         -> {cells: [...]}
 *   notebook/applyEdit     {type, start, stop, cells}
 *   notebook/executeRange  {start, stop}
 *   notebook/save          {uri}
 *   notebook/open          {uri} -> same shape as notebook/info
 *   kernel/restart, kernel/interrupt
 *
 * Error code -32001 means "no active notebook". Calls are serialized; a call
 * that times out kills the child, which is restarted on the next call.
 */
class StdioNotebookHost : public INotebookHost {
public:
    static constexpr int kNoActiveNotebookCode = -32001;

    StdioNotebookHost(std::string command, std::chrono::seconds callTimeout);
    ~StdioNotebookHost() override;

    StdioNotebookHost(const StdioNotebookHost&) = delete;
    StdioNotebookHost& operator=(const StdioNotebookHost&) = delete;

    bool hasActiveNotebook() override;
    NotebookInfo getNotebookInfo() override;
    int getCellCount() override;
    std::vector<Cell> getCells() override;
    void applyEdit(const NotebookEdit& edit) override;
    void executeRange(int start, int stop) override;
    void save(const std::string& uri) override;
    NotebookInfo openNotebook(const std::string& uri) override;
    void restartKernel() override;
    void interruptKernel() override;

    /** Starts the child now instead of on the first call. */
    void start();

    /**
     * Stops the child for good. A call blocked on the child gives up within
     * one poll slice, and later calls fail with HOST_ERROR instead of
     * restarting it.
     */
    void stop();

    /** Wire conversions, public for tests. */
    static Cell cellFromJson(const nlohmann::json& j);
    static NotebookInfo infoFromJson(const nlohmann::json& j);
    static nlohmann::json editToJson(const NotebookEdit& edit);

private:
    std::string command;
    std::chrono::seconds callTimeout;

    std::mutex mtx;
    std::atomic<bool> closed{false};
    pid_t childPid = -1;
    int readFd = -1;
    int writeFd = -1;
    std::string pending;       // bytes read past the last newline
    long long requestId = 0;

    bool startProcess();
    void stopProcess();

    /** Returns `result`, throws on `error`, timeout or a dead child. */
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    bool writeLine(const std::string& line);
    bool readLine(std::string& line, std::chrono::steady_clock::time_point deadline);
};
