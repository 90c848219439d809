#include "notebook/StdioNotebookHost.h"
#include "core/GatewayError.h"
#include "utils/Base64.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {
// readLine re-checks `closed` at least this often
constexpr std::chrono::milliseconds kPollSlice{100};
} // namespace

StdioNotebookHost::StdioNotebookHost(std::string command, std::chrono::seconds callTimeout)
    : command(std::move(command)), callTimeout(callTimeout) {}

StdioNotebookHost::~StdioNotebookHost() {
    stop();
}

// ============================================================================
// Child process
// ============================================================================

bool StdioNotebookHost::startProcess() {
    int toChild[2];
    int fromChild[2];
    if (pipe(toChild) == -1) {
        return false;
    }
    if (pipe(fromChild) == -1) {
        close(toChild[0]);
        close(toChild[1]);
        return false;
    }

    childPid = fork();
    if (childPid == -1) {
        close(toChild[0]);
        close(toChild[1]);
        close(fromChild[0]);
        close(fromChild[1]);
        return false;
    }

    if (childPid == 0) { // Child
        dup2(toChild[0], STDIN_FILENO);
        dup2(fromChild[1], STDOUT_FILENO);

        close(toChild[0]);
        close(toChild[1]);
        close(fromChild[0]);
        close(fromChild[1]);

        execl("/bin/sh", "sh", "-c", command.c_str(), (char*)NULL);
        _exit(127);
    }

    // Parent
    close(toChild[0]);
    close(fromChild[1]);
    writeFd = toChild[1];
    readFd = fromChild[0];
    fcntl(writeFd, F_SETFD, FD_CLOEXEC);
    fcntl(readFd, F_SETFD, FD_CLOEXEC);
    pending.clear();

    Logger::getInstance().info("Notebook host started", {{"command", command}, {"pid", childPid}});
    return true;
}

void StdioNotebookHost::stopProcess() {
    if (childPid == -1) return;

    close(writeFd);
    close(readFd);
    writeFd = readFd = -1;

    kill(childPid, SIGTERM);
    waitpid(childPid, NULL, 0);
    Logger::getInstance().info("Notebook host stopped", {{"pid", childPid}});
    childPid = -1;
    pending.clear();
}

void StdioNotebookHost::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (closed) {
        throw Errors::hostError("Notebook host has been shut down", {{"command", command}});
    }
    if (childPid == -1 && !startProcess()) {
        throw Errors::hostError("Failed to start notebook host: " + std::string(std::strerror(errno)),
                                {{"command", command}});
    }
}

void StdioNotebookHost::stop() {
    closed = true;
    std::lock_guard<std::mutex> lock(mtx);
    stopProcess();
}

bool StdioNotebookHost::writeLine(const std::string& line) {
    const char* data = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = write(writeFd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool StdioNotebookHost::readLine(std::string& line, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto nl = pending.find('\n');
        if (nl != std::string::npos) {
            line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            return true;
        }

        if (closed) return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        struct pollfd pfd = {readFd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, kPollSlice).count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ready == 0) continue;

        char buffer[4096];
        ssize_t n = read(readFd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;   // EOF: child went away
        pending.append(buffer, static_cast<size_t>(n));
    }
}

json StdioNotebookHost::call(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mtx);

    if (closed) {
        throw Errors::hostError("Notebook host has been shut down", {{"method", method}});
    }
    if (childPid == -1 && !startProcess()) {
        throw Errors::hostError("Failed to start notebook host: " + std::string(std::strerror(errno)),
                                {{"command", command}, {"method", method}});
    }

    long long id = ++requestId;
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    if (!writeLine(request.dump(-1, ' ', false, json::error_handler_t::replace) + "\n")) {
        stopProcess();
        throw Errors::hostError("Notebook host is not accepting requests", {{"method", method}});
    }

    auto deadline = std::chrono::steady_clock::now() + callTimeout;
    std::string line;
    while (true) {
        if (!readLine(line, deadline)) {
            bool timedOut = std::chrono::steady_clock::now() >= deadline;
            stopProcess();
            if (closed) {
                throw Errors::hostError("Notebook host has been shut down", {{"method", method}});
            }
            if (timedOut) {
                throw Errors::hostError("Notebook host did not answer within " +
                                            std::to_string(callTimeout.count()) + " seconds",
                                        {{"method", method}, {"timeout", callTimeout.count()}});
            }
            throw Errors::hostError("Notebook host closed its output", {{"method", method}});
        }

        // Skip non-JSON noise (logs, warnings)
        if (line.empty() || line[0] != '{') continue;
        json response = json::parse(line, nullptr, false);
        if (response.is_discarded()) continue;
        if (!response.contains("id") || response["id"] != id) continue;

        if (response.contains("error")) {
            const json& err = response["error"];
            int code = err.value("code", 0);
            std::string message = err.value("message", std::string("Notebook host error"));
            if (code == kNoActiveNotebookCode) {
                throw Errors::noActiveNotebook(method);
            }
            throw Errors::hostError(message, {{"method", method}, {"hostCode", code}});
        }
        return response.contains("result") ? response["result"] : json(nullptr);
    }
}

// ============================================================================
// Wire conversions
// ============================================================================

Cell StdioNotebookHost::cellFromJson(const json& j) {
    Cell cell;
    cell.index = j.value("index", 0);
    cell.kind = j.value("kind", std::string("code")) == "markdown" ? CellKind::Markup : CellKind::Code;
    cell.content = j.value("content", "");
    cell.languageId = j.value("languageId", "");
    if (j.contains("executionOrder") && j["executionOrder"].is_number_integer()) {
        cell.executionOrder = j["executionOrder"].get<long long>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        cell.metadata = j["metadata"];
    }

    if (j.contains("outputs") && j["outputs"].is_array()) {
        for (const auto& o : j["outputs"]) {
            CellOutput output;
            if (o.contains("items") && o["items"].is_array()) {
                for (const auto& i : o["items"]) {
                    CellOutputItem item;
                    item.mime = i.value("mime", "");
                    std::string data = i.value("data", "");
                    item.data = i.value("encoding", "") == "base64" ? Base64::decode(data) : data;
                    output.items.push_back(std::move(item));
                }
            }
            cell.outputs.push_back(std::move(output));
        }
    }
    return cell;
}

NotebookInfo StdioNotebookHost::infoFromJson(const json& j) {
    NotebookInfo info;
    info.uri = j.value("uri", "");
    info.notebookType = j.value("notebookType", "jupyter-notebook");
    info.isDirty = j.value("isDirty", false);
    info.cellCount = j.value("cellCount", 0);
    if (j.contains("kernel") && j["kernel"].is_object()) {
        const json& k = j["kernel"];
        info.kernelSpec = KernelSpec{k.value("name", ""), k.value("displayName", ""), k.value("language", "")};
    }
    return info;
}

json StdioNotebookHost::editToJson(const NotebookEdit& edit) {
    const char* type = "insert";
    if (edit.type == NotebookEdit::Type::Replace) type = "replace";
    if (edit.type == NotebookEdit::Type::Delete) type = "delete";

    json cells = json::array();
    for (const auto& c : edit.cells) {
        cells.push_back({
            {"kind", cellKindName(c.kind)},
            {"content", c.content},
            {"languageId", c.languageId},
            {"metadata", c.metadata}
        });
    }
    return {{"type", type}, {"start", edit.start}, {"stop", edit.stop}, {"cells", cells}};
}

// ============================================================================
// INotebookHost
// ============================================================================

bool StdioNotebookHost::hasActiveNotebook() {
    try {
        return !call("notebook/info", json::object()).is_null();
    } catch (const GatewayError& e) {
        if (e.code() == ErrorCode::NO_ACTIVE_NOTEBOOK) return false;
        throw;
    }
}

NotebookInfo StdioNotebookHost::getNotebookInfo() {
    json result = call("notebook/info", json::object());
    if (result.is_null()) {
        throw Errors::noActiveNotebook("notebook/info");
    }
    return infoFromJson(result);
}

int StdioNotebookHost::getCellCount() {
    return getNotebookInfo().cellCount;
}

std::vector<Cell> StdioNotebookHost::getCells() {
    json result = call("notebook/cells", json::object());
    std::vector<Cell> cells;
    if (result.is_object() && result.contains("cells") && result["cells"].is_array()) {
        for (const auto& c : result["cells"]) {
            cells.push_back(cellFromJson(c));
        }
    }
    return cells;
}

void StdioNotebookHost::applyEdit(const NotebookEdit& edit) {
    call("notebook/applyEdit", editToJson(edit));
}

void StdioNotebookHost::executeRange(int start, int stop) {
    call("notebook/executeRange", {{"start", start}, {"stop", stop}});
}

void StdioNotebookHost::save(const std::string& uri) {
    call("notebook/save", {{"uri", uri}});
}

NotebookInfo StdioNotebookHost::openNotebook(const std::string& uri) {
    json result = call("notebook/open", {{"uri", uri}});
    if (!result.is_object()) {
        throw Errors::hostError("Notebook host returned no notebook for " + uri, {{"method", "notebook/open"}});
    }
    return infoFromJson(result);
}

void StdioNotebookHost::restartKernel() {
    call("kernel/restart", json::object());
}

void StdioNotebookHost::interruptKernel() {
    call("kernel/interrupt", json::object());
}
