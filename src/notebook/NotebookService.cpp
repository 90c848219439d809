#include "notebook/NotebookService.h"
#include "notebook/CellFormatter.h"
#include "notebook/RangeValidator.h"
#include "core/GatewayError.h"
#include "utils/Logger.h"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {
std::vector<Cell> sliceByIndex(const std::vector<Cell>& cells, int start, int stop) {
    std::vector<Cell> out;
    for (const auto& cell : cells) {
        if (cell.index >= start && cell.index < stop) out.push_back(cell);
    }
    return out;
}

std::string firstCodeLanguage(const std::vector<Cell>& cells) {
    for (const auto& cell : cells) {
        if (cell.kind == CellKind::Code && !cell.languageId.empty()) return cell.languageId;
    }
    return "";
}
} // namespace

NotebookService::NotebookService(std::shared_ptr<INotebookHost> host, Settings settings, SyncClock clock)
    : host(std::move(host)), config(std::move(settings)), clock(std::move(clock)) {}

void NotebookService::requireActive(const std::string& operation) {
    if (!host->hasActiveNotebook()) {
        throw Errors::noActiveNotebook(operation);
    }
}

std::string NotebookService::runExecution(int startIndex, int stopIndex) {
    ExecutionSynchronizer::Options options;
    options.pollInterval = config.pollInterval;
    options.settleDelay = config.settleDelay;
    options.timeout = std::chrono::seconds(config.timeoutSeconds);
    options.maxOutputSize = config.maxOutputSize;

    ExecutionSynchronizer sync(*host, options, clock);
    return sync.run(startIndex, stopIndex).text;
}

// ============================================================================
// Read-only operations
// ============================================================================

std::string NotebookService::getNotebookInfo() {
    if (!host->hasActiveNotebook()) {
        return "# Notebook Information\n\nNo active notebook found.";
    }

    NotebookInfo info = host->getNotebookInfo();
    std::vector<Cell> cells = host->getCells();

    int markdownCount = 0;
    int codeCount = 0;
    int executedCount = 0;
    std::vector<std::pair<std::string, int>> languages;  // first-appearance order
    for (const auto& cell : cells) {
        if (cell.kind == CellKind::Markup) {
            markdownCount++;
            continue;
        }
        codeCount++;
        if (cell.executionOrder.has_value()) executedCount++;
        auto it = std::find_if(languages.begin(), languages.end(),
                               [&](const auto& entry) { return entry.first == cell.languageId; });
        if (it == languages.end()) {
            languages.emplace_back(cell.languageId, 1);
        } else {
            it->second++;
        }
    }

    std::ostringstream out;
    out << "# Notebook Information\n\n";
    out << "## Basic Information\n";
    out << "- **URI**: " << info.uri << "\n";
    out << "- **Notebook Type**: " << info.notebookType << "\n";
    out << "- **Dirty?**: " << (info.isDirty ? "true" : "false") << "\n";
    if (info.kernelSpec) {
        out << "- **Kernel Language**: " << info.kernelSpec->language << "\n";
        out << "- **Kernel**: " << info.kernelSpec->displayName << " (" << info.kernelSpec->name << ")\n";
    }
    out << "\n";

    out << "## Cell Statistics\n";
    out << "- **Total Cells**: " << cells.size() << "\n";
    out << "- **Markdown Cells**: " << markdownCount << "\n";
    out << "- **Code Cells**: " << codeCount << "\n";
    out << "- **Executed Code Cells**: " << executedCount << "\n\n";

    if (!languages.empty()) {
        out << "## Language Distribution\n";
        for (const auto& [language, count] : languages) {
            out << "- **" << language << "**: " << count << " cells\n";
        }
    }
    return out.str();
}

std::string NotebookService::getCells() {
    requireActive("get_notebook_cells");

    std::vector<Cell> cells = host->getCells();
    if (cells.empty()) {
        return "# Notebook Analysis\n\nThe notebook is empty - it contains no cells.";
    }

    std::string result = "# Notebook Analysis\n\nNotebook contains " + std::to_string(cells.size()) + " cells:\n\n";
    result += CellFormatter::formatCells(cells, config.maxOutputSize);
    return result;
}

// ============================================================================
// Structural edits
// ============================================================================

std::vector<CellData> NotebookService::buildInsertion(const std::vector<CellSpec>& specs,
                                                      const std::vector<Cell>& existing) {
    std::vector<CellData> out;
    out.reserve(specs.size());
    for (const auto& spec : specs) {
        CellData data;
        data.kind = spec.cellType.value_or("") == "code" ? CellKind::Code : CellKind::Markup;
        data.content = spec.content;
        if (data.kind == CellKind::Markup) {
            data.languageId = "markdown";
        } else if (spec.languageId && !spec.languageId->empty()) {
            data.languageId = *spec.languageId;
        } else {
            data.languageId = firstCodeLanguage(existing);
            if (data.languageId.empty()) data.languageId = kDefaultLanguage;
        }
        out.push_back(std::move(data));
    }
    return out;
}

std::vector<CellData> NotebookService::reconcileReplacement(const std::vector<CellSpec>& specs,
                                                            const std::vector<Cell>& replaced) {
    std::vector<CellData> out;
    out.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        const CellSpec& spec = specs[i];
        const Cell* peer = i < replaced.size() ? &replaced[i] : nullptr;

        CellData data;
        data.content = spec.content;
        if (spec.cellType) {
            data.kind = *spec.cellType == "code" ? CellKind::Code : CellKind::Markup;
        } else if (peer) {
            data.kind = peer->kind;
        } else if (!replaced.empty()) {
            data.kind = replaced.front().kind;
        }

        if (data.kind == CellKind::Markup) {
            if (spec.languageId && *spec.languageId != "markdown") {
                throw Errors::validationError("language_id must be 'markdown' for markdown cells.",
                                              {{"cellOffset", i}, {"languageId", *spec.languageId}});
            }
            data.languageId = "markdown";
        } else if (spec.languageId && !spec.languageId->empty()) {
            data.languageId = *spec.languageId;
        } else if (peer && peer->kind == CellKind::Code) {
            data.languageId = peer->languageId;
        } else {
            data.languageId = firstCodeLanguage(replaced);
            if (data.languageId.empty()) data.languageId = kDefaultLanguage;
        }

        // keep the peer's metadata, the execution summary is not carried over
        if (peer && peer->kind == data.kind) {
            data.metadata = peer->metadata;
        }
        out.push_back(std::move(data));
    }
    return out;
}

std::string NotebookService::insertCells(const std::vector<CellSpec>& cells, std::optional<long long> insertPosition,
                                         bool noexec) {
    const std::string op = "insert_notebook_cells";
    requireActive(op);
    if (cells.empty()) {
        throw Errors::validationError("cells array is required and must not be empty.", {{"toolName", op}});
    }

    int position = 0;
    size_t inserted = 0;
    {
        std::lock_guard<std::mutex> lock(editMutex);
        std::vector<Cell> existing = host->getCells();
        position = RangeValidator::clampInsertPosition(insertPosition, static_cast<int>(existing.size()));
        std::vector<CellData> data = buildInsertion(cells, existing);
        inserted = data.size();
        host->applyEdit(NotebookEdit::insert(position, std::move(data)));
    }
    Logger::getInstance().info("Inserted cells", {{"position", position}, {"count", inserted}});

    std::string result = "Successfully inserted " + std::to_string(inserted) + " new cells at position " +
                         std::to_string(position) + ".";
    if (noexec) return result;
    return result + "\n\n" + runExecution(position, position + static_cast<int>(inserted));
}

std::string NotebookService::replaceCells(long long startIndex, long long stopIndex,
                                          const std::vector<CellSpec>& cells, bool noexec) {
    const std::string op = "replace_notebook_cells";
    requireActive(op);

    size_t created = 0;
    int start = 0;
    int stop = 0;
    {
        std::lock_guard<std::mutex> lock(editMutex);
        std::vector<Cell> existing = host->getCells();
        RangeValidator::requireRange(startIndex, stopIndex, static_cast<int>(existing.size()), op);
        start = static_cast<int>(startIndex);
        stop = static_cast<int>(stopIndex);
        std::vector<CellData> data = reconcileReplacement(cells, sliceByIndex(existing, start, stop));
        created = data.size();
        host->applyEdit(NotebookEdit::replace(start, stop, std::move(data)));
    }
    Logger::getInstance().info("Replaced cells",
                               {{"startIndex", startIndex}, {"stopIndex", stopIndex}, {"count", created}});

    std::string result = "Successfully replaced " + std::to_string(stop - start) + " cells with " +
                         std::to_string(created) + " new cells.";
    if (noexec || created == 0) return result;
    return result + "\n\n" + runExecution(start, start + static_cast<int>(created));
}

std::string NotebookService::modifyCellContent(long long cellIndex, const std::string& content, bool noexec) {
    const std::string op = "modify_notebook_cell_content";
    requireActive(op);

    int index = 0;
    {
        std::lock_guard<std::mutex> lock(editMutex);
        std::vector<Cell> existing = host->getCells();
        RangeValidator::requireIndex(cellIndex, static_cast<int>(existing.size()), op);
        index = static_cast<int>(cellIndex);
        CellSpec spec;
        spec.content = content;
        std::vector<CellData> data = reconcileReplacement({spec}, sliceByIndex(existing, index, index + 1));
        host->applyEdit(NotebookEdit::replace(index, index + 1, std::move(data)));
    }
    Logger::getInstance().info("Modified cell", {{"cellIndex", index}});

    std::string result = "Successfully modified cell at index " + std::to_string(index) + " with new content.";
    if (noexec) return result;
    return result + "\n\n" + runExecution(index, index + 1);
}

std::string NotebookService::executeCells(long long startIndex, long long stopIndex) {
    const std::string op = "execute_notebook_cells";
    requireActive(op);
    {
        std::lock_guard<std::mutex> lock(editMutex);
        RangeValidator::requireRange(startIndex, stopIndex, host->getCellCount(), op);
    }
    return runExecution(static_cast<int>(startIndex), static_cast<int>(stopIndex));
}

std::string NotebookService::deleteCells(long long startIndex, long long stopIndex) {
    const std::string op = "delete_notebook_cells";
    requireActive(op);
    int start = 0;
    int stop = 0;
    {
        std::lock_guard<std::mutex> lock(editMutex);
        RangeValidator::requireRange(startIndex, stopIndex, host->getCellCount(), op);
        start = static_cast<int>(startIndex);
        stop = static_cast<int>(stopIndex);
        host->applyEdit(NotebookEdit::remove(start, stop));
    }

    int deleted = stop - start;
    Logger::getInstance().info("Deleted cells", {{"startIndex", start}, {"stopIndex", stop}});
    return "Successfully deleted " + std::to_string(deleted) + " cell" + (deleted != 1 ? "s" : "") +
           " from index " + std::to_string(start) + " to " + std::to_string(stop - 1) + ".";
}

// ============================================================================
// Document and kernel lifecycle
// ============================================================================

std::string NotebookService::saveNotebook() {
    const std::string op = "save_notebook";
    requireActive(op);
    std::string uri = host->getNotebookInfo().uri;
    try {
        host->save(uri);
    } catch (const std::exception& e) {
        throw Errors::wrap(e, ErrorCode::NOTEBOOK_SAVE_FAILED, {{"operation", op}, {"notebookUri", uri}});
    }
    return "Successfully saved notebook: " + uri;
}

std::string NotebookService::resolveNotebookUri(const std::string& path) const {
    fs::path p = fs::u8path(path);
    if (p.is_absolute()) {
        return "file://" + p.lexically_normal().generic_u8string();
    }
    if (config.workspaceRoots.empty()) {
        throw Errors::validationError("No workspace open. Please use an absolute path or open a workspace.",
                                      {{"toolName", "open_notebook"}, {"path", path}});
    }
    if (config.workspaceRoots.size() > 1) {
        throw Errors::validationError(
            "Multiple workspace folders detected. Please use an absolute path to specify which notebook to open.",
            {{"toolName", "open_notebook"}, {"path", path}});
    }
    fs::path full = fs::u8path(config.workspaceRoots.front()) / p;
    return "file://" + full.lexically_normal().generic_u8string();
}

std::string NotebookService::openNotebook(const std::string& path) {
    std::string uri = resolveNotebookUri(path);
    NotebookInfo info;
    try {
        info = host->openNotebook(uri);
    } catch (const std::exception& e) {
        throw Errors::wrap(e, ErrorCode::NOTEBOOK_OPEN_FAILED, {{"operation", "open_notebook"}, {"notebookUri", uri}});
    }

    nlohmann::json notebook = {
        {"uri", info.uri},
        {"notebookType", info.notebookType},
        {"isDirty", info.isDirty},
        {"cellCount", info.cellCount}
    };
    if (info.kernelSpec) {
        notebook["kernelLanguage"] = info.kernelSpec->language;
        notebook["kernelName"] = info.kernelSpec->displayName + " (" + info.kernelSpec->name + ")";
    }
    nlohmann::json result = {
        {"status", "success"},
        {"message", "Notebook opened and activated: " + path},
        {"notebook", notebook}
    };
    return result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string NotebookService::restartKernel() {
    const std::string op = "restart_kernel";
    requireActive(op);
    std::string uri = host->getNotebookInfo().uri;
    try {
        host->restartKernel();
    } catch (const std::exception& e) {
        throw Errors::wrap(e, ErrorCode::KERNEL_ERROR, {{"operation", op}, {"notebookUri", uri}});
    }
    return "Kernel restarted for notebook: " + uri;
}

std::string NotebookService::interruptKernel() {
    const std::string op = "interrupt_kernel";
    requireActive(op);
    std::string uri = host->getNotebookInfo().uri;
    try {
        host->interruptKernel();
    } catch (const std::exception& e) {
        throw Errors::wrap(e, ErrorCode::KERNEL_ERROR, {{"operation", op}, {"notebookUri", uri}});
    }
    return "Kernel interrupted for notebook: " + uri;
}
