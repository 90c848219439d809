#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "notebook/INotebookHost.h"
#include "notebook/ExecutionSynchronizer.h"

/**
 * @brief One requested cell, as sent by the caller.
 *
 * Unset fields are reconciled against existing cells (see reconcileReplacement).
 */
struct CellSpec {
    std::string content;
    std::optional<std::string> cellType;     // "code" | "markdown"
    std::optional<std::string> languageId;
};

/**
 * @brief Notebook operations behind the tools.
 *
 * Every operation re-reads live state from the host. The read of the cell
 * count, the bounds check and the edit that depends on them run under one
 * lock so that no other edit from this gateway can slip in between; the
 * (long) execution wait happens outside of it.
 */
class NotebookService {
public:
    struct Settings {
        int maxOutputSize = 2000;
        int timeoutSeconds = 30;
        std::vector<std::string> workspaceRoots;
        std::chrono::milliseconds pollInterval{200};
        std::chrono::milliseconds settleDelay{500};
    };

    static constexpr const char* kDefaultLanguage = "python";

    NotebookService(std::shared_ptr<INotebookHost> host, Settings settings, SyncClock clock = SyncClock::system());

    std::string getNotebookInfo();
    std::string getCells();
    // Indices arrive as sent by the caller and are narrowed only after the
    // bounds check against the live count.
    std::string insertCells(const std::vector<CellSpec>& cells, std::optional<long long> insertPosition, bool noexec);
    std::string replaceCells(long long startIndex, long long stopIndex, const std::vector<CellSpec>& cells, bool noexec);
    std::string modifyCellContent(long long cellIndex, const std::string& content, bool noexec);
    std::string executeCells(long long startIndex, long long stopIndex);
    std::string deleteCells(long long startIndex, long long stopIndex);
    std::string saveNotebook();
    std::string openNotebook(const std::string& path);
    std::string restartKernel();
    std::string interruptKernel();

    /** Cell data for an insertion: explicit language, else the notebook's first code cell, else the default. */
    static std::vector<CellData> buildInsertion(const std::vector<CellSpec>& specs, const std::vector<Cell>& existing);

    /**
     * Cell data for a replacement of `replaced`. Kind and language that the
     * caller omits come from the positional peer, then from the first code
     * cell being replaced, then the default language.
     */
    static std::vector<CellData> reconcileReplacement(const std::vector<CellSpec>& specs, const std::vector<Cell>& replaced);

    /** Absolute paths are kept; relative ones need exactly one workspace root. */
    std::string resolveNotebookUri(const std::string& path) const;

    const Settings& settings() const { return config; }

private:
    std::shared_ptr<INotebookHost> host;
    Settings config;
    SyncClock clock;
    std::mutex editMutex;

    void requireActive(const std::string& operation);
    std::string runExecution(int startIndex, int stopIndex);
};
