#pragma once
#include <string>
#include <vector>
#include "notebook/NotebookTypes.h"

/**
 * @brief The external document/kernel provider.
 *
 * The gateway owns no cells: every read goes back to the host, and every
 * change is an edit request. Implementations report failures by throwing
 * GatewayError (HOST_ERROR, NO_ACTIVE_NOTEBOOK ...).
 */
class INotebookHost {
public:
    virtual ~INotebookHost() = default;

    virtual bool hasActiveNotebook() = 0;
    virtual NotebookInfo getNotebookInfo() = 0;

    virtual int getCellCount() = 0;
    virtual std::vector<Cell> getCells() = 0;

    /** Applied atomically; indices are recomputed by the host afterwards. */
    virtual void applyEdit(const NotebookEdit& edit) = 0;

    /** Fire-and-forget: returns once the kernel accepted the request. */
    virtual void executeRange(int start, int stop) = 0;

    virtual void save(const std::string& uri) = 0;
    virtual NotebookInfo openNotebook(const std::string& uri) = 0;

    virtual void restartKernel() = 0;
    virtual void interruptKernel() = 0;
};
