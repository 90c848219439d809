#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ITool.h"
#include "notebook/NotebookService.h"

class ToolRegistry;

/**
 * @brief Common base of the notebook tools: they all forward to one
 * NotebookService and answer with a single text item.
 */
class NotebookTool : public ITool {
public:
    explicit NotebookTool(std::shared_ptr<NotebookService> service) : service(std::move(service)) {}

protected:
    std::shared_ptr<NotebookService> service;

    static nlohmann::json textResult(const std::string& text);

    /** `{type: object, properties: {}, additionalProperties: false}` */
    static nlohmann::json emptySchema();
};

class GetNotebookInfoTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "get_notebook_info"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class GetNotebookCellsTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "get_notebook_cells"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/**
 * @brief Insert new cells, then run them.
 *
 * `insert_position` is clamped into the notebook; omitted means append.
 */
class InsertNotebookCellsTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "insert_notebook_cells"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class ReplaceNotebookCellsTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "replace_notebook_cells"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class ModifyNotebookCellContentTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "modify_notebook_cell_content"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class ExecuteNotebookCellsTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "execute_notebook_cells"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class DeleteNotebookCellsTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "delete_notebook_cells"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class SaveNotebookTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "save_notebook"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class OpenNotebookTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "open_notebook"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class RestartKernelTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "restart_kernel"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

class InterruptKernelTool : public NotebookTool {
public:
    using NotebookTool::NotebookTool;
    std::string getName() const override { return "interrupt_kernel"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

/** Registers all notebook tools in their advertised order. */
void registerNotebookTools(ToolRegistry& registry, const std::shared_ptr<NotebookService>& service);

/** `cells` argument to CellSpecs; fields are already schema checked. */
std::vector<CellSpec> parseCellSpecs(const nlohmann::json& cells);
