#include "NotebookTools.h"
#include "ToolRegistry.h"
#include <limits>

namespace {
nlohmann::json indexProperty(const std::string& description) {
    return {{"type", "integer"}, {"minimum", 0}, {"description", description}};
}

nlohmann::json noexecProperty(const std::string& description) {
    return {{"type", "boolean"}, {"description", description}};
}

nlohmann::json cellItemSchema(bool cellTypeRequired) {
    nlohmann::json item = {
        {"type", "object"},
        {"properties", {
            {"content", {
                {"type", "string"},
                {"description", "The content of the cell"}
            }},
            {"cell_type", {
                {"type", "string"},
                {"enum", {"code", "markdown"}},
                {"description", "Either 'code' for executable cells or 'markdown' for text cells"}
            }},
            {"language_id", {
                {"type", "string"},
                {"description", "Optional language ID for code cells (e.g., 'python', 'javascript'). "
                                "If not provided, it is inferred from existing code cells or defaults to 'python'"}
            }}
        }}
    };
    item["required"] = cellTypeRequired ? nlohmann::json{"content", "cell_type"} : nlohmann::json{"content"};
    return item;
}

/**
 * Reads an already schema-checked integer argument without narrowing.
 * Integral floats (`1.0`) are accepted; magnitudes beyond `long long`
 * saturate, which keeps them out of every valid range.
 */
long long indexArgument(const nlohmann::json& v) {
    constexpr long long kMax = std::numeric_limits<long long>::max();
    if (v.is_number_unsigned()) {
        auto u = v.get<unsigned long long>();
        return u > static_cast<unsigned long long>(kMax) ? kMax : static_cast<long long>(u);
    }
    if (v.is_number_integer()) return v.get<long long>();
    double d = v.get<double>();
    if (d >= 9.2e18) return kMax;
    if (d <= -9.2e18) return std::numeric_limits<long long>::min();
    return static_cast<long long>(d);
}

bool noexecFlag(const nlohmann::json& args) {
    return args.contains("noexec") && args["noexec"].is_boolean() && args["noexec"].get<bool>();
}
} // namespace

std::vector<CellSpec> parseCellSpecs(const nlohmann::json& cells) {
    std::vector<CellSpec> specs;
    if (!cells.is_array()) return specs;
    for (const auto& c : cells) {
        CellSpec spec;
        spec.content = c.value("content", "");
        if (c.contains("cell_type") && c["cell_type"].is_string()) {
            spec.cellType = c["cell_type"].get<std::string>();
        }
        if (c.contains("language_id") && c["language_id"].is_string()) {
            spec.languageId = c["language_id"].get<std::string>();
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

nlohmann::json NotebookTool::textResult(const std::string& text) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

nlohmann::json NotebookTool::emptySchema() {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", false}
    };
}

// ============================================================================
// get_notebook_info / get_notebook_cells
// ============================================================================

std::string GetNotebookInfoTool::getDescription() const {
    return "Get comprehensive information about the active notebook, including URI, kernel, and cell statistics.";
}

nlohmann::json GetNotebookInfoTool::getSchema() const { return emptySchema(); }

nlohmann::json GetNotebookInfoTool::execute(const nlohmann::json&) {
    return textResult(service->getNotebookInfo());
}

std::string GetNotebookCellsTool::getDescription() const {
    return "Get information about all cells in the active notebook. Includes cell indexes, types, content, and outputs.";
}

nlohmann::json GetNotebookCellsTool::getSchema() const { return emptySchema(); }

nlohmann::json GetNotebookCellsTool::execute(const nlohmann::json&) {
    return textResult(service->getCells());
}

// ============================================================================
// insert / replace / modify
// ============================================================================

std::string InsertNotebookCellsTool::getDescription() const {
    return "Insert multiple cells at a specified position in the active notebook. "
           "By default, new code cells are executed unless noexec is true.";
}

nlohmann::json InsertNotebookCellsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"cells", {
                {"type", "array"},
                {"minItems", 1},
                {"items", cellItemSchema(true)},
                {"description", "Array of cell definitions to insert. Each cell must specify content and cell_type."}
            }},
            {"insert_position", {
                {"type", "integer"},
                {"description", "Optional position to insert cells. Defaults to the end of the notebook. "
                                "Values outside 0..cellCount are clamped"}
            }},
            {"noexec", noexecProperty("If true, skips execution of inserted code cells")}
        }},
        {"required", {"cells"}}
    };
}

nlohmann::json InsertNotebookCellsTool::execute(const nlohmann::json& args) {
    std::optional<long long> position;
    if (args.contains("insert_position") && args["insert_position"].is_number()) {
        position = indexArgument(args["insert_position"]);
    }
    return textResult(service->insertCells(parseCellSpecs(args["cells"]), position, noexecFlag(args)));
}

std::string ReplaceNotebookCellsTool::getDescription() const {
    return "Replace a range of cells in the notebook with new cells. Uses half-open range [start_index, stop_index) - "
           "meaning stop_index is exclusive. Executed automatically unless noexec is true.";
}

nlohmann::json ReplaceNotebookCellsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"start_index", indexProperty("The starting index (inclusive) of the range of cells to replace")},
            {"stop_index", indexProperty("The stopping index (exclusive) of the range of cells to replace. "
                                         "Must be greater than start_index")},
            {"cells", {
                {"type", "array"},
                {"items", cellItemSchema(false)},
                {"description", "Replacement cells. Omitted cell_type/language_id are taken from the replaced cells"}
            }},
            {"noexec", noexecProperty("If true, skips execution of the new code cells")}
        }},
        {"required", {"start_index", "stop_index", "cells"}}
    };
}

nlohmann::json ReplaceNotebookCellsTool::execute(const nlohmann::json& args) {
    return textResult(service->replaceCells(indexArgument(args["start_index"]), indexArgument(args["stop_index"]),
                                            parseCellSpecs(args["cells"]), noexecFlag(args)));
}

std::string ModifyNotebookCellContentTool::getDescription() const {
    return "Modify the content of an existing cell. By default, modified code cells are executed unless noexec is true.";
}

nlohmann::json ModifyNotebookCellContentTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"cell_index", indexProperty("The index of the cell to modify. Must be between 0 and the current cell count minus 1")},
            {"content", {
                {"type", "string"},
                {"description", "The new content for the cell. Will maintain the cell's existing type and language"}
            }},
            {"noexec", noexecProperty("If true, skips execution of the modified cell")}
        }},
        {"required", {"cell_index", "content"}}
    };
}

nlohmann::json ModifyNotebookCellContentTool::execute(const nlohmann::json& args) {
    return textResult(service->modifyCellContent(indexArgument(args["cell_index"]), args["content"].get<std::string>(),
                                                 noexecFlag(args)));
}

// ============================================================================
// execute / delete
// ============================================================================

std::string ExecuteNotebookCellsTool::getDescription() const {
    return "Execute a range of cells in the active notebook. Uses half-open range [start_index, stop_index) - "
           "meaning stop_index is exclusive.";
}

nlohmann::json ExecuteNotebookCellsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"start_index", indexProperty("The starting index (inclusive) of the range of cells to execute")},
            {"stop_index", indexProperty("The stopping index (exclusive) of the range of cells to execute. "
                                         "For a single cell at index i, use start_index=i and stop_index=i+1")}
        }},
        {"required", {"start_index", "stop_index"}}
    };
}

nlohmann::json ExecuteNotebookCellsTool::execute(const nlohmann::json& args) {
    return textResult(service->executeCells(indexArgument(args["start_index"]), indexArgument(args["stop_index"])));
}

std::string DeleteNotebookCellsTool::getDescription() const {
    return "Delete a range of cells from the notebook. Uses half-open range [start_index, stop_index) - "
           "meaning stop_index is exclusive.";
}

nlohmann::json DeleteNotebookCellsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"start_index", indexProperty("The starting index (inclusive) of the range of cells to delete")},
            {"stop_index", indexProperty("The stopping index (exclusive) of the range of cells to delete")}
        }},
        {"required", {"start_index", "stop_index"}}
    };
}

nlohmann::json DeleteNotebookCellsTool::execute(const nlohmann::json& args) {
    return textResult(service->deleteCells(indexArgument(args["start_index"]), indexArgument(args["stop_index"])));
}

// ============================================================================
// Document and kernel lifecycle
// ============================================================================

std::string SaveNotebookTool::getDescription() const {
    return "Save the active notebook to disk.";
}

nlohmann::json SaveNotebookTool::getSchema() const { return emptySchema(); }

nlohmann::json SaveNotebookTool::execute(const nlohmann::json&) {
    return textResult(service->saveNotebook());
}

std::string OpenNotebookTool::getDescription() const {
    return "Open a specified .ipynb file in the workspace and make it the active notebook editor.";
}

nlohmann::json OpenNotebookTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {
                {"type", "string"},
                {"minLength", 1},
                {"description", "Path to the .ipynb notebook file, absolute or relative to the workspace root"}
            }}
        }},
        {"required", {"path"}}
    };
}

nlohmann::json OpenNotebookTool::execute(const nlohmann::json& args) {
    return textResult(service->openNotebook(args["path"].get<std::string>()));
}

std::string RestartKernelTool::getDescription() const {
    return "Restart the kernel for the active notebook. This will stop the current kernel session and start a new one, "
           "clearing all variables and state.";
}

nlohmann::json RestartKernelTool::getSchema() const { return emptySchema(); }

nlohmann::json RestartKernelTool::execute(const nlohmann::json&) {
    return textResult(service->restartKernel());
}

std::string InterruptKernelTool::getDescription() const {
    return "Interrupt the current kernel execution for the active notebook. This stops any currently running code "
           "without restarting the kernel session.";
}

nlohmann::json InterruptKernelTool::getSchema() const { return emptySchema(); }

nlohmann::json InterruptKernelTool::execute(const nlohmann::json&) {
    return textResult(service->interruptKernel());
}

void registerNotebookTools(ToolRegistry& registry, const std::shared_ptr<NotebookService>& service) {
    registry.registerTool(std::make_unique<GetNotebookInfoTool>(service));
    registry.registerTool(std::make_unique<GetNotebookCellsTool>(service));
    registry.registerTool(std::make_unique<InsertNotebookCellsTool>(service));
    registry.registerTool(std::make_unique<ReplaceNotebookCellsTool>(service));
    registry.registerTool(std::make_unique<ModifyNotebookCellContentTool>(service));
    registry.registerTool(std::make_unique<ExecuteNotebookCellsTool>(service));
    registry.registerTool(std::make_unique<DeleteNotebookCellsTool>(service));
    registry.registerTool(std::make_unique<SaveNotebookTool>(service));
    registry.registerTool(std::make_unique<OpenNotebookTool>(service));
    registry.registerTool(std::make_unique<RestartKernelTool>(service));
    registry.registerTool(std::make_unique<InterruptKernelTool>(service));
}
