#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class CellKind {
    Code,
    Markup
};

struct CellOutputItem {
    std::string mime;
    std::string data;   // raw bytes
};

struct CellOutput {
    std::vector<CellOutputItem> items;
};

/**
 * @brief A live view of one notebook cell as reported by the host.
 *
 * `executionOrder` is the completion marker: undefined until the cell first
 * finishes executing, replaced by a new value on every completed run.
 */
struct Cell {
    int index = 0;
    CellKind kind = CellKind::Code;
    std::string content;
    std::string languageId;
    std::optional<long long> executionOrder;
    std::vector<CellOutput> outputs;
    nlohmann::json metadata = nlohmann::json::object();
};

/** Cell contents handed to the host when inserting or replacing. */
struct CellData {
    CellKind kind = CellKind::Code;
    std::string content;
    std::string languageId;
    nlohmann::json metadata = nlohmann::json::object();
};

struct KernelSpec {
    std::string name;
    std::string displayName;
    std::string language;
};

struct NotebookInfo {
    std::string uri;
    std::string notebookType;
    bool isDirty = false;
    int cellCount = 0;
    std::optional<KernelSpec> kernelSpec;
};

struct NotebookEdit {
    enum class Type { Insert, Replace, Delete };

    Type type = Type::Insert;
    int start = 0;   // insert position, or range start
    int stop = 0;    // range stop (exclusive); equals start for inserts
    std::vector<CellData> cells;

    static NotebookEdit insert(int position, std::vector<CellData> cells) {
        return {Type::Insert, position, position, std::move(cells)};
    }
    static NotebookEdit replace(int start, int stop, std::vector<CellData> cells) {
        return {Type::Replace, start, stop, std::move(cells)};
    }
    static NotebookEdit remove(int start, int stop) {
        return {Type::Delete, start, stop, {}};
    }
};

inline const char* cellKindName(CellKind kind) {
    return kind == CellKind::Markup ? "markdown" : "code";
}
