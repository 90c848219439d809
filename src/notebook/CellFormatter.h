#pragma once
#include <string>
#include <vector>
#include "notebook/NotebookTypes.h"

/**
 * @brief Markdown rendering of cells for tool results.
 *
 * Text outputs longer than `maxOutputSize` code points are cut and marked,
 * binary outputs are only listed with their size and MIME type.
 */
class CellFormatter {
public:
    static bool isTextOutput(const std::string& mime);

    static std::string formatCell(const Cell& cell, int maxOutputSize);

    /** `## Cell ...` blocks, each followed by a `---` separator. */
    static std::string formatCells(const std::vector<Cell>& cells, int maxOutputSize);

    static std::string executionLabel(const Cell& cell);

private:
    static std::string formatOutputItem(const CellOutputItem& item, size_t ordinal, int maxOutputSize);
};
