#include "notebook/CellFormatter.h"
#include "utils/Utf8.h"
#include <sstream>

bool CellFormatter::isTextOutput(const std::string& mime) {
    if (mime.rfind("text/", 0) == 0) return true;

    if (mime == "application/vnd.code.notebook.stdout") return true;
    if (mime == "application/vnd.code.notebook.stderr") return true;

    if (mime == "application/json") return true;
    if (mime == "application/javascript") return true;

    return false;
}

std::string CellFormatter::executionLabel(const Cell& cell) {
    if (cell.executionOrder.has_value()) {
        return std::to_string(*cell.executionOrder);
    }
    return " ";
}

std::string CellFormatter::formatOutputItem(const CellOutputItem& item, size_t ordinal, int maxOutputSize) {
    std::ostringstream out;
    if (!isTextOutput(item.mime)) {
        out << ordinal << ". (Not shown) " << item.data.size() << " bytes with MIME: " << item.mime << "\n\n";
        return out.str();
    }

    std::string text = UTF8Utils::sanitize(item.data);
    size_t length = UTF8Utils::codepointCount(text);
    size_t limit = maxOutputSize > 0 ? static_cast<size_t>(maxOutputSize) : 0;

    if (length > limit) {
        size_t keep = limit > 3 ? limit - 3 : 0;
        out << ordinal << ". Truncated text with MIME: " << item.mime
            << ", full length: " << length << " characters\n\n";
        out << "```\n" << UTF8Utils::truncateCodepoints(text, keep) << "...\n```\n\n";
    } else {
        out << ordinal << ". Text with MIME: " << item.mime << "\n\n";
        out << "```\n" << text << "\n```\n\n";
    }
    return out.str();
}

std::string CellFormatter::formatCell(const Cell& cell, int maxOutputSize) {
    std::ostringstream out;
    out << "## Cell " << cell.index << " (";
    if (cell.kind == CellKind::Code) {
        out << "code:" << cell.languageId;
    } else {
        out << "markdown";
    }
    out << ")\n\n";

    if (cell.kind != CellKind::Code) {
        out << "```" << cell.languageId << "\n" << cell.content << "\n```\n\n";
        return out.str();
    }

    std::string label = executionLabel(cell);
    out << "### In [" << label << "]:\n\n```" << cell.languageId << "\n" << cell.content << "\n```\n\n";

    if (!cell.outputs.empty()) {
        out << "### Out [" << label << "]:\n\n";
        for (const auto& output : cell.outputs) {
            out << "#### Output with " << output.items.size() << " items\n\n";
            for (size_t i = 0; i < output.items.size(); ++i) {
                out << formatOutputItem(output.items[i], i + 1, maxOutputSize);
            }
        }
    }
    return out.str();
}

std::string CellFormatter::formatCells(const std::vector<Cell>& cells, int maxOutputSize) {
    std::string result;
    for (const auto& cell : cells) {
        result += formatCell(cell, maxOutputSize);
        result += "---\n\n";
    }
    return result;
}
