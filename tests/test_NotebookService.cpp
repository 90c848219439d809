/**
 * NotebookService tests: bounds checks against the live cell count, insert
 * clamping, language/kind reconciliation on replace, result texts.
 */
#include <gtest/gtest.h>
#include <functional>
#include <memory>
#include <string>

#include "FakeNotebookHost.h"
#include "core/GatewayError.h"
#include "notebook/NotebookService.h"
#include "utils/Logger.h"

using namespace std::chrono_literals;

namespace {
CellSpec codeSpec(const std::string& content, std::optional<std::string> lang = std::nullopt) {
    CellSpec s;
    s.content = content;
    s.cellType = "code";
    s.languageId = lang;
    return s;
}

CellSpec markdownSpec(const std::string& content) {
    CellSpec s;
    s.content = content;
    s.cellType = "markdown";
    return s;
}

class NotebookServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
        host = std::make_shared<FakeNotebookHost>();
    }

    NotebookService makeService(NotebookService::Settings settings = {}) {
        settings.pollInterval = 10ms;
        settings.settleDelay = 0ms;
        return NotebookService(host, settings, clock.clock());
    }

    void expectOutOfBounds(const std::function<void()>& fn, int cellCount) {
        try {
            fn();
            FAIL() << "expected INDEX_OUT_OF_BOUNDS";
        } catch (const GatewayError& e) {
            EXPECT_EQ(e.code(), ErrorCode::INDEX_OUT_OF_BOUNDS);
            EXPECT_EQ(e.context().at("cellCount").get<int>(), cellCount);
        }
    }

    std::shared_ptr<FakeNotebookHost> host;
    ManualClock clock;
};
} // namespace

TEST_F(NotebookServiceTest, InsertPositionBeyondCountIsClamped) {
    host->addCode("a");
    host->addCode("b");
    host->addCode("c");
    auto svc = makeService();

    std::string text = svc.insertCells({codeSpec("d")}, 10, true);

    EXPECT_EQ(text, "Successfully inserted 1 new cells at position 3.");
    ASSERT_EQ(host->cells.size(), 4u);
    EXPECT_EQ(host->cells[3].content, "d");
    EXPECT_TRUE(host->executions.empty());
}

TEST_F(NotebookServiceTest, NegativeInsertPositionClampsToStart) {
    host->addCode("a");
    auto svc = makeService();

    EXPECT_EQ(svc.insertCells({markdownSpec("# top")}, -4, true),
              "Successfully inserted 1 new cells at position 0.");
    EXPECT_EQ(host->cells[0].kind, CellKind::Markup);
    EXPECT_EQ(host->cells[0].languageId, "markdown");
}

TEST_F(NotebookServiceTest, InsertThenGetCellsShiftsFollowingCells) {
    host->addCode("first");
    host->addCode("second");
    auto svc = makeService();

    svc.insertCells({codeSpec("new one"), codeSpec("new two")}, 1, true);
    std::string cells = svc.getCells();

    EXPECT_NE(cells.find("Notebook contains 4 cells:"), std::string::npos);
    auto posNew = cells.find("## Cell 1 (code:python)\n\n### In [ ]:\n\n```python\nnew one");
    auto posShifted = cells.find("## Cell 3 (code:python)\n\n### In [ ]:\n\n```python\nsecond");
    EXPECT_NE(posNew, std::string::npos) << cells;
    EXPECT_NE(posShifted, std::string::npos) << cells;
}

TEST_F(NotebookServiceTest, InsertExecutesNewCodeCellsByDefault) {
    host->addCode("x = 1");
    auto svc = makeService();

    std::string text = svc.insertCells({codeSpec("print(x)"), markdownSpec("note")}, std::nullopt, false);

    ASSERT_EQ(host->executions.size(), 1u);
    EXPECT_EQ(host->executions[0], std::make_pair(1, 3));
    EXPECT_EQ(text.rfind("Successfully inserted 2 new cells at position 1.\n\n# Cell Execution Results", 0), 0u);
    EXPECT_NE(text.find("Executed 1 code cells in range 1-2."), std::string::npos);
}

TEST_F(NotebookServiceTest, InsertLanguageFallsBackToFirstCodeCell) {
    host->addMarkdown("intro");
    host->addCode("val x = 1", "scala");
    auto svc = makeService();

    svc.insertCells({codeSpec("x + 1")}, std::nullopt, true);
    EXPECT_EQ(host->cells.back().languageId, "scala");
}

TEST_F(NotebookServiceTest, InsertDefaultsToPythonInEmptyNotebook) {
    auto svc = makeService();
    svc.insertCells({codeSpec("1 + 1")}, std::nullopt, true);
    ASSERT_EQ(host->cells.size(), 1u);
    EXPECT_EQ(host->cells[0].languageId, NotebookService::kDefaultLanguage);
}

TEST_F(NotebookServiceTest, EmptyInsertIsValidationError) {
    auto svc = makeService();
    try {
        svc.insertCells({}, std::nullopt, true);
        FAIL() << "expected VALIDATION_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_ERROR);
    }
}

TEST_F(NotebookServiceTest, ReplaceInheritsLanguageOfReplacedCell) {
    host->addCode("library(x)", "r");
    host->addCode("old", "julia");
    auto svc = makeService();

    CellSpec spec;
    spec.content = "new";
    spec.cellType = "code";
    std::string text = svc.replaceCells(1, 2, {spec}, true);

    EXPECT_EQ(text, "Successfully replaced 1 cells with 1 new cells.");
    EXPECT_EQ(host->cells[1].languageId, "julia");
    EXPECT_EQ(host->cells[1].content, "new");
}

TEST_F(NotebookServiceTest, ReplaceWithoutKindKeepsPeerKindAndMetadata) {
    host->addMarkdown("old text");
    host->cells[0].metadata = {{"tags", {"keep"}}};
    auto svc = makeService();

    CellSpec spec;
    spec.content = "new text";
    svc.replaceCells(0, 1, {spec}, true);

    EXPECT_EQ(host->cells[0].kind, CellKind::Markup);
    EXPECT_EQ(host->cells[0].metadata["tags"][0], "keep");
}

TEST_F(NotebookServiceTest, ExtraReplacementCellsUseFirstCodeLanguage) {
    std::vector<Cell> replaced(2);
    replaced[0].kind = CellKind::Markup;
    replaced[0].languageId = "markdown";
    replaced[1].kind = CellKind::Code;
    replaced[1].languageId = "typescript";

    auto data = NotebookService::reconcileReplacement(
        {markdownSpec("m"), codeSpec("a"), codeSpec("b")}, replaced);

    ASSERT_EQ(data.size(), 3u);
    EXPECT_EQ(data[1].languageId, "typescript");  // positional peer
    EXPECT_EQ(data[2].languageId, "typescript");  // first code cell being replaced
}

TEST_F(NotebookServiceTest, MarkdownCellRejectsForeignLanguage) {
    host->addMarkdown("x");
    auto svc = makeService();

    CellSpec spec = markdownSpec("y");
    spec.languageId = "python";
    try {
        svc.replaceCells(0, 1, {spec}, true);
        FAIL() << "expected VALIDATION_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_ERROR);
    }
    EXPECT_TRUE(host->edits.empty());
}

TEST_F(NotebookServiceTest, EmptyRangeIsRejectedRegardlessOfCount) {
    for (int n : {0, 1, 3, 10}) {
        host->cells.clear();
        for (int i = 0; i < n; ++i) host->addCode("c" + std::to_string(i));
        auto svc = makeService();
        expectOutOfBounds([&] { svc.executeCells(2, 2); }, n);
        expectOutOfBounds([&] { svc.deleteCells(2, 2); }, n);
    }
    EXPECT_TRUE(host->edits.empty());
    EXPECT_TRUE(host->executions.empty());
}

TEST_F(NotebookServiceTest, RangeChecksUseLiveCount) {
    for (int i = 0; i < 5; ++i) host->addCode("c" + std::to_string(i));
    auto svc = makeService();

    expectOutOfBounds([&] { svc.deleteCells(-1, 2); }, 5);
    expectOutOfBounds([&] { svc.deleteCells(5, 6); }, 5);
    expectOutOfBounds([&] { svc.deleteCells(3, 2); }, 5);
    expectOutOfBounds([&] { svc.deleteCells(0, 6); }, 5);

    EXPECT_EQ(svc.deleteCells(0, 3), "Successfully deleted 3 cells from index 0 to 2.");
    // the count shrank to 2; the same range is no longer valid
    expectOutOfBounds([&] { svc.deleteCells(0, 3); }, 2);
    EXPECT_EQ(svc.deleteCells(1, 2), "Successfully deleted 1 cell from index 1 to 1.");
}

TEST_F(NotebookServiceTest, ModifyChecksIndexAndKeepsLanguage) {
    host->addCode("old", "javascript");
    auto svc = makeService();

    expectOutOfBounds([&] { svc.modifyCellContent(1, "x", true); }, 1);
    EXPECT_EQ(svc.modifyCellContent(0, "console.log(1)", true),
              "Successfully modified cell at index 0 with new content.");
    EXPECT_EQ(host->cells[0].languageId, "javascript");
    EXPECT_EQ(host->cells[0].content, "console.log(1)");
}

TEST_F(NotebookServiceTest, GetCellsIsIdempotent) {
    host->addMarkdown("# Title");
    host->addCode("print(1)", "python", 4);
    auto svc = makeService();

    EXPECT_EQ(svc.getCells(), svc.getCells());
}

TEST_F(NotebookServiceTest, GetCellsOnEmptyNotebook) {
    auto svc = makeService();
    EXPECT_EQ(svc.getCells(), "# Notebook Analysis\n\nThe notebook is empty - it contains no cells.");
}

TEST_F(NotebookServiceTest, NoActiveNotebook) {
    host->active = false;
    auto svc = makeService();

    EXPECT_EQ(svc.getNotebookInfo(), "# Notebook Information\n\nNo active notebook found.");
    try {
        svc.getCells();
        FAIL() << "expected NO_ACTIVE_NOTEBOOK";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_ACTIVE_NOTEBOOK);
        EXPECT_EQ(e.context().at("operation"), "get_notebook_cells");
    }
}

TEST_F(NotebookServiceTest, NotebookInfoStatistics) {
    host->info.kernelSpec = KernelSpec{"python3", "Python 3", "python"};
    host->addMarkdown("m");
    host->addCode("a", "python", 1);
    host->addCode("b", "sql");
    host->addCode("c", "python");
    auto svc = makeService();

    std::string info = svc.getNotebookInfo();
    EXPECT_NE(info.find("- **URI**: file:///work/analysis.ipynb"), std::string::npos);
    EXPECT_NE(info.find("- **Kernel**: Python 3 (python3)"), std::string::npos);
    EXPECT_NE(info.find("- **Total Cells**: 4"), std::string::npos);
    EXPECT_NE(info.find("- **Code Cells**: 3"), std::string::npos);
    EXPECT_NE(info.find("- **Executed Code Cells**: 1"), std::string::npos);
    auto py = info.find("- **python**: 2 cells");
    auto sql = info.find("- **sql**: 1 cells");
    ASSERT_NE(py, std::string::npos);
    ASSERT_NE(sql, std::string::npos);
    EXPECT_LT(py, sql);
}

TEST_F(NotebookServiceTest, SaveRestartInterrupt) {
    auto svc = makeService();
    EXPECT_EQ(svc.saveNotebook(), "Successfully saved notebook: file:///work/analysis.ipynb");
    EXPECT_EQ(svc.restartKernel(), "Kernel restarted for notebook: file:///work/analysis.ipynb");
    EXPECT_EQ(svc.interruptKernel(), "Kernel interrupted for notebook: file:///work/analysis.ipynb");
    EXPECT_EQ(host->saved.size(), 1u);
    EXPECT_EQ(host->restarts, 1);
    EXPECT_EQ(host->interrupts, 1);
}

TEST_F(NotebookServiceTest, OpenResolvesRelativePathAgainstSingleRoot) {
    NotebookService::Settings settings;
    settings.workspaceRoots = {"/home/me/project"};
    auto svc = makeService(settings);

    auto result = nlohmann::json::parse(svc.openNotebook("notebooks/../eda.ipynb"));
    EXPECT_EQ(result["status"], "success");
    ASSERT_EQ(host->opened.size(), 1u);
    EXPECT_EQ(host->opened[0], "file:///home/me/project/eda.ipynb");
    EXPECT_EQ(result["notebook"]["uri"], "file:///home/me/project/eda.ipynb");
}

TEST_F(NotebookServiceTest, OpenRelativePathNeedsExactlyOneRoot) {
    auto none = makeService();
    EXPECT_THROW(none.openNotebook("a.ipynb"), GatewayError);

    NotebookService::Settings settings;
    settings.workspaceRoots = {"/a", "/b"};
    auto many = makeService(settings);
    try {
        many.openNotebook("a.ipynb");
        FAIL() << "expected VALIDATION_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_ERROR);
        EXPECT_NE(std::string(e.what()).find("Multiple workspace folders"), std::string::npos);
    }

    EXPECT_EQ(none.resolveNotebookUri("/abs/x.ipynb"), "file:///abs/x.ipynb");
}
