/**
 * Notebook tools and ToolRegistry: declaration order, MCP-shaped schemas and
 * argument extraction.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "FakeNotebookHost.h"
#include "core/GatewayError.h"
#include "tools/NotebookTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {
std::string ExtractText(const json& result) {
    if (!result.contains("content") || !result["content"].is_array() || result["content"].empty()) return "";
    return result["content"][0].value("text", "");
}

class NotebookToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
        host = std::make_shared<FakeNotebookHost>();
        NotebookService::Settings settings;
        settings.pollInterval = 1ms;
        settings.settleDelay = 0ms;
        service = std::make_shared<NotebookService>(host, settings, clock.clock());
        registerNotebookTools(registry, service);
    }

    ManualClock clock;
    std::shared_ptr<FakeNotebookHost> host;
    std::shared_ptr<NotebookService> service;
    ToolRegistry registry;
};
} // namespace

TEST_F(NotebookToolsTest, ListedInDeclarationOrder) {
    const std::vector<std::string> expected = {
        "get_notebook_info", "get_notebook_cells", "insert_notebook_cells", "replace_notebook_cells",
        "modify_notebook_cell_content", "execute_notebook_cells", "delete_notebook_cells", "save_notebook",
        "open_notebook", "restart_kernel", "interrupt_kernel"};

    auto schemas = registry.listToolSchemas();
    ASSERT_EQ(schemas.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(schemas[i]["name"], expected[i]);
        EXPECT_FALSE(schemas[i]["description"].get<std::string>().empty());
        EXPECT_EQ(schemas[i]["inputSchema"]["type"], "object");
    }
}

TEST_F(NotebookToolsTest, ParameterlessToolsAdvertiseClosedSchema) {
    json schema = registry.getTool("save_notebook")->getSchema();
    EXPECT_TRUE(schema["properties"].empty());
    EXPECT_EQ(schema["additionalProperties"], false);
}

TEST_F(NotebookToolsTest, InsertCellsFromArguments) {
    host->addCode("a = 1", "python");
    json args = json::parse(R"json({
        "cells": [
          {"content": "# Notes", "cell_type": "markdown"},
          {"content": "print(a)", "cell_type": "code"}
        ],
        "insert_position": 0,
        "noexec": true
    })json");

    json result = registry.executeTool("insert_notebook_cells", args);
    EXPECT_EQ(ExtractText(result), "Successfully inserted 2 new cells at position 0.");
    ASSERT_EQ(host->cells.size(), 3u);
    EXPECT_EQ(host->cells[0].kind, CellKind::Markup);
    EXPECT_EQ(host->cells[1].languageId, "python");
    EXPECT_TRUE(host->executions.empty());
}

TEST_F(NotebookToolsTest, ExecuteToolRunsRange) {
    host->addCode("x = 2");
    json result = registry.executeTool("execute_notebook_cells", {{"start_index", 0}, {"stop_index", 1}});
    std::string text = ExtractText(result);
    EXPECT_NE(text.find("Executed 1 code cells in range 0-0."), std::string::npos) << text;
    EXPECT_NE(text.find("ran 0"), std::string::npos) << text;
}

TEST_F(NotebookToolsTest, ParseCellSpecsKeepsOmittedFieldsUnset) {
    auto specs = parseCellSpecs(json::parse(R"([{"content": "x"}, {"content": "y", "language_id": "r"}])"));
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_FALSE(specs[0].cellType.has_value());
    EXPECT_FALSE(specs[0].languageId.has_value());
    EXPECT_EQ(specs[1].languageId.value(), "r");
}

TEST_F(NotebookToolsTest, UnknownToolThrowsToolError) {
    try {
        registry.executeTool("format_disk", json::object());
        FAIL() << "expected MCP_TOOL_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MCP_TOOL_ERROR);
        EXPECT_STREQ(e.what(), "Unknown tool: format_disk");
    }
}

TEST_F(NotebookToolsTest, ReRegisteringKeepsPosition) {
    registry.registerTool(std::make_unique<GetNotebookInfoTool>(service));
    auto schemas = registry.listToolSchemas();
    EXPECT_EQ(registry.getToolCount(), 11u);
    EXPECT_EQ(schemas[0]["name"], "get_notebook_info");
}

TEST_F(NotebookToolsTest, IndicesBeyondIntRangeAreRejectedAsSent) {
    host->addCode("a");
    host->addCode("b");
    host->addCode("c");

    for (const std::string tool : {"delete_notebook_cells", "execute_notebook_cells"}) {
        try {
            registry.executeTool(tool, {{"start_index", 4294967296LL}, {"stop_index", 4294967297LL}});
            FAIL() << tool << " accepted a wrapped range";
        } catch (const GatewayError& e) {
            EXPECT_EQ(e.code(), ErrorCode::INDEX_OUT_OF_BOUNDS);
            EXPECT_EQ(e.context()["startIndex"], 4294967296LL);
            EXPECT_EQ(e.context()["cellCount"], 3);
        }
    }

    try {
        registry.executeTool("modify_notebook_cell_content", {{"cell_index", 4294967296LL}, {"content", "x"}});
        FAIL() << "modify accepted a wrapped index";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INDEX_OUT_OF_BOUNDS);
        EXPECT_EQ(e.context()["cellIndex"], 4294967296LL);
    }

    EXPECT_EQ(host->cells.size(), 3u);
    EXPECT_TRUE(host->edits.empty());
    EXPECT_TRUE(host->executions.empty());
}

TEST_F(NotebookToolsTest, HugeUnsignedIndexDoesNotWrapNegative) {
    host->addCode("a");
    EXPECT_THROW(registry.executeTool("delete_notebook_cells",
                                      {{"start_index", 18446744073709551615ULL}, {"stop_index", 18446744073709551615ULL}}),
                 GatewayError);
    EXPECT_EQ(host->cells.size(), 1u);
}

TEST_F(NotebookToolsTest, WideInsertPositionIsClampedToCount) {
    host->addCode("a");
    host->addCode("b");
    host->addCode("c");
    json cells = json::array({{{"content", "d"}, {"cell_type", "code"}}});

    json result = registry.executeTool("insert_notebook_cells",
                                       {{"cells", cells}, {"insert_position", 4294967297LL}, {"noexec", true}});
    EXPECT_EQ(ExtractText(result), "Successfully inserted 1 new cells at position 3.");
    EXPECT_EQ(host->cells.back().content, "d");
}

TEST_F(NotebookToolsTest, IntegralFloatInsertPositionIsHonoured) {
    host->addCode("a");
    host->addCode("b");
    json cells = json::array({{{"content", "mid"}, {"cell_type", "code"}}});

    json result = registry.executeTool("insert_notebook_cells",
                                       {{"cells", cells}, {"insert_position", 1.0}, {"noexec", true}});
    EXPECT_EQ(ExtractText(result), "Successfully inserted 1 new cells at position 1.");
    EXPECT_EQ(host->cells[1].content, "mid");
}
