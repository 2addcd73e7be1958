#include "tools/DiagnosticsTool.hpp"
#include "tools/DocumentSymbolsTool.hpp"
#include "tools/FindReferencesTool.hpp"
#include "tools/GotoDefinitionTool.hpp"
#include "tools/HoverTool.hpp"
#include "tools/PoolStatusTool.hpp"
#include "tools/ToolSupport.hpp"
#include "tools/WorkspaceSymbolsTool.hpp"
#include "lsp/ProjectLocator.hpp"
#include "lsp/Uri.hpp"
#include "lsp/FakeLanguageServer.hpp"
#include <gtest/gtest.h>
#include <filesystem>

using namespace ada_mcp;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Determine fixtures path relative to this source file
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fs::path fixtures_dir = test_dir / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir / "hello")) << "Fixtures directory not found: " << fixtures_dir;

        // Work on a copy so tests may touch files
        work_dir_ = fs::temp_directory_path() /
                    (std::string("tools_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
        fs::copy(fixtures_dir / "hello", work_dir_ / "hello", fs::copy_options::recursive);

        project_ = fs::path(ProjectLocator::normalize_root(work_dir_ / "hello"));
        spec_file_ = project_ / "src" / "greetings.ads";
        body_file_ = project_ / "src" / "greetings.adb";
        main_file_ = project_ / "src" / "main.adb";
    }

    void TearDown() override {
        broker.reset();
        launcher.reset();
        fs::remove_all(work_dir_);
    }

    // Every launched server answers `method` with `result`
    void answer(const std::string& method, const json& result) {
        answers_[method] = result;
    }

    void start_broker() {
        auto answers = answers_;
        auto extra = extra_;
        launcher = std::make_shared<FakeLauncher>([answers, extra](FakeLanguageServer& server, std::size_t index) {
            for (const auto& [method, result] : answers) {
                server.on(method, [result](FakeLanguageServer& s, const json& request) {
                    s.reply(request["id"], result);
                });
            }
            if (extra) {
                extra(server, index);
            }
        });

        InstanceConfig instance_config;
        instance_config.executable = "fake_als";
        instance_config.startup_timeout = 2s;
        instance_config.shutdown_grace = 500ms;
        instance_config.probe_interval = 0ms;

        PoolConfig pool_config;
        pool_config.max_instances = 2;
        pool_config.acquire_timeout = 2s;
        pool_config.idle_timeout = 0ms;

        BrokerConfig broker_config;
        broker_config.request_timeout = 2s;

        auto pool = std::make_shared<InstancePool>(pool_config, instance_config, launcher);
        broker = std::make_shared<Broker>(broker_config, pool, std::make_shared<ResponseCache>());
    }

    json last_request(const std::string& method) {
        auto request = launcher->latest()->wait_for(method);
        return request ? (*request)["params"] : json();
    }

    static json location(const fs::path& file, int line, int character) {
        return {
            {"uri", file_to_uri(file)},
            {"range", {
                {"start", {{"line", line}, {"character", character}}},
                {"end", {{"line", line}, {"character", character + 5}}}
            }}
        };
    }

    fs::path work_dir_;
    fs::path project_;
    fs::path spec_file_;
    fs::path body_file_;
    fs::path main_file_;
    std::map<std::string, json> answers_;
    FakeLauncher::Configure extra_;

    std::shared_ptr<FakeLauncher> launcher;
    std::shared_ptr<Broker> broker;
};

TEST_F(ToolsTest, ToolInfoNamesAndSchemas) {
    EXPECT_EQ(GotoDefinitionTool::get_info().name, "ada_goto_definition");
    EXPECT_EQ(FindReferencesTool::get_info().name, "ada_find_references");
    EXPECT_EQ(HoverTool::get_info().name, "ada_hover");
    EXPECT_EQ(DocumentSymbolsTool::get_info().name, "ada_document_symbols");
    EXPECT_EQ(WorkspaceSymbolsTool::get_info().name, "ada_workspace_symbols");
    EXPECT_EQ(DiagnosticsTool::get_info().name, "ada_diagnostics");
    EXPECT_EQ(PoolStatusTool::get_info().name, "ada_pool_status");

    json schema = GotoDefinitionTool::get_info().input_schema;
    EXPECT_EQ(schema["required"], json::array({"file", "line", "column"}));
    EXPECT_EQ(schema["properties"]["line"]["minimum"], 1);
    EXPECT_EQ(WorkspaceSymbolsTool::get_info().input_schema["required"], json::array({"query"}));
}

TEST_F(ToolsTest, GotoDefinition_ConvertsPositions) {
    answer("textDocument/definition", json::array({location(spec_file_, 8, 13)}));
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 6}, {"column", 14}});

    EXPECT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["found"], true);
    EXPECT_EQ(result["file"], spec_file_.string());
    EXPECT_EQ(result["line"], 9);
    EXPECT_EQ(result["column"], 14);
    EXPECT_EQ(result["preview"], "   procedure Say_Hello (Name : String := Default_Name);");

    json params = last_request("textDocument/definition");
    EXPECT_EQ(params["textDocument"]["uri"], file_to_uri(main_file_));
    EXPECT_EQ(params["position"]["line"], 5);
    EXPECT_EQ(params["position"]["character"], 13);
}

TEST_F(ToolsTest, GotoDefinition_LocationLink) {
    answer("textDocument/definition", json::array({{
        {"targetUri", file_to_uri(spec_file_)},
        {"targetRange", {{"start", {{"line", 6}, {"character", 3}}}, {"end", {{"line", 6}, {"character", 40}}}}},
        {"targetSelectionRange", {{"start", {{"line", 6}, {"character", 12}}}, {"end", {{"line", 6}, {"character", 25}}}}}
    }}));
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", body_file_.string()}, {"line", 1}, {"column", 14}});

    EXPECT_EQ(result["found"], true);
    EXPECT_EQ(result["line"], 7);
    EXPECT_EQ(result["column"], 13);
}

TEST_F(ToolsTest, GotoDefinition_NotFound) {
    answer("textDocument/definition", nullptr);
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 1}, {"column", 1}});

    EXPECT_FALSE(result.contains("error"));
    EXPECT_EQ(result["found"], false);
}

TEST_F(ToolsTest, GotoDefinition_EmptyArrayNotFound) {
    answer("textDocument/definition", json::array());
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 1}, {"column", 1}});

    EXPECT_EQ(result["found"], false);
}

TEST_F(ToolsTest, GotoDefinition_MissingParameter) {
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 3}});

    EXPECT_TRUE(result.contains("error"));
    EXPECT_NE(result["error"].get<std::string>().find("column"), std::string::npos);
    EXPECT_EQ(launcher->launch_count(), 0u);
}

TEST_F(ToolsTest, GotoDefinition_ZeroLineRejected) {
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 0}, {"column", 1}});

    EXPECT_TRUE(result.contains("error"));
    EXPECT_NE(result["error"].get<std::string>().find("1-based"), std::string::npos);
}

TEST_F(ToolsTest, GotoDefinition_ServerErrorReported) {
    extra_ = [](FakeLanguageServer& server, std::size_t) {
        server.on("textDocument/definition", [](FakeLanguageServer& s, const json& request) {
            s.reply_error(request["id"], -32001, "Unit not found", {{"unit", "Greetings"}});
        });
    };
    start_broker();
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 6}, {"column", 14}});

    EXPECT_EQ(result["error"], "Unit not found");
    EXPECT_EQ(result["kind"], "protocol");
    EXPECT_EQ(result["code"], -32001);
    EXPECT_EQ(result["data"]["unit"], "Greetings");
}

TEST_F(ToolsTest, GotoDefinition_StartupFailureReported) {
    start_broker();
    launcher->fail_launches(1);
    GotoDefinitionTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 6}, {"column", 14}});

    EXPECT_EQ(result["kind"], "startup");
}

TEST_F(ToolsTest, RepeatedQueryServedFromCache) {
    answer("textDocument/definition", json::array({location(spec_file_, 8, 13)}));
    start_broker();
    GotoDefinitionTool tool(broker);
    json args = {{"file", main_file_.string()}, {"line", 6}, {"column", 14}};

    json first = tool.execute(args);
    json second = tool.execute(args);

    EXPECT_EQ(first, second);
    EXPECT_EQ(launcher->latest()->count("textDocument/definition"), 1u);
}

TEST_F(ToolsTest, FindReferences_ListsLocations) {
    answer("textDocument/references", json::array({
        location(spec_file_, 8, 13),
        location(main_file_, 5, 13),
        location(main_file_, 6, 13)
    }));
    start_broker();
    FindReferencesTool tool(broker);

    json result = tool.execute({
        {"file", spec_file_.string()}, {"line", 9}, {"column", 14}, {"include_declaration", false}
    });

    EXPECT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["count"], 3);
    ASSERT_EQ(result["references"].size(), 3u);
    EXPECT_EQ(result["references"][1]["file"], main_file_.string());
    EXPECT_EQ(result["references"][1]["line"], 6);
    EXPECT_EQ(result["references"][1]["preview"], "   Greetings.Say_Hello;");

    json params = last_request("textDocument/references");
    EXPECT_EQ(params["context"]["includeDeclaration"], false);
    EXPECT_EQ(params["position"]["line"], 8);
}

TEST_F(ToolsTest, FindReferences_IncludesDeclarationByDefault) {
    answer("textDocument/references", json::array());
    start_broker();
    FindReferencesTool tool(broker);

    json result = tool.execute({{"file", spec_file_.string()}, {"line", 9}, {"column", 14}});

    EXPECT_EQ(result["count"], 0);
    EXPECT_EQ(last_request("textDocument/references")["context"]["includeDeclaration"], true);
}

TEST_F(ToolsTest, Hover_MarkupContent) {
    answer("textDocument/hover", {{"contents", {{"kind", "markdown"}, {"value", "```ada\nCount : Integer\n```"}}}});
    start_broker();
    HoverTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 4}, {"column", 4}});

    EXPECT_EQ(result["found"], true);
    EXPECT_EQ(result["contents"], "```ada\nCount : Integer\n```");
}

TEST_F(ToolsTest, Hover_MarkedStringArray) {
    answer("textDocument/hover", {{"contents", json::array({
        {{"language", "ada"}, {"value", "procedure Say_Hello (Name : String := Default_Name)"}},
        "Print a greeting"
    })}});
    start_broker();
    HoverTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 6}, {"column", 14}});

    EXPECT_EQ(result["contents"], "procedure Say_Hello (Name : String := Default_Name)\nPrint a greeting");
}

TEST_F(ToolsTest, Hover_NothingFound) {
    answer("textDocument/hover", nullptr);
    start_broker();
    HoverTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}, {"line", 2}, {"column", 1}});

    EXPECT_EQ(result["found"], false);
}

TEST_F(ToolsTest, DocumentSymbols_Hierarchical) {
    json range = {{"start", {{"line", 0}, {"character", 0}}}, {"end", {{"line", 10}, {"character", 13}}}};
    json say_hello = {{"start", {{"line", 8}, {"character", 3}}}, {"end", {{"line", 8}, {"character", 55}}}};
    answer("textDocument/documentSymbol", json::array({{
        {"name", "Greetings"},
        {"kind", 4},
        {"range", range},
        {"selectionRange", {{"start", {{"line", 0}, {"character", 8}}}, {"end", {{"line", 0}, {"character", 17}}}}},
        {"children", json::array({{
            {"name", "Say_Hello"},
            {"kind", 12},
            {"detail", "(Name : String := Default_Name)"},
            {"range", say_hello},
            {"selectionRange", say_hello}
        }})}
    }}));
    start_broker();
    DocumentSymbolsTool tool(broker);

    json result = tool.execute({{"file", spec_file_.string()}});

    ASSERT_EQ(result["symbols"].size(), 1u) << result.dump();
    json package = result["symbols"][0];
    EXPECT_EQ(package["name"], "Greetings");
    EXPECT_EQ(package["kind"], "package");
    EXPECT_EQ(package["line"], 1);
    EXPECT_EQ(package["column"], 9);
    EXPECT_EQ(package["range"]["end"], 11);
    ASSERT_EQ(package["children"].size(), 1u);
    EXPECT_EQ(package["children"][0]["kind"], "function");
    EXPECT_EQ(package["children"][0]["detail"], "(Name : String := Default_Name)");
    EXPECT_EQ(package["children"][0]["line"], 9);
}

TEST_F(ToolsTest, DocumentSymbols_Flat) {
    answer("textDocument/documentSymbol", json::array({
        {{"name", "Main"}, {"kind", 12}, {"location", location(main_file_, 2, 10)}},
        {{"name", "Count"}, {"kind", 13}, {"location", location(main_file_, 3, 3)}, {"containerName", "Main"}}
    }));
    start_broker();
    DocumentSymbolsTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}});

    ASSERT_EQ(result["symbols"].size(), 2u);
    EXPECT_EQ(result["symbols"][1]["name"], "Count");
    EXPECT_EQ(result["symbols"][1]["kind"], "variable");
    EXPECT_EQ(result["symbols"][1]["line"], 4);
    EXPECT_EQ(result["symbols"][1]["containerName"], "Main");
    EXPECT_EQ(result["symbols"][1]["file"], main_file_.string());
}

TEST_F(ToolsTest, DocumentSymbols_MissingFile) {
    start_broker();
    DocumentSymbolsTool tool(broker);

    json result = tool.execute(json::object());

    EXPECT_TRUE(result.contains("error"));
}

class WorkspaceSymbolsToolTest : public ToolsTest {
protected:
    void SetUp() override {
        ToolsTest::SetUp();
        answer("workspace/symbol", json::array({
            {{"name", "Greetings"}, {"kind", 4}, {"location", location(spec_file_, 0, 8)}},
            {{"name", "Greeting_Kind"}, {"kind", 10}, {"location", location(spec_file_, 2, 8)},
             {"containerName", "Greetings"}},
            {{"name", "Make_Greeting"}, {"kind", 12}, {"location", location(spec_file_, 6, 12)},
             {"containerName", "Greetings"}},
            {{"name", "Say_Hello"}, {"kind", 12}, {"location", location(spec_file_, 8, 13)},
             {"containerName", "Greetings"}},
            {{"name", "Default_Name"}, {"kind", 14}, {"location", location(spec_file_, 4, 3)},
             {"containerName", "Greetings"}}
        }));
        start_broker();
    }
};

TEST_F(WorkspaceSymbolsToolTest, AllKinds) {
    WorkspaceSymbolsTool tool(broker);

    json result = tool.execute({{"query", "Gree"}, {"project", project_.string()}});

    EXPECT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["count"], 5);
    EXPECT_EQ(result["truncated"], false);
    EXPECT_EQ(result["symbols"][0]["kind"], "package");
    EXPECT_EQ(result["symbols"][0]["line"], 1);
    EXPECT_EQ(result["symbols"][0]["column"], 9);
    EXPECT_EQ(last_request("workspace/symbol")["query"], "Gree");
}

TEST_F(WorkspaceSymbolsToolTest, KindFilter) {
    WorkspaceSymbolsTool tool(broker);

    json functions = tool.execute({{"query", ""}, {"kind", "function"}, {"project", project_.string()}});
    EXPECT_EQ(functions["count"], 2);

    json types = tool.execute({{"query", ""}, {"kind", "type"}, {"project", project_.string()}});
    ASSERT_EQ(types["count"], 1);
    EXPECT_EQ(types["symbols"][0]["name"], "Greeting_Kind");

    json constants = tool.execute({{"query", ""}, {"kind", "Constant"}, {"project", project_.string()}});
    ASSERT_EQ(constants["count"], 1);
    EXPECT_EQ(constants["symbols"][0]["name"], "Default_Name");
}

TEST_F(WorkspaceSymbolsToolTest, LimitTruncates) {
    WorkspaceSymbolsTool tool(broker);

    json result = tool.execute({{"query", "G"}, {"limit", 2}, {"project", project_.string()}});

    EXPECT_EQ(result["count"], 2);
    EXPECT_EQ(result["truncated"], true);
}

TEST_F(WorkspaceSymbolsToolTest, ProjectPathInsideTreeFindsRoot) {
    WorkspaceSymbolsTool tool(broker);

    tool.execute({{"query", "Say"}, {"project", (project_ / "src").string()}});

    EXPECT_TRUE(broker->pool().contains(project_));
}

TEST_F(WorkspaceSymbolsToolTest, InvalidArguments) {
    WorkspaceSymbolsTool tool(broker);

    EXPECT_TRUE(tool.execute({{"kind", "all"}}).contains("error"));
    EXPECT_TRUE(tool.execute({{"query", "x"}, {"kind", "record"}}).contains("error"));
    EXPECT_TRUE(tool.execute({{"query", "x"}, {"limit", 0}}).contains("error"));
    EXPECT_EQ(launcher->launch_count(), 0u);
}

class DiagnosticsToolTest : public ToolsTest {
protected:
    void SetUp() override {
        ToolsTest::SetUp();
        start_broker();

        broker->open_document(main_file_);
        broker->open_document(body_file_);
        publish(main_file_, {
            diagnostic(3, 4, 2, "\"Count\" is assigned but never read"),
            diagnostic(8, 4, 1, "missing \";\"")
        });
        publish(body_file_, {
            diagnostic(5, 0, 3, "use a short-circuit form"),
            diagnostic(6, 0, 4, "consider expression function")
        });
    }

    static json diagnostic(int line, int character, int severity, const std::string& message) {
        return {
            {"range", {
                {"start", {{"line", line}, {"character", character}}},
                {"end", {{"line", line}, {"character", character + 5}}}
            }},
            {"severity", severity},
            {"message", message},
            {"source", "gnat"}
        };
    }

    void publish(const fs::path& file, const json& items) {
        std::string uri = file_to_uri(file);
        launcher->latest()->notify("textDocument/publishDiagnostics", {{"uri", uri}, {"diagnostics", items}});
        ASSERT_TRUE(eventually([&] {
            return broker->diagnostics(project_, uri)[uri].size() == items.size();
        }));
    }
};

TEST_F(DiagnosticsToolTest, WholeProject) {
    DiagnosticsTool tool(broker);

    json result = tool.execute({{"project", project_.string()}});

    EXPECT_FALSE(result.contains("error")) << result.dump();
    EXPECT_EQ(result["totalCount"], 4);
    EXPECT_EQ(result["errorCount"], 1);
    EXPECT_EQ(result["warningCount"], 1);
    EXPECT_EQ(result["hintCount"], 2);
}

TEST_F(DiagnosticsToolTest, OneFileWithOneBasedPositions) {
    DiagnosticsTool tool(broker);

    json result = tool.execute({{"file", main_file_.string()}});

    ASSERT_EQ(result["totalCount"], 2);
    json first = result["diagnostics"][0];
    EXPECT_EQ(first["file"], main_file_.string());
    EXPECT_EQ(first["line"], 4);
    EXPECT_EQ(first["column"], 5);
    EXPECT_EQ(first["endColumn"], 10);
    EXPECT_EQ(first["severity"], "warning");
    EXPECT_EQ(first["source"], "gnat");
}

TEST_F(DiagnosticsToolTest, SeverityFilter) {
    DiagnosticsTool tool(broker);

    json errors = tool.execute({{"project", project_.string()}, {"severity", "error"}});
    ASSERT_EQ(errors["totalCount"], 1);
    EXPECT_EQ(errors["diagnostics"][0]["message"], "missing \";\"");

    json hints = tool.execute({{"project", project_.string()}, {"severity", "hint"}});
    EXPECT_EQ(hints["totalCount"], 2);
}

TEST_F(DiagnosticsToolTest, UnknownSeverityRejected) {
    DiagnosticsTool tool(broker);

    json result = tool.execute({{"severity", "fatal"}});

    EXPECT_TRUE(result.contains("error"));
}

TEST_F(ToolsTest, PoolStatus_ReportsInstancesAndCache) {
    answer("textDocument/hover", nullptr);
    start_broker();
    HoverTool hover(broker);
    PoolStatusTool status(broker);

    EXPECT_EQ(status.execute(json::object())["active_instances"], 0);

    hover.execute({{"file", main_file_.string()}, {"line", 1}, {"column", 1}});
    json result = status.execute(json::object());

    EXPECT_EQ(result["active_instances"], 1);
    EXPECT_EQ(result["max_instances"], 2);
    ASSERT_EQ(result["projects"].size(), 1u);
    EXPECT_EQ(result["projects"][0]["project"], project_.string());
    EXPECT_EQ(result["projects"][0]["state"], "ready");
    EXPECT_TRUE(result.contains("cache"));
}

TEST(ToolSupportTest, SymbolKindNames) {
    EXPECT_EQ(tool_support::symbol_kind_name(1), "file");
    EXPECT_EQ(tool_support::symbol_kind_name(4), "package");
    EXPECT_EQ(tool_support::symbol_kind_name(26), "typeParameter");
    EXPECT_EQ(tool_support::symbol_kind_name(0), "unknown(0)");
    EXPECT_EQ(tool_support::symbol_kind_name(27), "unknown(27)");
}

TEST(ToolSupportTest, TextDocumentPositionIsZeroBased) {
    json params = tool_support::text_document_position("/tmp/a.adb", 1, 1);

    EXPECT_EQ(params["textDocument"]["uri"], "file:///tmp/a.adb");
    EXPECT_EQ(params["position"]["line"], 0);
    EXPECT_EQ(params["position"]["character"], 0);
}

TEST(ToolSupportTest, ErrorResultCarriesKind) {
    json plain = tool_support::error_result(std::invalid_argument("bad"));
    EXPECT_EQ(plain["error"], "bad");
    EXPECT_FALSE(plain.contains("kind"));

    json timeout = tool_support::error_result(LspError(ErrorKind::Timeout, "slow"));
    EXPECT_EQ(timeout["kind"], "timeout");
}
