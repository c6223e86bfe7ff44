#include <pdfslice/assert_test.h>

#include "test_pdf.hh"

#include <pdfslice/PDFSliceServer.hh>
#include <pdfslice/PDFSliceTool.hh>
#include <pdfslice/Util.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace pdfslice;

static JSON
member(JSON const& j, std::string const& key)
{
    auto value = JSON::makeNull();
    bool found = util::get_member(j, key, value);
    if (!found) {
        std::cout << "missing " << key << " in " << j.unparse() << std::endl;
    }
    assert(found);
    return value;
}

static std::string
string_member(JSON const& j, std::string const& key)
{
    std::string s;
    bool ok = member(j, key).getString(s);
    assert(ok);
    return s;
}

static std::string
number_member(JSON const& j, std::string const& key)
{
    std::string s;
    bool ok = member(j, key).getNumber(s);
    assert(ok);
    return s;
}

static bool
has_member(JSON const& j, std::string const& key)
{
    auto value = JSON::makeNull();
    return util::get_member(j, key, value);
}

static JSON
response(PDFSliceServer& server, std::string const& message)
{
    auto r = server.handleMessage(message);
    std::cout << r << std::endl;
    assert(!r.empty());
    assert(r.find('\n') == std::string::npos);
    auto j = JSON::parse(r);
    assert(string_member(j, "jsonrpc") == "2.0");
    return j;
}

static std::string
error_code(JSON const& j)
{
    assert(!has_member(j, "result"));
    return number_member(member(j, "error"), "code");
}

static void
make_server(PDFSliceServer& server, PDFSliceTool& tool)
{
    auto log = QPDFLogger::create();
    log->setInfo(log->discard());
    log->setError(log->discard());
    server.setLogger(log);
    tool.setLogger(log);
    server.registerTool(
        PDFSliceTool::toolName(),
        PDFSliceTool::toolDescription(),
        PDFSliceTool::inputSchema(),
        [&tool](JSON const& arguments) { return tool.runJSON(arguments); });
}

static void
test_lifecycle()
{
    PDFSliceServer server("server-test", "1.2.3");
    PDFSliceTool tool;
    make_server(server, tool);

    auto j = response(
        server,
        R"({"jsonrpc": "2.0", "id": 1, "method": "initialize", "params": {)"
        R"("protocolVersion": "2025-03-26", "capabilities": {},)"
        R"("clientInfo": {"name": "test-client", "version": "0.1"}}})");
    assert(number_member(j, "id") == "1");
    auto result = member(j, "result");
    assert(string_member(result, "protocolVersion") == "2025-03-26");
    assert(has_member(member(result, "capabilities"), "tools"));
    auto info = member(result, "serverInfo");
    assert(string_member(info, "name") == "server-test");
    assert(string_member(info, "version") == "1.2.3");

    j = response(server, R"({"jsonrpc": "2.0", "id": "init", "method": "initialize"})");
    assert(string_member(j, "id") == "init");
    assert(
        string_member(member(j, "result"), "protocolVersion") ==
        PDFSliceServer::defaultProtocolVersion());

    assert(server.handleMessage(R"({"jsonrpc": "2.0", "method": "notifications/initialized"})")
               .empty());
    assert(server.handleMessage(R"({"jsonrpc": "2.0", "method": "notifications/cancelled"})")
               .empty());
    assert(server.handleMessage("").empty());
    assert(server.handleMessage("  \t").empty());
    // Responses from the client are ignored.
    assert(server.handleMessage(R"({"jsonrpc": "2.0", "id": 7, "result": {}})").empty());

    j = response(server, R"({"jsonrpc": "2.0", "id": 2, "method": "ping"})");
    assert(member(j, "result").isDictionary());
}

static void
test_tools()
{
    PDFSliceServer server("server-test", "1.2.3");
    PDFSliceTool tool;
    make_server(server, tool);

    auto j = response(server, R"({"jsonrpc": "2.0", "id": 3, "method": "tools/list"})");
    auto tools = member(member(j, "result"), "tools");
    assert(tools.isArray());
    int n = 0;
    tools.forEachArrayItem([&n](JSON t) {
        ++n;
        assert(string_member(t, "name") == "open_and_split_pdf");
        assert(string_member(t, "description") == PDFSliceTool::toolDescription());
        auto schema = member(t, "inputSchema");
        assert(string_member(schema, "type") == "object");
        auto properties = member(schema, "properties");
        assert(has_member(properties, "file_path"));
        assert(has_member(properties, "start_page"));
        assert(has_member(properties, "end_page"));
        assert(has_member(properties, "save_output"));
    });
    assert(n == 1);

    j = response(
        server,
        R"({"jsonrpc": "2.0", "id": 4, "method": "tools/call", "params": {)"
        R"("name": "open_and_split_pdf", "arguments": {)"
        R"("file_path": "server.pdf", "start_page": 2, "end_page": 3}}})");
    auto result = member(j, "result");
    bool is_error = true;
    assert(member(result, "isError").getBool(is_error));
    assert(!is_error);
    auto content = member(result, "content");
    std::string text;
    content.forEachArrayItem([&text](JSON item) {
        assert(string_member(item, "type") == "text");
        text = string_member(item, "text");
    });
    assert(
        text ==
        "Content from new PDF:\n\n"
        "--- Page 2 ---\nThis is page 2\n"
        "--- Page 3 ---\nThis is page 3");

    // Tool failures are results too.
    j = response(
        server,
        R"({"jsonrpc": "2.0", "id": 5, "method": "tools/call", "params": {)"
        R"("name": "open_and_split_pdf", "arguments": {"file_path": "server.pdf", )"
        R"("start_page": 1, "end_page": 10}}})");
    result = member(j, "result");
    assert(member(result, "isError").getBool(is_error));
    assert(!is_error);
    member(result, "content").forEachArrayItem(
        [&text](JSON item) { text = string_member(item, "text"); });
    assert(text.find("Error") == 0);

    // No arguments at all
    j = response(
        server,
        R"({"jsonrpc": "2.0", "id": 6, "method": "tools/call", "params": {)"
        R"("name": "open_and_split_pdf"}})");
    member(member(j, "result"), "content")
        .forEachArrayItem([&text](JSON item) { text = string_member(item, "text"); });
    assert(text == "Error: Invalid input parameters - file_path is required");

    j = response(
        server,
        R"({"jsonrpc": "2.0", "id": 7, "method": "tools/call", "params": {)"
        R"("name": "split_everything", "arguments": {}}})");
    assert(error_code(j) == "-32602");
    assert(number_member(j, "id") == "7");

    j = response(server, R"({"jsonrpc": "2.0", "id": 8, "method": "tools/call", "params": {}})");
    assert(error_code(j) == "-32602");

    bool threw = false;
    try {
        server.registerTool(
            PDFSliceTool::toolName(), "again", JSON::makeDictionary(), [](JSON const&) {
                return std::string();
            });
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << std::endl;
        threw = true;
    }
    assert(threw);

    server.registerTool("broken", "always fails", JSON::makeDictionary(), [](JSON const&) -> std::string {
        throw std::runtime_error("handler failed");
    });
    j = response(
        server, R"({"jsonrpc": "2.0", "id": 9, "method": "tools/call", "params": {"name": "broken"}})");
    assert(error_code(j) == "-32603");
}

static void
test_errors()
{
    PDFSliceServer server("server-test", "1.2.3");
    PDFSliceTool tool;
    make_server(server, tool);

    auto j = response(server, R"({"jsonrpc": "2.0", "id": 10, "method": "resources/list"})");
    assert(error_code(j) == "-32601");
    assert(number_member(j, "id") == "10");

    j = response(server, "{not json");
    assert(error_code(j) == "-32700");
    assert(member(j, "id").isNull());

    j = response(server, "[1, 2, 3]");
    assert(error_code(j) == "-32600");
    assert(member(j, "id").isNull());

    j = response(server, R"({"jsonrpc": "2.0", "id": 11})");
    assert(error_code(j) == "-32600");
    assert(number_member(j, "id") == "11");
}

static void
test_run()
{
    PDFSliceServer server("server-test", "1.2.3");
    PDFSliceTool tool;
    make_server(server, tool);

    std::istringstream in(
        R"({"jsonrpc": "2.0", "id": 1, "method": "initialize", "params": {}})"
        "\r\n"
        R"({"jsonrpc": "2.0", "method": "notifications/initialized"})"
        "\n"
        "\n"
        R"({"jsonrpc": "2.0", "id": 2, "method": "tools/call", "params": {)"
        R"("name": "open_and_split_pdf", "arguments": {"file_path": "server.pdf"}}})"
        "\n"
        R"({"jsonrpc": "2.0", "id": 3, "method": "ping"})"
        "\n");
    std::ostringstream out;
    server.run(in, out);
    std::cout << out.str();

    std::istringstream responses(out.str());
    std::string line;
    int n = 0;
    while (std::getline(responses, line)) {
        ++n;
        auto j = JSON::parse(line);
        assert(number_member(j, "id") == std::to_string(n));
        assert(has_member(j, "result"));
    }
    assert(n == 3);
    assert(out.str().find("This is page 1") != std::string::npos);
}

int
main()
{
    test_pdf_create_numbered("server.pdf", 4);
    test_lifecycle();
    test_tools();
    test_errors();
    test_run();
    std::cout << "done" << std::endl;
    return 0;
}
